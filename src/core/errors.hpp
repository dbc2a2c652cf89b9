#pragma once

#include <stdexcept>
#include <string>

namespace osmpbf_reader {

// Failure categories raised by the reader. Every framing error is fatal to
// the traversal that hit it.
enum class ErrorKind {
  FileOpen,
  TruncatedLengthPrefix,
  HeaderTooLarge,
  TruncatedHeader,
  HeaderDecode,
  BlobTooLarge,
  TruncatedBlobPayload,
  BlobDecode,
  UnknownBlobType,
  EmptyPayload,
  UnsupportedCompression,
  UseAfterDispose
};

// Stable name for an error kind ("HeaderTooLarge", ...)
const char *error_kind_name(ErrorKind kind);

class ReaderError : public std::runtime_error {
public:
  ReaderError(ErrorKind kind, const std::string &message);

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace osmpbf_reader
