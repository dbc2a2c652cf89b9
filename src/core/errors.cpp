#include "errors.hpp"

namespace osmpbf_reader {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FileOpen:
    return "FileOpenError";
  case ErrorKind::TruncatedLengthPrefix:
    return "TruncatedLengthPrefix";
  case ErrorKind::HeaderTooLarge:
    return "HeaderTooLarge";
  case ErrorKind::TruncatedHeader:
    return "TruncatedHeader";
  case ErrorKind::HeaderDecode:
    return "HeaderDecodeError";
  case ErrorKind::BlobTooLarge:
    return "BlobTooLarge";
  case ErrorKind::TruncatedBlobPayload:
    return "TruncatedBlobPayload";
  case ErrorKind::BlobDecode:
    return "BlobDecodeError";
  case ErrorKind::UnknownBlobType:
    return "UnknownBlobType";
  case ErrorKind::EmptyPayload:
    return "EmptyPayload";
  case ErrorKind::UnsupportedCompression:
    return "UnsupportedCompression";
  case ErrorKind::UseAfterDispose:
    return "UseAfterDispose";
  }
  return "Unknown";
}

ReaderError::ReaderError(ErrorKind kind, const std::string &message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
      kind_(kind) {}

} // namespace osmpbf_reader
