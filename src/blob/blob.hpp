#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace osmpbf_reader {

// Classification of a record by its header type string.
enum class BlobKind {
  Header,   // "OSMHeader"
  Primitive // "OSMData"
};

// Codec of the payload bytes as stored in the file.
enum class Compression { None, Zlib };

const char *blob_kind_name(BlobKind kind);
const char *compression_name(Compression compression);

// One decoded, classified record. Immutable once constructed.
class Blob {
public:
  Blob(BlobKind kind, Compression compression, std::optional<int32_t> raw_size,
       std::vector<uint8_t> payload);

  BlobKind kind() const { return kind_; }

  // Always true for accepted payloads, raw included. Kept for compatibility
  // with existing consumers; use compression() for the actual codec.
  bool is_compressed() const { return is_compressed_; }

  Compression compression() const { return compression_; }

  // Uncompressed size declared by the container, if present.
  const std::optional<int32_t> &raw_size() const { return raw_size_; }

  const std::vector<uint8_t> &payload() const { return payload_; }

private:
  BlobKind kind_;
  bool is_compressed_;
  Compression compression_;
  std::optional<int32_t> raw_size_;
  std::vector<uint8_t> payload_;
};

} // namespace osmpbf_reader
