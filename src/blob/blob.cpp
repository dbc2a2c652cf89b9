#include "blob.hpp"

#include <utility>

namespace osmpbf_reader {

const char *blob_kind_name(BlobKind kind) {
  switch (kind) {
  case BlobKind::Header:
    return "header";
  case BlobKind::Primitive:
    return "primitive";
  }
  return "unknown";
}

const char *compression_name(Compression compression) {
  switch (compression) {
  case Compression::None:
    return "raw";
  case Compression::Zlib:
    return "zlib";
  }
  return "unknown";
}

Blob::Blob(BlobKind kind, Compression compression,
           std::optional<int32_t> raw_size, std::vector<uint8_t> payload)
    : kind_(kind), is_compressed_(true), compression_(compression),
      raw_size_(raw_size), payload_(std::move(payload)) {}

} // namespace osmpbf_reader
