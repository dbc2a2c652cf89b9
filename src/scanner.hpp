#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "blob/blob.hpp"
#include "blob/pbf_file.hpp"

namespace osmpbf_reader {

struct ScanOptions {
  std::optional<size_t> max_blobs; // per pass; unset = whole file
  int passes = 1;                  // traversals over the file, via reset()
  bool require_header_first = false;
  bool verbose = false;
};

// Counts from the first pass over a file.
struct ScanSummary {
  size_t header_blobs = 0;
  size_t primitive_blobs = 0;
  size_t raw_blobs = 0;
  size_t zlib_blobs = 0;
  uint64_t payload_bytes = 0;
  uint64_t file_bytes = 0;
  int passes = 0;

  size_t total_blobs() const { return header_blobs + primitive_blobs; }
};

using BlobCallback = std::function<void(size_t index, const Blob &blob)>;

// Walks the file with a single traversal. on_blob (optional) sees every blob
// of the first pass.
// Throws ReaderError on malformed input, std::runtime_error on a policy
// violation (header-first, passes disagreeing) or invalid options.
ScanSummary scan_file(const PbfFile &file, const ScanOptions &options,
                      const BlobCallback &on_blob = nullptr);

} // namespace osmpbf_reader
