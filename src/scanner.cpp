#include "scanner.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace osmpbf_reader {

static void log_scan(const ScanOptions &options, const std::string &msg) {
  if (options.verbose) {
    std::cerr << "[scan] " << msg << "\n";
  }
}

// One pass from the traversal's current (reset) position.
static ScanSummary run_pass(Traversal &traversal, const PbfFile &file,
                            const ScanOptions &options,
                            const BlobCallback *on_blob) {
  ScanSummary summary;
  summary.file_bytes = file.size();

  size_t index = 0;
  while (!options.max_blobs || index < *options.max_blobs) {
    std::optional<Blob> blob = traversal.next();
    if (!blob) {
      break;
    }

    if (index == 0 && options.require_header_first &&
        blob->kind() != BlobKind::Header) {
      throw std::runtime_error("'" + file.path() +
                               "': first blob is not an OSMHeader blob");
    }

    if (blob->kind() == BlobKind::Header) {
      ++summary.header_blobs;
    } else {
      ++summary.primitive_blobs;
    }
    if (blob->compression() == Compression::Zlib) {
      ++summary.zlib_blobs;
    } else {
      ++summary.raw_blobs;
    }
    summary.payload_bytes += blob->payload().size();

    if (on_blob != nullptr && *on_blob) {
      (*on_blob)(index, *blob);
    }
    ++index;
  }

  return summary;
}

ScanSummary scan_file(const PbfFile &file, const ScanOptions &options,
                      const BlobCallback &on_blob) {
  if (options.passes < 1) {
    throw std::runtime_error("scan passes must be >= 1");
  }
  if (options.max_blobs && *options.max_blobs == 0) {
    throw std::runtime_error("scan max_blobs must be > 0");
  }

  Traversal traversal = file.traverse();
  log_scan(options, "scanning '" + file.path() + "' (" +
                        std::to_string(file.size()) + " bytes)");

  ScanSummary first = run_pass(traversal, file, options, &on_blob);
  first.passes = 1;
  log_scan(options, "pass 1: " + std::to_string(first.total_blobs()) +
                        " blobs, stopped at offset " +
                        std::to_string(traversal.position()));

  for (int pass = 2; pass <= options.passes; ++pass) {
    traversal.reset();
    const ScanSummary again = run_pass(traversal, file, options, nullptr);
    if (again.total_blobs() != first.total_blobs() ||
        again.payload_bytes != first.payload_bytes) {
      throw std::runtime_error(
          "'" + file.path() + "': pass " + std::to_string(pass) + " read " +
          std::to_string(again.total_blobs()) + " blobs, first pass read " +
          std::to_string(first.total_blobs()));
    }
    first.passes = pass;
    log_scan(options, "pass " + std::to_string(pass) + ": consistent");
  }

  traversal.dispose();
  return first;
}

} // namespace osmpbf_reader
