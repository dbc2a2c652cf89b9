#pragma once

#include <cstddef>
#include <string>

#include "blob/traversal.hpp"
#include "io/mapped_source.hpp"

namespace osmpbf_reader {

// An opened PBF file. Hands out independent traversals over one mapping.
class PbfFile {
public:
  // Throws ReaderError(FileOpen) if the file cannot be opened or mapped.
  static PbfFile open(const std::string &path);

  explicit PbfFile(pbf_io::MappedSource source);

  const std::string &path() const { return source_.path(); }
  size_t size() const { return source_.length(); }
  bool is_open() const { return source_.is_open(); }

  // New traversal positioned before the first record.
  // Throws ReaderError(UseAfterDispose) after close().
  Traversal traverse() const;

  // Traversals already handed out keep working until they are disposed.
  void close() noexcept;

private:
  pbf_io::MappedSource source_;
};

} // namespace osmpbf_reader
