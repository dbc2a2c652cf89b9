#include "pbf_file.hpp"

#include <utility>

#include "io/cursor.hpp"

namespace osmpbf_reader {

PbfFile PbfFile::open(const std::string &path) {
  return PbfFile(pbf_io::MappedSource::open(path));
}

PbfFile::PbfFile(pbf_io::MappedSource source) : source_(std::move(source)) {}

Traversal PbfFile::traverse() const { return Traversal(source_.new_cursor()); }

void PbfFile::close() noexcept { source_.close(); }

} // namespace osmpbf_reader
