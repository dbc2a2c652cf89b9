#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "io/mapped_source.hpp"

namespace pbf_io {

// Sequential read position over a mapped region.
// Invariant: 0 <= position() <= length().
class Cursor {
public:
  // Detached cursor: length 0, every read fails.
  Cursor() = default;
  explicit Cursor(std::shared_ptr<const MappedRegion> region);

  size_t position() const { return position_; }
  size_t length() const { return view_.size(); }
  size_t remaining() const { return view_.size() - position_; }
  bool at_end() const { return position_ == view_.size(); }
  bool attached() const { return region_ != nullptr; }

  // Throws std::out_of_range if position > length().
  void seek(size_t position);

  // Copies the next n bytes into dst and advances.
  // Throws std::out_of_range if fewer than n bytes remain.
  void read(uint8_t *dst, size_t n);

  // Window over the next n bytes; advances past them.
  // The view is valid while this cursor (or any other claim) holds the region.
  // Throws std::out_of_range if fewer than n bytes remain.
  ByteView take(size_t n);

  // Drops the claim on the region and detaches.
  void release() noexcept;

private:
  std::shared_ptr<const MappedRegion> region_;
  ByteView view_;
  size_t position_ = 0;
};

} // namespace pbf_io
