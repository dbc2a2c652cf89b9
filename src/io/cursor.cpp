#include "cursor.hpp"

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace pbf_io {

Cursor::Cursor(std::shared_ptr<const MappedRegion> region)
    : region_(std::move(region)) {
  if (region_) {
    view_ = region_->bytes();
  }
}

void Cursor::seek(size_t position) {
  if (position > view_.size()) {
    throw std::out_of_range("seek to " + std::to_string(position) +
                            " past end of " + std::to_string(view_.size()) +
                            " byte region");
  }
  position_ = position;
}

void Cursor::read(uint8_t *dst, size_t n) {
  const ByteView window = take(n);
  if (n > 0) {
    std::memcpy(dst, window.data(), n);
  }
}

ByteView Cursor::take(size_t n) {
  const ByteView window = view_.subview(position_, n);
  position_ += n;
  return window;
}

void Cursor::release() noexcept {
  region_.reset();
  view_ = ByteView();
  position_ = 0;
}

} // namespace pbf_io
