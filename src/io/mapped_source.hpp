#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pbf_io {

class Cursor;

// Non-owning, bounds-checked window over mapped bytes.
class ByteView {
public:
  ByteView() = default;
  ByteView(const uint8_t *data, size_t size) : data_(data), size_(size) {}

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  // Throws std::out_of_range if [offset, offset + count) is outside the view.
  ByteView subview(size_t offset, size_t count) const;

private:
  const uint8_t *data_ = nullptr;
  size_t size_ = 0;
};

/**
 * @brief Read-only memory mapping of a whole file.
 *
 * The region is unmapped when the last holder lets go of it. MappedSource
 * holds one claim, every Cursor created from it holds another, so a Cursor
 * stays valid even if the source is closed first.
 */
class MappedRegion {
public:
  MappedRegion(const uint8_t *data, size_t size) : data_(data), size_(size) {}
  ~MappedRegion();

  MappedRegion(const MappedRegion &) = delete;
  MappedRegion &operator=(const MappedRegion &) = delete;

  ByteView bytes() const { return ByteView(data_, size_); }
  size_t size() const { return size_; }

private:
  const uint8_t *data_;
  size_t size_;
};

class MappedSource {
public:
  MappedSource() = default;

  // Maps the file read-only.
  // Throws osmpbf_reader::ReaderError(FileOpen) if it cannot be opened or mapped.
  static MappedSource open(const std::string &path);

  MappedSource(MappedSource &&) noexcept = default;
  MappedSource &operator=(MappedSource &&) noexcept = default;

  MappedSource(const MappedSource &) = delete;
  MappedSource &operator=(const MappedSource &) = delete;

  const std::string &path() const { return path_; }
  size_t length() const { return length_; }
  bool is_open() const { return region_ != nullptr; }

  // New cursor at offset 0.
  // Throws osmpbf_reader::ReaderError(UseAfterDispose) after close().
  Cursor new_cursor() const;

  // Drops this source's claim on the mapping. Safe to call repeatedly.
  void close() noexcept;

private:
  MappedSource(std::string path, std::shared_ptr<const MappedRegion> region);

  std::string path_;
  size_t length_ = 0;
  std::shared_ptr<const MappedRegion> region_;
};

} // namespace pbf_io
