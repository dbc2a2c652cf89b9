#include "mapped_source.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "io/cursor.hpp"

namespace pbf_io {

using osmpbf_reader::ErrorKind;
using osmpbf_reader::ReaderError;

namespace {

// Closes the descriptor on every exit path of open().
class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;

  int get() const { return fd_; }

private:
  int fd_;
};

std::string errno_text() { return std::strerror(errno); }

} // namespace

ByteView ByteView::subview(size_t offset, size_t count) const {
  if (offset > size_ || count > size_ - offset) {
    throw std::out_of_range("byte view window [" + std::to_string(offset) +
                            ", +" + std::to_string(count) +
                            ") exceeds view of " + std::to_string(size_) +
                            " bytes");
  }
  return ByteView(data_ + offset, count);
}

MappedRegion::~MappedRegion() {
  if (data_ != nullptr && size_ > 0) {
    ::munmap(const_cast<uint8_t *>(data_), size_);
  }
}

MappedSource::MappedSource(std::string path,
                           std::shared_ptr<const MappedRegion> region)
    : path_(std::move(path)), length_(region->size()),
      region_(std::move(region)) {}

MappedSource MappedSource::open(const std::string &path) {
  FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0) {
    throw ReaderError(ErrorKind::FileOpen,
                      "cannot open '" + path + "': " + errno_text());
  }

  struct stat st;
  if (::fstat(fd.get(), &st) != 0) {
    throw ReaderError(ErrorKind::FileOpen,
                      "cannot stat '" + path + "': " + errno_text());
  }
  if (!S_ISREG(st.st_mode)) {
    throw ReaderError(ErrorKind::FileOpen,
                      "'" + path + "' is not a regular file");
  }

  const size_t size = static_cast<size_t>(st.st_size);
  if (size == 0) {
    // mmap rejects empty lengths; an empty file is a valid empty stream.
    return MappedSource(path, std::make_shared<const MappedRegion>(nullptr, 0));
  }

  void *addr = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (addr == MAP_FAILED) {
    throw ReaderError(ErrorKind::FileOpen,
                      "cannot map '" + path + "': " + errno_text());
  }
  // Advisory only; a failure here does not affect correctness.
  (void)::madvise(addr, size, MADV_SEQUENTIAL);

  std::shared_ptr<const MappedRegion> region;
  try {
    region = std::make_shared<const MappedRegion>(
        static_cast<const uint8_t *>(addr), size);
  } catch (...) {
    ::munmap(addr, size);
    throw;
  }
  return MappedSource(path, std::move(region));
}

Cursor MappedSource::new_cursor() const {
  if (!region_) {
    throw ReaderError(ErrorKind::UseAfterDispose,
                      "source '" + path_ + "' has been closed");
  }
  return Cursor(region_);
}

void MappedSource::close() noexcept { region_.reset(); }

} // namespace pbf_io
