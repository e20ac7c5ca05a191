#include "chunkstream/file_handle.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace cs {

FileHandle::~FileHandle() { reset(); }

FileHandle::FileHandle(FileHandle&& other) noexcept
  : fd_(std::exchange(other.fd_, -1)), errno_(other.errno_) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if (this != &other) {
    reset();
    fd_ = std::exchange(other.fd_, -1);
    errno_ = other.errno_;
  }
  return *this;
}

bool FileHandle::open_readonly(const std::string& path) {
  reset();
  int fd;
  do { fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC); } while (fd < 0 && errno == EINTR);
  if (fd < 0) { errno_ = errno; return false; }
  fd_ = fd;
  errno_ = 0;
  return true;
}

bool FileHandle::size(std::uint64_t& out) {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) { errno_ = errno; return false; }
  out = static_cast<std::uint64_t>(st.st_size);
  return true;
}

long long FileHandle::read_at(char* dst, std::size_t n, std::uint64_t offset) {
  ssize_t got;
  do {
    got = ::pread(fd_, dst, n, static_cast<off_t>(offset));
  } while (got < 0 && errno == EINTR);
  if (got < 0) { errno_ = errno; return -1; }
  return static_cast<long long>(got);
}

bool FileHandle::close() {
  if (fd_ < 0) return true;
  const int fd = std::exchange(fd_, -1);
  // Linux releases the descriptor even when close() fails, so no second attempt.
  if (::close(fd) != 0) { errno_ = errno; return false; }
  return true;
}

void FileHandle::reset() noexcept {
  if (fd_ < 0) return;
  (void)::close(fd_);
  fd_ = -1;
}

}
