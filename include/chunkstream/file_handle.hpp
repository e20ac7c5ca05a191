#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace cs {

// Scoped read-only POSIX descriptor. The destructor closes whatever is still open.
class FileHandle {
public:
  FileHandle() = default;
  ~FileHandle();

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;

  bool open_readonly(const std::string& path);

  // fstat size of the open descriptor.
  bool size(std::uint64_t& out);

  // pread at `offset`; returns bytes read or -1 (see last_errno()).
  long long read_at(char* dst, std::size_t n, std::uint64_t offset);

  // Explicit close that reports its outcome. The handle is released either way.
  bool close();

  // Release without reporting (used once a failure has already been reported).
  void reset() noexcept;

  bool is_open() const noexcept { return fd_ >= 0; }
  int  fd() const noexcept { return fd_; }
  int  last_errno() const noexcept { return errno_; }

private:
  int fd_{-1};
  int errno_{0};
};

}
