#pragma once
/*
 * POSIX handles
 *
 * Purpose: move-only owners for a file descriptor and a read-only mapping,
 *          so early returns in readers cannot leak either.
 */
#include <cstddef>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

class MappedRegion {
public:
  MappedRegion(int fd, size_t len) : len_(len) {
    void* p = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) addr_ = p;
  }
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion() { if (addr_) ::munmap(addr_, len_); }

  bool valid() const { return addr_ != nullptr; }
  const char* data() const { return static_cast<const char*>(addr_); }
  size_t size() const { return len_; }

private:
  void* addr_ = nullptr;
  size_t len_ = 0;
};
