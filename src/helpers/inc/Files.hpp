#ifndef SWAPCHECK_HELPERS_FILES_HPP
#define SWAPCHECK_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Path checks and small file descriptor utilities.
 *
 * Path checking uses stat()/access() syscalls directly.
 */

#include <fcntl.h>    // open
#include <sys/stat.h> // stat, S_ISREG
#include <unistd.h>   // access, close

#include <utility>

namespace swapcheck {
namespace helpers {
namespace files {

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file, directory or anything else).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/**
 * @brief Check if path is a regular file (symlinks are followed).
 * @param path Path to check.
 * @return true if path exists and is a regular file.
 */
[[nodiscard]] inline bool isRegularFile(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode);
}

/**
 * @brief Check if the calling process may execute path.
 * @param path Path to check.
 * @return true if access(X_OK) succeeds.
 */
[[nodiscard]] inline bool isExecutable(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  return ::access(path, X_OK) == 0;
}

/**
 * @brief Check if the calling process may read path.
 * @param path Path to check.
 * @return true if access(R_OK) succeeds.
 */
[[nodiscard]] inline bool isReadable(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  return ::access(path, R_OK) == 0;
}

/* ----------------------------- FdGuard ----------------------------- */

/**
 * @brief Owning wrapper that closes a file descriptor on destruction.
 */
class FdGuard {
public:
  FdGuard() noexcept = default;
  explicit FdGuard(int fd) noexcept : fd_(fd) {}
  ~FdGuard() { reset(); }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  FdGuard(FdGuard&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  FdGuard& operator=(FdGuard&& other) noexcept {
    if (this != &other) {
      reset(std::exchange(other.fd_, -1));
    }
    return *this;
  }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

  /// Close the current descriptor (if any) and take ownership of fd.
  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_{-1};
};

} // namespace files
} // namespace helpers
} // namespace swapcheck

#endif // SWAPCHECK_HELPERS_FILES_HPP
