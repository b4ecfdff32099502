#ifndef KINDLING_HELPERS_FILES_HPP
#define KINDLING_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File and path utilities.
 *
 * Provides a scoped temporary file used to hand generated configuration and
 * manifests to the kind and kubectl binaries, plus small path helpers.
 *
 * @note Uses C-style I/O (open/write/close) so failures surface as errno.
 */

#include <fcntl.h>    // open, O_WRONLY, O_CLOEXEC
#include <stdlib.h>   // mkstemps, getenv
#include <sys/stat.h> // stat
#include <unistd.h>   // write, close, unlink

#include <cerrno>
#include <cstring> // strerror
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kindling {
namespace helpers {
namespace files {

/* ----------------------------- Path Checks ----------------------------- */

/// True when @p path exists (file, directory or device).
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  struct stat st{};
  return path != nullptr && ::stat(path, &st) == 0;
}

/// True when @p path is a directory.
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  struct stat st{};
  return path != nullptr && ::stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

/// Value of $HOME, or empty when unset.
[[nodiscard]] inline std::string homeDirectory() {
  const char* home = ::getenv("HOME");
  return home != nullptr ? std::string(home) : std::string();
}

/* ----------------------------- Writing ----------------------------- */

/**
 * @brief Write @p content to an open descriptor, retrying short writes.
 * @return true when every byte was written.
 */
[[nodiscard]] inline bool writeAll(int fd, std::string_view content) noexcept {
  std::size_t off = 0;
  while (off < content.size()) {
    const ssize_t N = ::write(fd, content.data() + off, content.size() - off);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    off += static_cast<std::size_t>(N);
  }
  return true;
}

/* ----------------------------- TempFile ----------------------------- */

/**
 * @brief Scoped temporary file, unlinked on destruction.
 *
 * Created under $TMPDIR (or /tmp) with a caller supplied prefix and suffix,
 * e.g. "kindling-config-XXXXXX.yaml". Move-only.
 */
class TempFile {
public:
  TempFile() = default;

  /**
   * @brief Create and fill a temporary file.
   * @param prefix  File name prefix.
   * @param suffix  File name suffix including the dot, e.g. ".yaml".
   * @param content Bytes to write.
   * @param error   Set on failure.
   * @return Open TempFile, or an empty one (valid() == false) on failure.
   */
  static TempFile create(std::string_view prefix, std::string_view suffix,
                         std::string_view content, std::string& error) {
    const char* tmpdir = ::getenv("TMPDIR");
    std::string pattern = (tmpdir != nullptr && tmpdir[0] != '\0') ? tmpdir : "/tmp";
    pattern += '/';
    pattern += prefix;
    pattern += "XXXXXX";
    pattern += suffix;

    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    const int FD = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (FD < 0) {
      error = std::string("mkstemps failed: ") + std::strerror(errno);
      return TempFile();
    }

    TempFile file;
    file.path_.assign(buf.data());
    const bool WROTE = writeAll(FD, content);
    const int SAVED = errno;
    ::close(FD);
    if (!WROTE) {
      error = std::string("write failed: ") + std::strerror(SAVED);
      return TempFile();
    }
    return file;
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }

  TempFile& operator=(TempFile&& other) noexcept {
    if (this != &other) {
      remove();
      path_ = std::move(other.path_);
      other.path_.clear();
    }
    return *this;
  }

  ~TempFile() { remove(); }

  [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  void remove() noexcept {
    if (!path_.empty()) {
      ::unlink(path_.c_str());
      path_.clear();
    }
  }

  std::string path_;
};

} // namespace files
} // namespace helpers
} // namespace kindling

#endif // KINDLING_HELPERS_FILES_HPP
