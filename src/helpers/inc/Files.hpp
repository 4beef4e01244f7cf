#ifndef AWGCHECK_HELPERS_FILES_HPP
#define AWGCHECK_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Host-side file and path utilities.
 *
 * Uses C-style I/O (open/read/close) and stat()/access() syscalls. Reads are
 * capped so a misconfigured path (a device node, a huge log) cannot stall the run.
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISDIR, S_ISREG
#include <unistd.h>   // read, close, access

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace awgcheck {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Upper bound on bytes read by readFileToString().
inline constexpr std::size_t MAX_TEXT_FILE_SIZE = 1024 * 1024;

/// Chunk size for read loops.
inline constexpr std::size_t READ_CHUNK_SIZE = 4096;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read a regular text file.
 * @param path File path.
 * @param maxBytes Read at most this many bytes.
 * @return File contents, or nullopt if the file cannot be opened or read.
 */
[[nodiscard]] inline std::optional<std::string>
readFileToString(const std::string& path, std::size_t maxBytes = MAX_TEXT_FILE_SIZE) noexcept {
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return std::nullopt;
  }

  std::string out;
  std::array<char, READ_CHUNK_SIZE> chunk{};
  bool failed = false;
  while (out.size() < maxBytes) {
    const std::size_t WANT = std::min(chunk.size(), maxBytes - out.size());
    const ssize_t N = ::read(FD, chunk.data(), WANT);
    if (N < 0) {
      failed = true;
      break;
    }
    if (N == 0) {
      break;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  if (failed) {
    return std::nullopt;
  }
  return out;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path is a directory.
 * @return true if path exists and is a directory.
 */
[[nodiscard]] inline bool isDirectory(const std::string& path) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace awgcheck

#endif // AWGCHECK_HELPERS_FILES_HPP
