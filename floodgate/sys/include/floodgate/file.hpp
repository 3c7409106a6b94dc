#pragma once

#include <cstddef>
#include <string>

#include "floodgate/base-fd.hpp"

namespace floodgate {

// Read-only file, used for configuration side files (index template).
class File {
 public:
  File() noexcept = default;

  // Opens path for reading. On failure (logged), operator bool() returns false.
  explicit File(const std::string& path);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Current file size in bytes. Throws std::runtime_error if the file is not opened or cannot be stat'ed.
  [[nodiscard]] std::size_t size() const;

  // Reads the whole file from the beginning. Throws std::runtime_error on read error.
  [[nodiscard]] std::string loadAllContent() const;

 private:
  BaseFd _fd;
};

}  // namespace floodgate
