#pragma once

#include <string>
#include <string_view>

namespace floodgate::test {

// RAII temporary file, removed at destruction.
class ScopedTempFile {
 public:
  // Creates a unique file under the temporary directory holding content.
  // Throws std::system_error if the file cannot be created or written.
  explicit ScopedTempFile(std::string_view content = {}, std::string_view prefix = "floodgate-test-");

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&&) noexcept = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(ScopedTempFile&&) noexcept = delete;

  ~ScopedTempFile();

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

  // Current content of the file, empty if it cannot be read.
  [[nodiscard]] std::string content() const;

 private:
  std::string _path;
};

}  // namespace floodgate::test
