#include "floodgate/test-temp-file.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#include "floodgate/base-fd.hpp"
#include "floodgate/errno-throw.hpp"
#include "floodgate/file.hpp"

namespace floodgate::test {

ScopedTempFile::ScopedTempFile(std::string_view content, std::string_view prefix)
    : _path((std::filesystem::temp_directory_path() / prefix).string() + "XXXXXX") {
  BaseFd fd(::mkstemp(_path.data()));
  if (!fd) {
    throw_errno("mkstemp failed for {}", _path);
  }
  while (!content.empty()) {
    const auto written = ::write(fd.fd(), content.data(), content.size());
    if (written <= 0) {
      const int savedErr = errno;
      ::unlink(_path.c_str());
      errno = savedErr;
      throw_errno("Unable to write temporary file {}", _path);
    }
    content.remove_prefix(static_cast<std::size_t>(written));
  }
}

ScopedTempFile::~ScopedTempFile() { ::unlink(_path.c_str()); }

std::string ScopedTempFile::content() const {
  File file(_path);
  if (!file) {
    return {};
  }
  return file.loadAllContent();
}

}  // namespace floodgate::test
