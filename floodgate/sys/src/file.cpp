#include "floodgate/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include "floodgate/log.hpp"

namespace floodgate {

namespace {

int OpenReadOnly(const std::string& path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    return BaseFd::kClosedFd;
  }
  return fd;
}

}  // namespace

File::File(const std::string& path) : _fd(OpenReadOnly(path)) {}

std::size_t File::size() const {
  struct stat st{};
  if (_fd && ::fstat(_fd.fd(), &st) == 0) {
    return static_cast<std::uint64_t>(st.st_size);
  }
  throw std::runtime_error("File::size failed");
}

std::string File::loadAllContent() const {
  if (!_fd) {
    throw std::runtime_error("File is not opened");
  }

  std::string content;
  content.reserve(size());

  constexpr std::size_t kBufSize = 8192;
  for (std::size_t offset = 0;;) {
    const std::size_t oldSize = content.size();

    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize,
                                 [this, oldSize, offset, &lastRead](char* data, [[maybe_unused]] std::size_t newCap) {
                                   lastRead = ::pread(_fd.fd(), data + oldSize, kBufSize, static_cast<off_t>(offset));
                                   return lastRead > 0 ? oldSize + static_cast<std::size_t>(lastRead) : oldSize;
                                 });

    if (lastRead > 0) {
      offset += static_cast<std::size_t>(lastRead);
      continue;
    }
    if (lastRead == 0) {
      break;  // EOF
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("Unable to read file (fd {}): errno {}: {}", _fd.fd(), errno, std::strerror(errno));
    throw std::runtime_error("File::loadAllContent read error");
  }

  return content;
}

}  // namespace floodgate
