#include "floodgate/file.hpp"

#include <gtest/gtest.h>
#include <stdlib.h>
#include <unistd.h>

#include <stdexcept>
#include <string>

namespace floodgate {

namespace {

class TempFile {
 public:
  explicit TempFile(const std::string& content) {
    const int fd = ::mkstemp(_path.data());
    if (fd >= 0) {
      [[maybe_unused]] const auto written = ::write(fd, content.data(), content.size());
      ::close(fd);
    }
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  ~TempFile() { ::unlink(_path.c_str()); }

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

 private:
  std::string _path{"/tmp/floodgate-file-test-XXXXXX"};
};

}  // namespace

TEST(File, LoadsWholeContent) {
  std::string content(20000, 'a');
  content.append("<html>{{sizes}}</html>");
  TempFile tmp(content);
  File file(tmp.path());
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), content.size());
  EXPECT_EQ(file.loadAllContent(), content);
  // Reading does not depend on a file offset.
  EXPECT_EQ(file.loadAllContent(), content);
}

TEST(File, EmptyFile) {
  TempFile tmp("");
  File file(tmp.path());
  ASSERT_TRUE(file);
  EXPECT_TRUE(file.loadAllContent().empty());
}

TEST(File, MissingFile) {
  File file(std::string("/nonexistent/floodgate/index.html"));
  EXPECT_FALSE(file);
  EXPECT_THROW((void)file.loadAllContent(), std::runtime_error);
  EXPECT_THROW((void)file.size(), std::runtime_error);
}

}  // namespace floodgate
