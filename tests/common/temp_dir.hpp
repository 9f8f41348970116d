#ifndef REFINERY_TESTS_COMMON_TEMP_DIR_HPP_
#define REFINERY_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace refinery::tests::common {

// Fresh directory under the system temp root, removed on scope exit.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) {
    const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(now_ns));

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      Fail("failed to create temp dir: " + path_.string());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace refinery::tests::common

#endif // REFINERY_TESTS_COMMON_TEMP_DIR_HPP_
