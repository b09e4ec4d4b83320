#pragma once

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <unistd.h>

namespace elm_mcp::test {

// A scratch project directory, removed on destruction. Each instance gets
// its own directory so test executables can run in parallel.
class ProjectFixture {
 public:
  ProjectFixture() : ProjectFixture("elm_mcp_test") {
  }

  explicit ProjectFixture(std::string_view prefix) {
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    static std::atomic<int> counter{0};
    root_ = base_temp /
            fmt::format("{}_{}_{}", prefix, ::getpid(), counter.fetch_add(1));
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
    root_ = std::filesystem::canonical(root_);
  }

  ~ProjectFixture() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  ProjectFixture(const ProjectFixture&) = delete;
  auto operator=(const ProjectFixture&) -> ProjectFixture& = delete;
  ProjectFixture(ProjectFixture&&) = delete;
  auto operator=(ProjectFixture&&) -> ProjectFixture& = delete;

  [[nodiscard]] auto Root() const -> const std::filesystem::path& {
    return root_;
  }

  auto WriteFile(std::string_view relative, std::string_view content) const
      -> std::filesystem::path {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
    return path;
  }

  // An executable /bin/sh script standing in for an external tool
  auto WriteScript(std::string_view relative, std::string_view body) const
      -> std::filesystem::path {
    auto path = WriteFile(relative, fmt::format("#!/bin/sh\n{}\n", body));
    std::filesystem::permissions(
        path,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
            std::filesystem::perms::group_exec,
        std::filesystem::perm_options::replace);
    return path;
  }

  [[nodiscard]] auto ReadFile(std::string_view relative) const -> std::string {
    std::ifstream file(root_ / relative, std::ios::binary);
    return {
        std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  }

 private:
  std::filesystem::path root_;
};

}  // namespace elm_mcp::test
