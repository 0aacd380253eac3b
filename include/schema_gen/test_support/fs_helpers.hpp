// schema_gen/test_support/fs_helpers.hpp - Filesystem helpers for tests
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace schema_gen::test_support
{

/// Fresh directory under the system temp dir; unique per call
inline std::filesystem::path make_temp_dir(std::string_view prefix)
{
  static unsigned counter = 0;
  const auto base = std::filesystem::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::filesystem::path dir =
    base / (std::string(prefix) + "_" + std::to_string(now) + "_" + std::to_string(++counter));
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::string read_all(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool write_all(const std::filesystem::path & p, const std::string & s)
{
  std::ofstream out(p, std::ios::binary);
  if (!out.is_open()) {
    return false;
  }
  out << s;
  return static_cast<bool>(out);
}

/// Removes the directory tree when the test scope ends
class ScopedTempDir
{
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(make_temp_dir(prefix)) {}
  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir & operator=(const ScopedTempDir &) = delete;

  ~ScopedTempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  std::filesystem::path operator/(const std::string & name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

}  // namespace schema_gen::test_support
