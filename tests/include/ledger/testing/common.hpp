#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace ledger::testing {

inline std::string make_temp_path(const std::string_view prefix) {
  static auto counter = uint64_t{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(++counter) + ".csv");
  return path.string();
}

inline void write_file(const std::string& path, const std::string_view body) {
  auto out = std::ofstream{path, std::ios::out | std::ios::trunc};
  out << body;
}

inline std::string read_file(const std::string& path) {
  auto in = std::ifstream{path};
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary CSV file removed when the fixture goes out of scope.
class temp_file final {
 public:
  temp_file(const std::string_view prefix, const std::string_view body)
      : path_{make_temp_path(prefix)} {
    write_file(path_, body);
  }

  temp_file(const temp_file&) = delete;
  temp_file& operator=(const temp_file&) = delete;
  temp_file(temp_file&&) = delete;
  temp_file& operator=(temp_file&&) = delete;

  ~temp_file() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace ledger::testing
