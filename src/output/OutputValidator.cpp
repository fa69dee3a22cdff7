// Repository: Reelsmith
// Component: Output Validator Implementation
// Copyright (c) 2025 The Reelsmith Authors

#include "reelsmith/output/OutputValidator.hpp"

#include <filesystem>
#include <system_error>

namespace reelsmith::output {

OutputCheck ValidateOutputFile(const std::string& path, int64_t min_bytes) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return {false, 0, "output file missing"};
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return {false, 0, "cannot stat output: " + ec.message()};
  }

  const auto bytes = static_cast<int64_t>(size);
  if (bytes <= min_bytes) {
    return {false, bytes,
            "output is " + std::to_string(bytes) + " bytes, floor is " + std::to_string(min_bytes)};
  }
  return {true, bytes, ""};
}

bool RemoveOutputFile(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return !ec;
}

}  // namespace reelsmith::output
