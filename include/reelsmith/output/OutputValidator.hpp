// Repository: Reelsmith
// Component: Output Validator
// Purpose: Post-write sanity check on the encoded file.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_OUTPUT_OUTPUT_VALIDATOR_HPP_
#define REELSMITH_OUTPUT_OUTPUT_VALIDATOR_HPP_

#include <cstdint>
#include <string>

namespace reelsmith::output {

struct OutputCheck {
  bool ok;
  int64_t bytes;
  std::string detail;
};

// The file must exist, be a regular file, and be strictly larger than
// min_bytes. Anything smaller is treated as a broken encode.
OutputCheck ValidateOutputFile(const std::string& path, int64_t min_bytes);

// Removes `path` if present. Returns false only if it exists and could not
// be removed.
bool RemoveOutputFile(const std::string& path);

}  // namespace reelsmith::output

#endif  // REELSMITH_OUTPUT_OUTPUT_VALIDATOR_HPP_
