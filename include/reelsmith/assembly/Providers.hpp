// Repository: Reelsmith
// Component: Upstream Providers
// Purpose: Narrow interfaces to script, footage and narration services.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_ASSEMBLY_PROVIDERS_HPP_
#define REELSMITH_ASSEMBLY_PROVIDERS_HPP_

#include <string>
#include <vector>

namespace reelsmith::assembly {

struct ScriptResult {
  bool ok = false;
  std::string script;
  std::vector<std::string> keywords;
  std::string detail;
};

struct FootageResult {
  bool ok = false;
  std::vector<std::string> paths;  // Local files; may be empty
  std::string detail;
};

struct NarrationResult {
  bool ok = false;
  std::string audio_path;  // Local file
  std::string detail;
};

// Implementations may block on the network. A result with ok == false is
// retried by GenerationPipeline according to its RetryPolicy.
class IScriptProvider {
 public:
  virtual ~IScriptProvider() = default;
  virtual ScriptResult GenerateScript(const std::string& prompt) = 0;
};

class IFootageProvider {
 public:
  virtual ~IFootageProvider() = default;
  virtual FootageResult FetchClips(const std::vector<std::string>& keywords) = 0;
};

class INarrationProvider {
 public:
  virtual ~INarrationProvider() = default;
  virtual NarrationResult SynthesizeAudio(const std::string& script) = 0;
};

}  // namespace reelsmith::assembly

#endif  // REELSMITH_ASSEMBLY_PROVIDERS_HPP_
