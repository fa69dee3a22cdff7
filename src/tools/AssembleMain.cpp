// Repository: Reelsmith
// Component: Assemble CLI
// Purpose: Command-line front end over AssemblyEngine.
// Copyright (c) 2025 The Reelsmith Authors
//
// Usage:
//   reelsmith_assemble --audio <path> \
//     (--output <path> | --output-dir <dir> --request-id <id>) \
//     [--profile <file.json | inline json>] [--parallel-load] \
//     [--fallback-label <text>] [--keyword <kw> ...] [--debug] [clip ...]
//
// Exit codes: 0 success, 1 assembly failure, 2 usage error.

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "reelsmith/assembly/AssemblyEngine.hpp"
#include "reelsmith/producers/FallbackGenerator.hpp"
#include "reelsmith/runtime/OutputProfile.hpp"

using namespace reelsmith;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct Args {
  std::string audio_path;
  std::string output_path;
  std::string output_dir;
  std::string request_id;
  std::string profile;
  std::string fallback_label;
  std::vector<std::string> keywords;
  std::vector<std::string> clips;
  bool parallel_load = false;
  bool debug = false;
};

void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " --audio <path> \\\n"
            << "  (--output <path> | --output-dir <dir> --request-id <id>) \\\n"
            << "  [--profile <file.json | json>] [--parallel-load] \\\n"
            << "  [--fallback-label <text>] [--keyword <kw> ...] [--debug] [clip ...]\n";
}

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--audio" && i + 1 < argc) {
      args.audio_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      args.output_path = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      args.output_dir = argv[++i];
    } else if (arg == "--request-id" && i + 1 < argc) {
      args.request_id = argv[++i];
    } else if (arg == "--profile" && i + 1 < argc) {
      args.profile = argv[++i];
    } else if (arg == "--fallback-label" && i + 1 < argc) {
      args.fallback_label = argv[++i];
    } else if (arg == "--keyword" && i + 1 < argc) {
      args.keywords.push_back(argv[++i]);
    } else if (arg == "--parallel-load") {
      args.parallel_load = true;
    } else if (arg == "--debug") {
      args.debug = true;
    } else if (arg == "--help" || arg == "-h") {
      return false;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    } else {
      args.clips.push_back(arg);
    }
  }

  if (args.audio_path.empty()) {
    std::cerr << "Error: --audio is required\n";
    return false;
  }
  const bool by_path = !args.output_path.empty();
  const bool by_dir = !args.output_dir.empty() || !args.request_id.empty();
  if (by_path == by_dir) {
    std::cerr << "Error: give either --output or --output-dir with --request-id\n";
    return false;
  }
  if (by_dir && (args.output_dir.empty() || args.request_id.empty())) {
    std::cerr << "Error: --output-dir and --request-id go together\n";
    return false;
  }
  return true;
}

// `source` is inline JSON when it starts with '{', a file path otherwise.
bool LoadProfile(const std::string& source, runtime::OutputProfile& profile) {
  if (source.empty()) return true;

  std::string json = source;
  if (source.front() != '{') {
    std::ifstream in(source);
    if (!in) {
      std::cerr << "Error: cannot read profile " << source << "\n";
      return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    json = oss.str();
  }

  auto parsed = runtime::OutputProfile::FromJson(json);
  if (!parsed) {
    std::cerr << "Error: invalid output profile\n";
    return false;
  }
  profile = *parsed;
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  runtime::OutputProfile profile;
  if (!LoadProfile(args.profile, profile)) {
    return kExitUsage;
  }

  // Keywords only matter when no clip was given: they label placeholders.
  std::vector<std::string> clips = args.clips;
  if (clips.empty() && !args.keywords.empty()) {
    clips = producers::FallbackGenerator::PlaceholderUris(args.keywords);
  }

  runtime::AssemblyOptions options;
  options.request_id = args.request_id;
  options.parallel_load = args.parallel_load;
  options.fallback_label = args.fallback_label;
  options.debug_logging = args.debug;

  const std::string output_path =
      args.output_path.empty()
          ? assembly::OutputPathForRequest(args.output_dir, args.request_id)
          : args.output_path;

  assembly::AssemblyEngine engine(profile);
  assembly::AssemblyResult result = engine.Assemble(clips, args.audio_path, output_path, options);

  if (!result.ok) {
    std::cerr << "FAILED " << assembly::AssemblyErrorToString(result.error) << ": "
              << result.detail << "\n";
    return kExitFailure;
  }

  std::cout << result.output_path << "\n";
  return kExitOk;
}
