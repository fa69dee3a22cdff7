// Repository: Reelsmith
// Component: Assembly Context
// Purpose: Request-scoped configuration and logging handed to every stage.
// Copyright (c) 2025 The Reelsmith Authors

#ifndef REELSMITH_RUNTIME_ASSEMBLY_CONTEXT_HPP_
#define REELSMITH_RUNTIME_ASSEMBLY_CONTEXT_HPP_

#include <atomic>
#include <memory>
#include <string>

#include "reelsmith/runtime/OutputProfile.hpp"
#include "reelsmith/util/Logger.hpp"

namespace reelsmith::runtime {

// Per-call knobs for AssemblyEngine.
struct AssemblyOptions {
  // Unique per request; used as the log prefix. Empty = generated.
  std::string request_id;

  // Probe input clips on a small worker pool. Results are still collected
  // in input order.
  bool parallel_load = false;
  int max_load_workers = 4;

  // Caption for the whole-pipeline fallback clip. Empty = profile default.
  std::string fallback_label;

  bool debug_logging = false;

  // Set from any thread to stop the request. Checked between output frames;
  // partial output is removed.
  std::shared_ptr<std::atomic<bool>> cancel_flag;
};

// AssemblyContext lives for exactly one assembly request. Components hold a
// const reference for the duration of a call and never keep it beyond.
struct AssemblyContext {
  std::string request_id;
  OutputProfile profile;
  AssemblyOptions options;
  util::Logger logger;

  AssemblyContext(std::string id, OutputProfile p, AssemblyOptions opts = {})
      : request_id(std::move(id)),
        profile(std::move(p)),
        options(std::move(opts)),
        logger(request_id, options.debug_logging) {}

  bool CancelRequested() const { return options.cancel_flag && options.cancel_flag->load(); }
};

}  // namespace reelsmith::runtime

#endif  // REELSMITH_RUNTIME_ASSEMBLY_CONTEXT_HPP_
