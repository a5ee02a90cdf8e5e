#pragma once

#include "errors.h"
#include "log.h"

#include <functional>

namespace ripple {

using error_handler_t = std::function<void(const recompute_error &)>;

struct runtime_config {
  // Upper bound on effect rounds within a single flush. Every round drains
  // the effects queued by the previous one.
  int max_flush_iterations = 100;

  // Receives failures of effect bodies and cleanups. When empty, failures are
  // logged at log_level::error.
  error_handler_t on_error = {};

  log_level level = log_level::warn;
  log_sink_t log_sink = stderr_sink;
};

} // namespace ripple
