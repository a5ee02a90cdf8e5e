#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ripple {

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// A derived cell was read (directly or transitively) by its own body.
struct cycle_error : error {
  using error::error;
};

/// A single flush needed more rounds than runtime_config::max_flush_iterations,
/// i.e. effects keep writing to cells that re-trigger them.
struct runaway_flush_error : error {
  int rounds;

  runaway_flush_error(const std::string &message, int rounds)
      : error{message}, rounds{rounds} {}
};

/// A derived cell was used after its owning scope disposed it, or a handle
/// outlived its runtime.
struct disposed_error : error {
  using error::error;
};

/// An effect body or cleanup threw. Never thrown at writers: the scheduler
/// hands it to the configured error handler and carries on with the flush.
struct recompute_error : error {
  std::exception_ptr cause;

  recompute_error(const std::string &message, std::exception_ptr cause)
      : error{message}, cause{std::move(cause)} {}

  [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause); }
};

inline auto describe(const std::exception_ptr &e) -> std::string {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace ripple
