#pragma once
/// @file lifecycle.hpp
/// @brief One-shot stop signal shared by the runner, dispatcher and caller.

#include <stop_token>

namespace loadgen {

/// @brief Sole owner of the run's stop signal.
///
/// Any number of threads may call stop(); exactly one of them sees `true`.
/// Everything else only observes the signal through token().
class Lifecycle {
public:
  /// @brief Trigger the stop signal.
  /// @return true if this call performed the transition, false if the run
  ///         was already stopping (the caller may then escalate).
  auto stop() noexcept -> bool { return source_.request_stop(); }

  [[nodiscard]] auto stopped() const noexcept -> bool {
    return source_.stop_requested();
  }

  [[nodiscard]] auto token() const noexcept -> std::stop_token {
    return source_.get_token();
  }

private:
  std::stop_source source_;
};

} // namespace loadgen
