#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace rx_host::core {

// Per-call execution bounds handed to every tool handler. A context with
// neither a deadline nor a raised cancel flag never expires.
class CallContext {
 public:
  using Clock = std::chrono::steady_clock;

  CallContext() = default;
  CallContext(std::optional<Clock::time_point> deadline, std::shared_ptr<const std::atomic_bool> cancel_token);

  static CallContext with_timeout(std::chrono::milliseconds timeout,
                                  std::shared_ptr<const std::atomic_bool> cancel_token = nullptr);

  bool has_deadline() const { return deadline_.has_value(); }
  const std::optional<Clock::time_point>& deadline() const { return deadline_; }

  bool cancelled() const;
  bool expired() const;

  // Time left before the deadline, clamped at zero. Unbounded contexts
  // return std::nullopt.
  std::optional<std::chrono::milliseconds> remaining() const;

  // Throws a cancelled ToolError when the context has expired.
  void check(const char* what) const;

 private:
  std::optional<Clock::time_point> deadline_{};
  std::shared_ptr<const std::atomic_bool> cancel_token_{};
};

}  // namespace rx_host::core
