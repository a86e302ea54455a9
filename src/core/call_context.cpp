#include "core/call_context.hpp"

#include <string>
#include <utility>

#include "mcp/tools.hpp"

namespace rx_host::core {

CallContext::CallContext(std::optional<Clock::time_point> deadline, std::shared_ptr<const std::atomic_bool> cancel_token)
    : deadline_(deadline), cancel_token_(std::move(cancel_token)) {}

CallContext CallContext::with_timeout(const std::chrono::milliseconds timeout,
                                      std::shared_ptr<const std::atomic_bool> cancel_token) {
  std::optional<Clock::time_point> deadline;
  if (timeout.count() > 0) {
    deadline = Clock::now() + timeout;
  }
  return CallContext(deadline, std::move(cancel_token));
}

bool CallContext::cancelled() const {
  return cancel_token_ != nullptr && cancel_token_->load();
}

bool CallContext::expired() const {
  if (cancelled()) {
    return true;
  }
  return deadline_.has_value() && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CallContext::remaining() const {
  if (!deadline_.has_value()) {
    return std::nullopt;
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void CallContext::check(const char* what) const {
  if (cancelled()) {
    throw mcp::ToolError(mcp::ToolErrorKind::kCancelled, std::string(what) + ": call cancelled");
  }
  if (expired()) {
    throw mcp::ToolError(mcp::ToolErrorKind::kCancelled, std::string(what) + ": call deadline exceeded");
  }
}

}  // namespace rx_host::core
