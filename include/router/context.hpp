// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

namespace procrouter {
namespace router {

/**
 * Context - per-invocation cancellation and deadline carrier
 *
 * Supplied by the host, passed to the handler untouched. The dispatcher
 * imposes no timeout of its own; honoring cancellation is up to the handler.
 */
class Context {
public:
  using Clock = std::chrono::steady_clock;

  Context() = default;
  Context(std::stop_token stop, std::optional<Clock::time_point> deadline = std::nullopt, std::string request_id = {})
      : stop_(std::move(stop)), deadline_(deadline), request_id_(std::move(request_id)) {}

  // A context that is never cancelled and has no deadline.
  static Context Background() { return Context(); }

  // Derive a context with the same cancellation source and request id but a (possibly tighter) deadline.
  Context WithDeadline(Clock::time_point deadline) const;
  Context WithTimeout(Clock::duration timeout) const { return WithDeadline(Clock::now() + timeout); }

  // True once the host requested stop or the deadline passed.
  bool Cancelled() const;

  const std::stop_token& stop_token() const { return stop_; }
  const std::optional<Clock::time_point>& deadline() const { return deadline_; }
  const std::string& request_id() const { return request_id_; }

  // Time left until the deadline (zero once passed). nullopt when there is no deadline.
  std::optional<Clock::duration> RemainingTime() const;

private:
  std::stop_token stop_;
  std::optional<Clock::time_point> deadline_;
  std::string request_id_;
};

}  // namespace router
}  // namespace procrouter
