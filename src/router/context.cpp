// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include "router/context.hpp"

#include <algorithm>

namespace procrouter {
namespace router {

Context Context::WithDeadline(Clock::time_point deadline) const {
  if (deadline_ && *deadline_ < deadline) {
    deadline = *deadline_;
  }
  return Context(stop_, deadline, request_id_);
}

bool Context::Cancelled() const {
  if (stop_.stop_requested()) {
    return true;
  }
  return deadline_ && Clock::now() >= *deadline_;
}

std::optional<Context::Clock::duration> Context::RemainingTime() const {
  if (!deadline_) {
    return std::nullopt;
  }
  return std::max(*deadline_ - Clock::now(), Clock::duration::zero());
}

}  // namespace router
}  // namespace procrouter
