// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include "host/invocation_host.hpp"

#include "router/envelope.hpp"
#include "util/logging.hpp"

#include <istream>
#include <ostream>
#include <utility>

#include <nlohmann/json.hpp>

namespace procrouter {
namespace host {

namespace {

// Envelope errors are reported in the same shape as dispatch errors
std::string RejectEvent(const std::string& message) {
  return router::envelope::EncodeDispatchError(router::DispatchError(message));
}

bool IsBlank(std::string_view line) {
  return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

}  // namespace

InvocationHost::InvocationHost(router::Dispatcher& dispatcher, HostConfig config)
    : dispatcher_(dispatcher), config_(std::move(config)) {}

router::Context InvocationHost::MakeContext() {
  std::optional<router::Context::Clock::time_point> deadline;
  if (config_.invocation_timeout) {
    deadline = router::Context::Clock::now() + *config_.invocation_timeout;
  }
  return router::Context(stop_source_.get_token(), deadline, std::to_string(next_request_id_++));
}

InvocationResult InvocationHost::Invoke(std::string_view event) {
  return Invoke(event, MakeContext());
}

InvocationResult InvocationHost::Invoke(std::string_view event, const router::Context& ctx) {
  if (event.size() > config_.max_event_bytes) {
    LOG_HOST_WARN("Event too large: {} bytes (max {})", event.size(), config_.max_event_bytes);
    return {false, RejectEvent("event too large")};
  }

  router::Request request;
  try {
    request = router::envelope::DecodeRequest(event);
  } catch (const router::EnvelopeError& e) {
    LOG_HOST_WARN("Rejected event: {}", e.what());
    return {false, RejectEvent(e.what())};
  }

  LOG_HOST_DEBUG("Invocation id={} procedure={}", ctx.request_id(), request.procedure);

  try {
    router::Response response = dispatcher_.Handle(ctx, request);
    return {true, router::envelope::EncodeResponse(response)};
  } catch (const router::DispatchError& e) {
    return {false, router::envelope::EncodeDispatchError(e)};
  } catch (const nlohmann::json::exception& e) {
    LOG_HOST_ERROR("Failed to encode response for '{}': {}", request.procedure, e.what());
    return {false, RejectEvent("response encoding failed")};
  }
}

std::size_t InvocationHost::Serve(std::istream& in, std::ostream& out) {
  LOG_HOST_INFO("Serving invocations");

  std::size_t processed = 0;
  std::string line;
  while (!StopRequested() && std::getline(in, line)) {
    if (IsBlank(line)) {
      continue;
    }

    InvocationResult result = Invoke(line);
    out << result.payload << '\n';
    out.flush();
    ++processed;

    if (!out) {
      LOG_HOST_ERROR("Output stream failed after {} invocations", processed);
      break;
    }
  }

  LOG_HOST_INFO("Stopped serving after {} invocations", processed);
  return processed;
}

void InvocationHost::Stop() {
  stop_source_.request_stop();
}

}  // namespace host
}  // namespace procrouter
