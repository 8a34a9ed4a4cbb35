// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include "router/context.hpp"
#include "router/dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace procrouter {
namespace host {

struct HostConfig {
  // Deadline attached to each invocation's context (none by default)
  std::optional<std::chrono::milliseconds> invocation_timeout;
  // Events larger than this are rejected without being parsed
  std::size_t max_event_bytes = 1024 * 1024;
};

struct InvocationResult {
  // False when the event could not be decoded or named an unknown procedure
  bool ok = false;
  // Encoded response envelope, or the encoded dispatch failure when !ok
  std::string payload;
};

/**
 * InvocationHost - feeds wire-level events to a Dispatcher
 *
 * Each event is a JSON request envelope; each result is a JSON response
 * envelope. Serve() runs a line-delimited loop: one event per input line,
 * one result per output line.
 *
 * The dispatcher must outlive the host.
 */
class InvocationHost {
public:
  explicit InvocationHost(router::Dispatcher& dispatcher, HostConfig config = {});

  // Decode one event, dispatch it under ctx and encode the outcome.
  InvocationResult Invoke(std::string_view event, const router::Context& ctx);

  // Same, with a context derived from the host's stop source and configuration.
  InvocationResult Invoke(std::string_view event);

  // Process events from in until EOF or Stop(). Returns the number of events processed.
  std::size_t Serve(std::istream& in, std::ostream& out);

  // Request the serve loop to return and cancel in-flight contexts. Thread-safe.
  void Stop();
  bool StopRequested() const { return stop_source_.stop_requested(); }

  const HostConfig& config() const { return config_; }

private:
  router::Context MakeContext();

  router::Dispatcher& dispatcher_;
  HostConfig config_;
  std::stop_source stop_source_;
  std::atomic<uint64_t> next_request_id_{1};
};

}  // namespace host
}  // namespace procrouter
