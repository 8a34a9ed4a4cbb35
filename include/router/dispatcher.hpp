// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#ifndef PROCROUTER_ROUTER_DISPATCHER_HPP
#define PROCROUTER_ROUTER_DISPATCHER_HPP

#include "router/context.hpp"
#include "router/handler.hpp"
#include "router/payload.hpp"
#include "router/registry.hpp"

#include <exception>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace procrouter {
namespace router {

// Inbound envelope: which procedure to run and the body to hand it.
struct Request {
  std::string procedure;
  Payload body;
};

// Outbound envelope. Exactly one of body/error is set for every response
// produced by Dispatcher::Handle.
struct Response {
  std::optional<Payload> body;
  std::optional<Payload> error;

  static Response Success(Payload payload) { return Response{std::move(payload), std::nullopt}; }
  static Response Failure(Payload payload) { return Response{std::nullopt, std::move(payload)}; }

  bool IsError() const { return error.has_value(); }

  bool operator==(const Response& other) const { return body == other.body && error == other.error; }
  bool operator!=(const Response& other) const { return !(*this == other); }
};

// Failure of the routing mechanism itself, reported to the caller of Handle().
class DispatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Thrown by Handle() when no handler is bound to the requested procedure.
class UnrecognizedProcedureError : public DispatchError {
public:
  explicit UnrecognizedProcedureError(const std::string& procedure)
      : DispatchError("unrecognized procedure '" + procedure + "'"), procedure_(procedure) {}

  const std::string& procedure() const { return procedure_; }

private:
  std::string procedure_;
};

// Converts a handler error to the response's error payload.
// Return std::nullopt (or throw) to report that the error could not be encoded;
// the dispatcher then sends the error's what() text instead.
using ErrorEncoder = std::function<std::optional<Payload>(const std::exception& error)>;

// Told when an ErrorEncoder fails. reason is the encoder's exception text, or
// empty when the encoder returned std::nullopt.
using EncodeFailureObserver =
    std::function<void(const std::string& procedure, const std::exception& handler_error, const std::string& reason)>;

// Payload carrying the error's what() text. Never fails.
Payload EncodeErrorMessage(const std::exception& error);

struct DispatcherConfig {
  ErrorEncoder encode_error = [](const std::exception& error) -> std::optional<Payload> {
    return EncodeErrorMessage(error);
  };
  EncodeFailureObserver on_encode_failure;
};

// Options are applied in order at construction; later options override earlier ones.
using Option = std::function<void(DispatcherConfig&)>;

// Replace the error encoder. A null encoder leaves the current one in place.
Option EncodeErrorsWith(ErrorEncoder encoder);

// Install a callback for error encoder failures (which are otherwise only logged).
Option OnEncodeFailure(EncodeFailureObserver observer);

/**
 * Dispatcher - single entry point multiplexing many procedures
 *
 * Handle() looks up the handler for request.procedure, runs it and wraps the
 * outcome in a Response. A handler failure never escapes Handle(): it becomes
 * the response's error payload through the configured ErrorEncoder. The only
 * exception Handle() throws is UnrecognizedProcedureError.
 *
 * Registration is expected to finish before traffic starts. After that the
 * dispatcher is read-only and Handle() may be called from many threads.
 */
class Dispatcher {
public:
  Dispatcher() : Dispatcher(std::vector<Option>{}) {}
  Dispatcher(std::initializer_list<Option> options) : Dispatcher(std::vector<Option>(options)) {}
  explicit Dispatcher(const std::vector<Option>& options);

  // Non-copyable
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void Register(const std::string& procedure, std::shared_ptr<Handler> handler);
  void Register(const std::string& procedure, HandlerFunc::Function fn);

  Registry& registry() { return registry_; }
  const Registry& registry() const { return registry_; }

  // Throws UnrecognizedProcedureError if nothing is registered under request.procedure.
  Response Handle(const Context& ctx, const Request& request) const;

private:
  Payload EncodeError(const std::string& procedure, const std::exception& error) const;

  Registry registry_;
  DispatcherConfig config_;
};

}  // namespace router
}  // namespace procrouter

#endif  // PROCROUTER_ROUTER_DISPATCHER_HPP
