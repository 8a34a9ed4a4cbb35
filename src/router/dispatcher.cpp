// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include "router/dispatcher.hpp"

#include "util/logging.hpp"

#include <utility>

namespace procrouter {
namespace router {

Payload EncodeErrorMessage(const std::exception& error) {
  return Payload(std::string(error.what()));
}

Option EncodeErrorsWith(ErrorEncoder encoder) {
  return [encoder = std::move(encoder)](DispatcherConfig& config) {
    if (encoder) {
      config.encode_error = encoder;
    }
  };
}

Option OnEncodeFailure(EncodeFailureObserver observer) {
  return [observer = std::move(observer)](DispatcherConfig& config) { config.on_encode_failure = observer; };
}

Dispatcher::Dispatcher(const std::vector<Option>& options) {
  for (const auto& option : options) {
    if (option) {
      option(config_);
    }
  }
}

void Dispatcher::Register(const std::string& procedure, std::shared_ptr<Handler> handler) {
  registry_.Register(procedure, std::move(handler));
}

void Dispatcher::Register(const std::string& procedure, HandlerFunc::Function fn) {
  registry_.Register(procedure, MakeHandler(std::move(fn)));
}

Response Dispatcher::Handle(const Context& ctx, const Request& request) const {
  auto handler = registry_.Lookup(request.procedure);
  if (!handler) {
    LOG_ROUTER_WARN("Unrecognized procedure '{}'", request.procedure);
    throw UnrecognizedProcedureError(request.procedure);
  }

  LOG_ROUTER_DEBUG("Dispatching '{}' ({} byte body)", request.procedure, request.body.size());

  try {
    return Response::Success(handler->Handle(ctx, request.body));
  } catch (const std::exception& e) {
    LOG_ROUTER_DEBUG("Procedure '{}' failed: {}", request.procedure, e.what());
    return Response::Failure(EncodeError(request.procedure, e));
  } catch (...) {
    // Non-standard exception types carry no message
    const HandlerError unknown("unknown handler error");
    LOG_ROUTER_DEBUG("Procedure '{}' failed with a non-standard exception", request.procedure);
    return Response::Failure(EncodeError(request.procedure, unknown));
  }
}

Payload Dispatcher::EncodeError(const std::string& procedure, const std::exception& error) const {
  std::string reason;
  try {
    if (auto encoded = config_.encode_error(error)) {
      return std::move(*encoded);
    }
  } catch (const std::exception& e) {
    reason = e.what();
  } catch (...) {
    reason = "unknown encoder error";
  }

  // The encoder's failure never replaces the handler's own message
  LOG_ROUTER_WARN("Error encoder failed for procedure '{}'{}{}; sending plain message", procedure,
                  reason.empty() ? "" : ": ", reason);
  if (config_.on_encode_failure) {
    try {
      config_.on_encode_failure(procedure, error, reason);
    } catch (const std::exception& e) {
      LOG_ROUTER_ERROR("Encode failure observer threw: {}", e.what());
    } catch (...) {
      LOG_ROUTER_ERROR("Encode failure observer threw a non-standard exception");
    }
  }
  return EncodeErrorMessage(error);
}

}  // namespace router
}  // namespace procrouter
