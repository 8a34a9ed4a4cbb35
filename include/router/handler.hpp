// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include "router/context.hpp"
#include "router/payload.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace procrouter {
namespace router {

// Handler - the unit of work bound to one procedure name.
//
// Returns the success payload, or throws to report failure. The exception's
// what() is the human-readable error message sent back to the caller.
class Handler {
public:
  virtual ~Handler() = default;

  virtual Payload Handle(const Context& ctx, const Payload& body) = 0;
};

// HandlerFunc adapts an ordinary callable to the Handler interface.
class HandlerFunc : public Handler {
public:
  using Function = std::function<Payload(const Context&, const Payload&)>;

  explicit HandlerFunc(Function fn) : fn_(std::move(fn)) {}

  Payload Handle(const Context& ctx, const Payload& body) override { return fn_(ctx, body); }

private:
  Function fn_;
};

// Wrap a callable in a shared Handler. Returns null for an empty function.
inline std::shared_ptr<Handler> MakeHandler(HandlerFunc::Function fn) {
  if (!fn) {
    return nullptr;
  }
  return std::make_shared<HandlerFunc>(std::move(fn));
}

// Optional error type for handlers that want to attach a machine-readable code.
// Any std::exception works as a handler error; this one just carries more for
// custom error encoders to use.
class HandlerError : public std::runtime_error {
public:
  explicit HandlerError(const std::string& message, std::string code = {})
      : std::runtime_error(message), code_(std::move(code)) {}

  const std::string& code() const { return code_; }

private:
  std::string code_;
};

}  // namespace router
}  // namespace procrouter
