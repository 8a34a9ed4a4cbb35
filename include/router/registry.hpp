// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#ifndef PROCROUTER_ROUTER_REGISTRY_HPP
#define PROCROUTER_ROUTER_REGISTRY_HPP

#include "router/handler.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace procrouter {
namespace router {

/**
 * Registry - procedure name to handler binding table
 *
 * Design:
 * - Exact-match lookup, case-sensitive, no normalization of names
 * - The empty string is a valid procedure name
 * - Last registration for a name wins (no error, no warning)
 * - Thread-safe registration and lookup
 *
 * Ownership Model:
 * - Handlers are shared: Lookup() hands out a shared_ptr, so a handler
 *   replaced mid-dispatch stays alive until that dispatch returns
 *
 * Usage:
 *   Registry registry;
 *   registry.Register("echo", MakeHandler([](const Context&, const Payload& p) { return p; }));
 *   if (auto handler = registry.Lookup("echo")) { ... }
 */
class Registry {
public:
  Registry() = default;
  ~Registry() = default;

  // Non-copyable
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // Bind handler to procedure, replacing any previous binding.
  // Note: null handlers are ignored so a bound name always resolves to something callable.
  void Register(const std::string& procedure, std::shared_ptr<Handler> handler);

  // Remove the binding for procedure, if any.
  void Unregister(const std::string& procedure);

  // Handler bound to procedure, or nullptr when nothing is registered under that name.
  std::shared_ptr<Handler> Lookup(const std::string& procedure) const;

  bool Contains(const std::string& procedure) const;

  // Registered procedure names, sorted (for diagnostics).
  std::vector<std::string> Procedures() const;

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Handler>> handlers_;
};

}  // namespace router
}  // namespace procrouter

#endif  // PROCROUTER_ROUTER_REGISTRY_HPP
