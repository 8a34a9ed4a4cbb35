// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include "router/registry.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <utility>

namespace procrouter {
namespace router {

void Registry::Register(const std::string& procedure, std::shared_ptr<Handler> handler) {
  if (!handler) {
    LOG_ROUTER_WARN("Ignoring null handler for procedure '{}'", procedure);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[procedure] = std::move(handler);
  LOG_ROUTER_DEBUG("Registered procedure '{}'", procedure);
}

void Registry::Unregister(const std::string& procedure) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(procedure);
}

std::shared_ptr<Handler> Registry::Lookup(const std::string& procedure) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handlers_.find(procedure);
  if (it == handlers_.end()) {
    return nullptr;
  }
  return it->second;
}

bool Registry::Contains(const std::string& procedure) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.find(procedure) != handlers_.end();
}

std::vector<std::string> Registry::Procedures() const {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::size_t Registry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

}  // namespace router
}  // namespace procrouter
