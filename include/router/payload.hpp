// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace procrouter {
namespace router {

// Opaque payload: an uninterpreted block of already-encoded data (typically JSON text).
// The dispatcher moves payloads between the host and handlers without looking inside.
class Payload {
public:
  Payload() = default;
  explicit Payload(std::string bytes) : bytes_(std::move(bytes)) {}
  explicit Payload(std::string_view bytes) : bytes_(bytes) {}
  explicit Payload(const char* bytes) : bytes_(bytes) {}

  const std::string& str() const { return bytes_; }
  std::size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  bool operator==(const Payload& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Payload& other) const { return !(*this == other); }

private:
  std::string bytes_;
};

}  // namespace router
}  // namespace procrouter
