// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include "router/envelope.hpp"

#include <cstddef>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

namespace procrouter {
namespace router {
namespace envelope {

using json = nlohmann::json;

namespace {

constexpr const char* kProcedureField = "procedure";
constexpr const char* kBodyField = "body";
constexpr const char* kErrorField = "error";
constexpr const char* kDispatchErrorField = "dispatchError";

json Parse(std::string_view text) {
  try {
    return json::parse(text.begin(), text.end());
  } catch (const json::parse_error& e) {
    throw EnvelopeError(std::string("invalid JSON: ") + e.what());
  }
}

// JSON string literal. Invalid UTF-8 is replaced (U+FFFD) rather than rejected.
std::string Quote(const std::string& text) {
  return json(text).dump(-1, ' ', false, json::error_handler_t::replace);
}

// Payload as it appears on the wire: valid JSON text verbatim, anything else as a string literal.
std::string RawJson(const Payload& payload) {
  if (json::accept(payload.str())) {
    return payload.str();
  }
  return Quote(payload.str());
}

// Error payloads always carry something: "" and "null" are sent as strings, not as null.
std::string RawErrorJson(const Payload& payload) {
  if (!payload.empty() && json::accept(payload.str()) && !json::parse(payload.str()).is_null()) {
    return payload.str();
  }
  return Quote(payload.str());
}

// Raw byte scanning over a document nlohmann has already validated, so that
// member values can be handed on without being re-serialized.

bool IsJsonSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::size_t SkipSpace(std::string_view text, std::size_t pos) {
  while (pos < text.size() && IsJsonSpace(text[pos])) {
    ++pos;
  }
  return pos;
}

// pos is at the opening quote; returns the position just past the closing quote
std::size_t SkipString(std::string_view text, std::size_t pos) {
  for (++pos; pos < text.size(); ++pos) {
    if (text[pos] == '\\') {
      ++pos;
    } else if (text[pos] == '"') {
      return pos + 1;
    }
  }
  throw EnvelopeError("unterminated string");
}

std::size_t SkipValue(std::string_view text, std::size_t pos) {
  if (pos >= text.size()) {
    throw EnvelopeError("missing value");
  }
  if (text[pos] == '"') {
    return SkipString(text, pos);
  }
  if (text[pos] == '{' || text[pos] == '[') {
    int depth = 0;
    while (pos < text.size()) {
      const char c = text[pos];
      if (c == '"') {
        pos = SkipString(text, pos);
        continue;
      }
      if (c == '{' || c == '[') {
        ++depth;
      } else if ((c == '}' || c == ']') && --depth == 0) {
        return pos + 1;
      }
      ++pos;
    }
    throw EnvelopeError("unterminated container");
  }
  while (pos < text.size() && !IsJsonSpace(text[pos]) && text[pos] != ',' && text[pos] != '}' && text[pos] != ']') {
    ++pos;
  }
  return pos;
}

// Original text of the named top-level member. Duplicate keys resolve to the
// last occurrence, as in nlohmann's parser.
std::optional<std::string_view> RawMember(std::string_view text, const std::string& name) {
  if (text.substr(0, 3) == "\xEF\xBB\xBF") {
    text.remove_prefix(3);
  }

  std::optional<std::string_view> found;
  std::size_t pos = SkipSpace(text, 0) + 1;  // past '{'
  pos = SkipSpace(text, pos);
  while (pos < text.size() && text[pos] != '}') {
    const std::size_t key_end = SkipString(text, pos);
    const std::string_view raw_key = text.substr(pos, key_end - pos);
    const std::string key = json::parse(raw_key.begin(), raw_key.end()).get<std::string>();
    pos = SkipSpace(text, SkipSpace(text, key_end) + 1);  // past ':'
    const std::size_t value_end = SkipValue(text, pos);
    if (key == name) {
      found = text.substr(pos, value_end - pos);
    }
    pos = SkipSpace(text, value_end);
    if (pos < text.size() && text[pos] == ',') {
      pos = SkipSpace(text, pos + 1);
    }
  }
  return found;
}

// Strings are unquoted, null is empty, everything else keeps its original text.
Payload FromRaw(const json& value, std::string_view raw) {
  if (value.is_null()) {
    return Payload();
  }
  if (value.is_string()) {
    return Payload(value.get<std::string>());
  }
  return Payload(std::string(raw));
}

}  // namespace

Request DecodeRequest(std::string_view text) {
  json j = Parse(text);
  if (!j.is_object()) {
    throw EnvelopeError("request envelope must be a JSON object");
  }

  Request request;
  if (j.contains(kProcedureField)) {
    const auto& procedure = j[kProcedureField];
    if (!procedure.is_string()) {
      throw EnvelopeError("request field 'procedure' must be a string");
    }
    request.procedure = procedure.get<std::string>();
  }
  // Body is handed to the handler byte for byte as it appeared in the event
  if (j.contains(kBodyField) && !j[kBodyField].is_null()) {
    if (auto raw = RawMember(text, kBodyField)) {
      request.body = Payload(std::string(*raw));
    }
  }
  return request;
}

std::string EncodeRequest(const Request& request) {
  std::string out = "{\"" + std::string(kProcedureField) + "\":" + Quote(request.procedure);
  if (!request.body.empty()) {
    out += ",\"" + std::string(kBodyField) + "\":" + RawJson(request.body);
  }
  out += "}";
  return out;
}

std::string EncodeResponse(const Response& response) {
  std::string out = "{";
  if (response.body) {
    out += "\"" + std::string(kBodyField) + "\":" + (response.body->empty() ? "null" : RawJson(*response.body));
  }
  if (response.error) {
    if (response.body) {
      out += ",";
    }
    out += "\"" + std::string(kErrorField) + "\":" + RawErrorJson(*response.error);
  }
  out += "}";
  return out;
}

Response DecodeResponse(std::string_view text) {
  json j = Parse(text);
  if (!j.is_object()) {
    throw EnvelopeError("response envelope must be a JSON object");
  }

  const bool has_body = j.contains(kBodyField);
  const bool has_error = j.contains(kErrorField);
  if (has_body == has_error) {
    throw EnvelopeError("response envelope must carry exactly one of 'body' or 'error'");
  }

  const char* field = has_error ? kErrorField : kBodyField;
  Payload payload = FromRaw(j[field], RawMember(text, field).value_or(std::string_view()));
  return has_error ? Response::Failure(std::move(payload)) : Response::Success(std::move(payload));
}

std::string EncodeDispatchError(const DispatchError& error) {
  return "{\"" + std::string(kDispatchErrorField) + "\":" + Quote(error.what()) + "}";
}

}  // namespace envelope
}  // namespace router
}  // namespace procrouter
