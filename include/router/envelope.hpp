// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include "router/dispatcher.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace procrouter {
namespace router {

// Malformed wire envelope.
class EnvelopeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/*
 JSON wire shape of the envelopes

   request:   {"procedure": "<name>", "body": <any JSON value>}
   response:  {"body": <value>}  or  {"error": <value>}
   failure:   {"dispatchError": "<message>"}

 Payloads are carried as JSON text, byte for byte: a request body reaches the
 handler exactly as it appeared in the event. A payload that is not itself
 valid JSON (e.g. a plain error message) is written as a JSON string, and a
 JSON string value is read back as its unquoted text. Error payloads that are
 empty or read as null are written as strings so the message survives.
*/
namespace envelope {

// Throws EnvelopeError for malformed JSON, a non-object document or a non-string procedure.
// Missing procedure decodes to "", missing or null body to an empty payload.
Request DecodeRequest(std::string_view json);
std::string EncodeRequest(const Request& request);

std::string EncodeResponse(const Response& response);
// Throws EnvelopeError unless the document is an object with exactly one of body/error.
Response DecodeResponse(std::string_view json);

std::string EncodeDispatchError(const DispatchError& error);

}  // namespace envelope
}  // namespace router
}  // namespace procrouter
