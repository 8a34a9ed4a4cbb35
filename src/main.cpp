// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#include "host/invocation_host.hpp"
#include "router/dispatcher.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using procrouter::router::Context;
using procrouter::router::Payload;

void PrintUsage(const char* program_name) {
  std::cout << "procrouterd - route JSON invocation events to registered procedures\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Reads one request envelope per line from stdin:\n"
            << "  {\"procedure\": \"<name>\", \"body\": <json>}\n"
            << "and writes one response envelope per line to stdout.\n\n"
            << "Options:\n"
            << "  --loglevel=<level>   trace, debug, info, warn, error, off (default: off)\n"
            << "  --logfile=<path>     Also write logs to <path>\n"
            << "  --timeout=<ms>       Deadline for each invocation\n"
            << "  --version            Show version information\n"
            << "  --help               Show this help message\n\n"
            << "Procedures:\n"
            << "  echo                 Return the body unchanged\n"
            << "  ping                 Return \"pong\"\n"
            << "  procedures           List registered procedures\n"
            << "  fail                 Fail with the body as the error message\n"
            << std::endl;
}

// Structured errors: {"message": ..., "code": ...} for HandlerError, default text otherwise
std::optional<Payload> EncodeJsonError(const std::exception& error) {
  const auto* handler_error = dynamic_cast<const procrouter::router::HandlerError*>(&error);
  if (!handler_error) {
    return procrouter::router::EncodeErrorMessage(error);
  }
  nlohmann::json j;
  j["message"] = handler_error->what();
  if (!handler_error->code().empty()) {
    j["code"] = handler_error->code();
  }
  return Payload(j.dump());
}

void RegisterBuiltins(procrouter::router::Dispatcher& dispatcher) {
  dispatcher.Register("echo", [](const Context&, const Payload& body) { return body; });

  dispatcher.Register("ping", [](const Context&, const Payload&) { return Payload("\"pong\""); });

  auto& registry = dispatcher.registry();
  dispatcher.Register("procedures", [&registry](const Context&, const Payload&) {
    nlohmann::json names = registry.Procedures();
    return Payload(names.dump());
  });

  dispatcher.Register("fail", [](const Context&, const Payload& body) -> Payload {
    std::string message = body.empty() ? "failure requested" : body.str();
    nlohmann::json parsed = nlohmann::json::parse(message, nullptr, false);
    if (parsed.is_string()) {
      message = parsed.get<std::string>();
    }
    throw procrouter::router::HandlerError(message, "requested");
  });
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    std::string log_level = "off";
    std::string log_file;
    procrouter::host::HostConfig host_config;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << procrouter::GetFullVersionString() << std::endl;
        return 0;
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
        if (!procrouter::util::LogManager::IsValidLevel(log_level)) {
          std::cerr << "Error: Unknown log level: " << log_level << "\n";
          return 1;
        }
      } else if (arg.starts_with("--logfile=")) {
        log_file = arg.substr(10);
        if (log_file.empty()) {
          std::cerr << "Error: --logfile requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--timeout=")) {
        long long ms = 0;
        try {
          size_t pos = 0;
          ms = std::stoll(arg.substr(10), &pos);
          if (pos != arg.size() - 10) {
            throw std::invalid_argument("trailing characters");
          }
        } catch (const std::exception&) {
          std::cerr << "Error: --timeout requires an integer number of milliseconds\n";
          return 1;
        }
        if (ms <= 0) {
          std::cerr << "Error: --timeout must be positive\n";
          return 1;
        }
        host_config.invocation_timeout = std::chrono::milliseconds(ms);
      } else {
        std::cerr << "Error: Unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    procrouter::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);
    LOG_INFO("Starting {}", procrouter::GetFullVersionString());

    procrouter::router::Dispatcher dispatcher{procrouter::router::EncodeErrorsWith(EncodeJsonError),
                                              procrouter::router::OnEncodeFailure(
                                                  [](const std::string& procedure, const std::exception& error,
                                                     const std::string& reason) {
                                                    LOG_ERROR("Could not encode error from '{}' ({}): {}", procedure,
                                                              error.what(), reason);
                                                  })};
    RegisterBuiltins(dispatcher);

    procrouter::host::InvocationHost host(dispatcher, host_config);
    host.Serve(std::cin, std::cout);

    procrouter::util::LogManager::Shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
