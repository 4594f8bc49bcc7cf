#include "rpc/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fleet_telemetry::rpc {

Server::Server(MethodRegistry methods) : methods_(std::move(methods)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    const auto response = handle_line(line, err);
    if (!response.is_null()) {
      out << response.dump() << '\n';
      out.flush();
    }
  }

  return 0;
}

nlohmann::json Server::handle_line(const std::string& line, std::ostream& err) const {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    err << "[rpc] parse error: " << ex.what() << '\n';
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"});
  }

  JsonRpcRequest parsed{};
  try {
    parsed = parse_request(request);
  } catch (const std::invalid_argument& ex) {
    nlohmann::json id = nullptr;
    if (request.is_object()) {
      const auto id_it = request.find("id");
      if (id_it != request.end() && (id_it->is_string() || id_it->is_number_integer())) {
        id = *id_it;
      }
    }
    return make_error_response(id, JsonRpcError{.code = kInvalidRequest, .message = ex.what()});
  }

  const nlohmann::json id = parsed.id.has_value() ? *parsed.id : nlohmann::json(nullptr);
  nlohmann::json response;
  try {
    response = make_result_response(id, dispatch(parsed));
  } catch (const MethodError& ex) {
    err << "[rpc] " << parsed.method << " failed: " << ex.what() << '\n';
    response = make_error_response(id, JsonRpcError{.code = ex.code(), .message = ex.what()});
  } catch (const std::invalid_argument& ex) {
    response = make_error_response(id, JsonRpcError{.code = kInvalidParams, .message = ex.what()});
  } catch (const std::exception& ex) {
    err << "[rpc] " << parsed.method << " raised: " << ex.what() << '\n';
    response = make_error_response(id, JsonRpcError{.code = kInternalError, .message = "internal error"});
  }

  // Notifications are executed but never answered.
  if (!parsed.id.has_value()) {
    return nullptr;
  }
  return response;
}

nlohmann::json Server::dispatch(const JsonRpcRequest& request) const {
  const auto method_it = methods_.find(request.method);
  if (method_it == methods_.end()) {
    throw MethodError(kMethodNotFound, "method not found");
  }
  return method_it->second.handler(request.params);
}

}  // namespace fleet_telemetry::rpc
