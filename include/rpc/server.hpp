#pragma once

#include <iosfwd>
#include <string>

#include "rpc/jsonrpc.hpp"
#include "rpc/methods.hpp"

namespace fleet_telemetry::rpc {

// Newline-delimited JSON-RPC 2.0: one request per input line, one response
// per output line. Diagnostics go to err.
class Server {
 public:
  explicit Server(MethodRegistry methods);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // Returns the response for one request line, or null for a notification.
  nlohmann::json handle_line(const std::string& line, std::ostream& err) const;

 private:
  nlohmann::json dispatch(const JsonRpcRequest& request) const;

  MethodRegistry methods_;
};

}  // namespace fleet_telemetry::rpc
