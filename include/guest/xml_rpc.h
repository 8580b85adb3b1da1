#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace guest {

using XmlRpcValue = std::variant<bool, int, std::string>;

struct HttpEndpoint {
  std::string host;
  std::string port;
  std::string path;
};

struct HttpResponse {
  int status = 0;
  std::string body;
};

constexpr const char kDefaultAgentUrl[] = "http://127.0.0.1:8000";

// Accepts http://host[:port][/path]; the path defaults to /RPC2.
HttpEndpoint ParseHttpEndpoint(const std::string &url);

std::string BuildMethodCall(const std::string &method,
                            const std::vector<XmlRpcValue> &params);

// Throws CompletionError when the body is not well-formed XML.
std::optional<std::string> ExtractFault(const std::string &body);

HttpResponse ParseHttpResponse(const std::string &raw);

// One request, no retry. Throws CompletionError on transport failure.
HttpResponse PostXml(const HttpEndpoint &endpoint, const std::string &body,
                     int timeout_seconds);

} // namespace guest
