#include <guest/xml_rpc.h>

#include <guest/errors.h>
#include <guest/text.h>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <pugixml.hpp>

namespace guest {

namespace {

constexpr const char kScheme[] = "http://";

class FileDescriptor {
public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  FileDescriptor(FileDescriptor &&other) noexcept
      : fd_(std::exchange(other.fd_, -1)) {}

  FileDescriptor &operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  ~FileDescriptor() { reset(); }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  void reset(int new_fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = new_fd;
  }

private:
  int fd_{-1};
};

class AddressList {
public:
  AddressList(const std::string &host, const std::string &port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    const int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &head_);
    if (rc != 0) {
      throw CompletionError("Unable to resolve agent address " + host + ":" +
                            port + ": " + ::gai_strerror(rc));
    }
  }
  AddressList(const AddressList &) = delete;
  AddressList &operator=(const AddressList &) = delete;
  ~AddressList() {
    if (head_ != nullptr) {
      ::freeaddrinfo(head_);
    }
  }

  const addrinfo *head() const { return head_; }

private:
  addrinfo *head_ = nullptr;
};

std::string ErrnoText(int error) { return std::strerror(error); }

FileDescriptor Connect(const HttpEndpoint &endpoint, int timeout_seconds) {
  const AddressList addresses(endpoint.host, endpoint.port);
  int last_error = 0;
  for (const auto *address = addresses.head(); address != nullptr;
       address = address->ai_next) {
    FileDescriptor socket(::socket(address->ai_family, address->ai_socktype,
                                   address->ai_protocol));
    if (!socket) {
      last_error = errno;
      continue;
    }
    timeval timeout{};
    timeout.tv_sec = timeout_seconds;
    ::setsockopt(socket.get(), SOL_SOCKET, SO_RCVTIMEO, &timeout,
                 sizeof(timeout));
    ::setsockopt(socket.get(), SOL_SOCKET, SO_SNDTIMEO, &timeout,
                 sizeof(timeout));
    if (::connect(socket.get(), address->ai_addr, address->ai_addrlen) == 0) {
      return socket;
    }
    last_error = errno;
  }
  throw CompletionError("Unable to connect to agent at " + endpoint.host + ":" +
                        endpoint.port + ": " + ErrnoText(last_error));
}

void SendAll(int fd, const std::string &data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t rc =
        ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw CompletionError("Failed sending completion request: " +
                            ErrnoText(errno));
    }
    written += static_cast<std::size_t>(rc);
  }
}

std::string ReceiveAll(int fd) {
  std::string data;
  char buffer[4096];
  while (true) {
    const ssize_t rc = ::recv(fd, buffer, sizeof(buffer), 0);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw CompletionError("Failed reading agent response: " +
                            ErrnoText(errno));
    }
    if (rc == 0) {
      return data;
    }
    data.append(buffer, static_cast<std::size_t>(rc));
  }
}

struct StringWriter : pugi::xml_writer {
  std::string text;

  void write(const void *data, std::size_t size) override {
    text.append(static_cast<const char *>(data), size);
  }
};

void EncodeValue(pugi::xml_node value, const XmlRpcValue &param) {
  if (const auto *flag = std::get_if<bool>(&param)) {
    value.append_child("boolean").text().set(*flag ? "1" : "0");
  } else if (const auto *number = std::get_if<int>(&param)) {
    value.append_child("int").text().set(*number);
  } else {
    value.append_child("string").text().set(
        std::get<std::string>(param).c_str());
  }
}

// <value><string>x</string></value> and <value>x</value> are both strings.
std::string StringValue(pugi::xml_node value) {
  const auto typed = value.child("string");
  return typed ? typed.text().get() : value.text().get();
}

} // namespace

HttpEndpoint ParseHttpEndpoint(const std::string &url) {
  const auto trimmed = Trim(url);
  const std::string scheme(kScheme);
  if (ToLower(trimmed.substr(0, scheme.size())) != scheme) {
    throw std::invalid_argument("Agent URL must start with http://: " + url);
  }

  const auto rest = trimmed.substr(scheme.size());
  const auto slash = rest.find('/');
  const auto authority = rest.substr(0, slash);
  HttpEndpoint endpoint;
  endpoint.path = slash == std::string::npos ? "" : rest.substr(slash);
  if (endpoint.path.empty()) {
    endpoint.path = "/RPC2";
  }

  const auto colon = authority.rfind(':');
  if (colon == std::string::npos) {
    endpoint.host = authority;
    endpoint.port = "80";
  } else {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
  }
  if (endpoint.host.empty() || endpoint.port.empty()) {
    throw std::invalid_argument("Agent URL is missing host or port: " + url);
  }
  return endpoint;
}

std::string BuildMethodCall(const std::string &method,
                            const std::vector<XmlRpcValue> &params) {
  pugi::xml_document document;
  auto call = document.append_child("methodCall");
  call.append_child("methodName").text().set(method.c_str());
  auto list = call.append_child("params");
  for (const auto &param : params) {
    EncodeValue(list.append_child("param").append_child("value"), param);
  }

  StringWriter writer;
  document.save(writer, "", pugi::format_raw, pugi::encoding_utf8);
  return writer.text;
}

std::optional<std::string> ExtractFault(const std::string &body) {
  pugi::xml_document document;
  const auto parsed = document.load_buffer(body.data(), body.size());
  if (!parsed) {
    throw CompletionError(std::string("Malformed agent response body: ") +
                          parsed.description());
  }
  if (!document.select_node("/methodResponse/fault")) {
    return std::nullopt;
  }
  const auto message = document.select_node(
      "/methodResponse/fault/value/struct/member[name='faultString']/value");
  if (!message) {
    return std::string("XML-RPC fault");
  }
  return StringValue(message.node());
}

HttpResponse ParseHttpResponse(const std::string &raw) {
  const auto line_end = raw.find("\r\n");
  const auto status_line = raw.substr(0, line_end);
  std::istringstream status_stream(status_line);
  std::string version;
  HttpResponse response;
  if (!(status_stream >> version >> response.status) ||
      version.rfind("HTTP/", 0) != 0) {
    throw CompletionError("Malformed agent response: " + status_line);
  }

  const auto header_end = raw.find("\r\n\r\n");
  if (header_end != std::string::npos) {
    response.body = raw.substr(header_end + 4);
  }
  return response;
}

HttpResponse PostXml(const HttpEndpoint &endpoint, const std::string &body,
                     int timeout_seconds) {
  auto socket = Connect(endpoint, timeout_seconds);

  std::ostringstream request;
  request << "POST " << endpoint.path << " HTTP/1.0\r\n"
          << "Host: " << endpoint.host << ":" << endpoint.port << "\r\n"
          << "User-Agent: guest-analyzer\r\n"
          << "Content-Type: text/xml\r\n"
          << "Content-Length: " << body.size() << "\r\n"
          << "Connection: close\r\n\r\n"
          << body;
  SendAll(socket.get(), request.str());
  ::shutdown(socket.get(), SHUT_WR);
  return ParseHttpResponse(ReceiveAll(socket.get()));
}

} // namespace guest
