#pragma once

#include <guest/interfaces.h>
#include <guest/logging.h>
#include <guest/xml_rpc.h>

#include <memory>

namespace guest {

class XmlRpcCompletionReporter : public CompletionReporter {
public:
  XmlRpcCompletionReporter(HttpEndpoint endpoint,
                           std::shared_ptr<Logger> logger = nullptr,
                           int timeout_seconds = 30);

  void Complete(const OutcomeRecord &outcome) override;

private:
  HttpEndpoint endpoint_;
  std::shared_ptr<Logger> logger_;
  int timeout_seconds_;
};

} // namespace guest
