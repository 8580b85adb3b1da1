#include <guest/completion_reporter.h>

#include <guest/errors.h>

#include <utility>

namespace guest {

XmlRpcCompletionReporter::XmlRpcCompletionReporter(
    HttpEndpoint endpoint, std::shared_ptr<Logger> logger, int timeout_seconds)
    : endpoint_(std::move(endpoint)), logger_(EnsureLogger(std::move(logger))),
      timeout_seconds_(timeout_seconds) {}

void XmlRpcCompletionReporter::Complete(const OutcomeRecord &outcome) {
  logger_->Log(LogLevel::kInfo, "completion.send",
               {{"host", endpoint_.host},
                {"port", endpoint_.port},
                {"success", outcome.success ? "true" : "false"},
                {"results_path", outcome.results_path}});

  const auto body = BuildMethodCall(
      "complete", {outcome.success, outcome.error_message, outcome.results_path});
  const auto response = PostXml(endpoint_, body, timeout_seconds_);
  if (response.status < 200 || response.status >= 300) {
    throw CompletionError("Agent rejected completion call with HTTP status " +
                          std::to_string(response.status));
  }
  if (const auto fault = ExtractFault(response.body)) {
    throw CompletionError("Agent returned a fault for completion call: " +
                          *fault);
  }

  logger_->Log(LogLevel::kDebug, "completion.delivered",
               {{"status", std::to_string(response.status)}});
}

} // namespace guest
