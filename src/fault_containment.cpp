#include <guest/fault_containment.h>

#include <utility>

namespace guest {

std::string CapabilityName(Capability capability) {
  switch (capability) {
  case Capability::kStart:
    return "start";
  case Capability::kCheck:
    return "check";
  case Capability::kFinish:
    return "finish";
  case Capability::kStop:
    return "stop";
  }
  return "unknown";
}

std::string PluginKindName(PluginKind kind) {
  switch (kind) {
  case PluginKind::kPackage:
    return "package";
  case PluginKind::kAuxiliary:
    return "auxiliary module";
  }
  return "plugin";
}

namespace {

std::string EscalationMessage(const PluginCall &call,
                              const CallResult &result) {
  const auto subject = "The " + PluginKindName(call.kind) + " \"" +
                       call.plugin + "\"";
  const auto callback = CapabilityName(call.callback);
  if (result.outcome == CallOutcome::kNotImplemented) {
    return subject + " doesn't contain a " + callback + " function.";
  }
  if (result.fault_kind == FaultKind::kOperational) {
    return subject + " " + callback +
           " function raised an error: " + result.fault;
  }
  return subject + " " + callback +
         " function encountered an unhandled exception: " + result.fault;
}

} // namespace

FaultContainment::FaultContainment(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

CallResult FaultContainment::Settle(const PluginCall &call, CallResult result,
                                    FaultPolicy policy) const {
  LogFields fields = {{"kind", PluginKindName(call.kind)},
                      {"plugin", call.plugin},
                      {"callback", CapabilityName(call.callback)}};
  if (result.outcome == CallOutcome::kNotImplemented) {
    logger_->Log(LogLevel::kWarn, "plugin.callback.not_implemented",
                 std::move(fields));
  } else {
    fields.emplace_back("fault", result.fault_kind == FaultKind::kOperational
                                     ? "operational"
                                     : "unexpected");
    fields.emplace_back("error", result.fault);
    logger_->Log(LogLevel::kWarn, "plugin.callback.fault", std::move(fields));
  }

  if (policy == FaultPolicy::kEscalate) {
    throw AnalysisError(EscalationMessage(call, result));
  }
  return result;
}

void FaultContainment::Unidentified(PluginKind kind, const std::string &label,
                                    const std::string &error) const {
  logger_->Log(LogLevel::kWarn, "plugin.identity.fault",
               {{"kind", PluginKindName(kind)},
                {"plugin", label},
                {"error", error}});
}

} // namespace guest
