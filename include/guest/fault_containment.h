#pragma once

#include <guest/errors.h>
#include <guest/interfaces.h>
#include <guest/logging.h>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace guest {

enum class PluginKind { kPackage, kAuxiliary };

enum class CallOutcome { kCompleted, kNotImplemented, kFaulted };

enum class FaultKind { kNone, kOperational, kUnexpected };

enum class FaultPolicy { kContain, kEscalate };

struct PluginCall {
  PluginKind kind = PluginKind::kPackage;
  std::string plugin;
  Capability callback = Capability::kStart;
};

struct CallResult {
  CallOutcome outcome = CallOutcome::kCompleted;
  FaultKind fault_kind = FaultKind::kNone;
  std::string fault;

  bool Completed() const { return outcome == CallOutcome::kCompleted; }
};

struct PluginIdentity {
  std::string name;
  CapabilitySet capabilities;
};

std::string PluginKindName(PluginKind kind);

class FaultContainment {
public:
  explicit FaultContainment(std::shared_ptr<Logger> logger);

  template <typename Callback>
  CallResult Invoke(const PluginCall &call, const CapabilitySet &capabilities,
                    FaultPolicy policy, Callback &&callback) const {
    if (!capabilities.Has(call.callback)) {
      return Settle(call, {CallOutcome::kNotImplemented, FaultKind::kNone, ""},
                    policy);
    }
    try {
      std::forward<Callback>(callback)();
      return CallResult{};
    } catch (const PackageError &error) {
      return Settle(
          call, {CallOutcome::kFaulted, FaultKind::kOperational, error.what()},
          policy);
    } catch (const std::exception &error) {
      return Settle(
          call, {CallOutcome::kFaulted, FaultKind::kUnexpected, error.what()},
          policy);
    } catch (...) {
      return Settle(call,
                    {CallOutcome::kFaulted, FaultKind::kUnexpected,
                     "non-standard exception"},
                    policy);
    }
  }

  template <typename Plugin>
  std::optional<PluginIdentity> Identify(PluginKind kind,
                                         const std::string &label,
                                         const Plugin &plugin) const {
    try {
      return PluginIdentity{plugin.Name(), plugin.Capabilities()};
    } catch (const std::exception &error) {
      Unidentified(kind, label, error.what());
    } catch (...) {
      Unidentified(kind, label, "non-standard exception");
    }
    return std::nullopt;
  }

private:
  // Logs the failed call; throws AnalysisError under FaultPolicy::kEscalate.
  CallResult Settle(const PluginCall &call, CallResult result,
                    FaultPolicy policy) const;
  void Unidentified(PluginKind kind, const std::string &label,
                    const std::string &error) const;

  std::shared_ptr<Logger> logger_;
};

} // namespace guest
