#include <guest/execution_supervisor.h>

#include <guest/errors.h>
#include <guest/interruption.h>
#include <guest/option_parser.h>

#include <utility>

namespace guest {

ExecutionSupervisor::ExecutionSupervisor(const PluginRegistry &registry,
                                         PollTimer &timer,
                                         std::shared_ptr<Logger> logger)
    : registry_(&registry), timer_(&timer),
      logger_(EnsureLogger(std::move(logger))), containment_(logger_) {}

RunSummary ExecutionSupervisor::Run(const AnalysisConfig &config,
                                    const std::string &package) {
  auxiliaries_.clear();
  transitions_.clear();
  state_ = RunState::kSelecting;
  transitions_.push_back(state_);

  try {
    if (config.timeout <= 0) {
      throw AnalysisError("Analysis timeout must be a positive number of "
                          "seconds, got " +
                          std::to_string(config.timeout));
    }
    auto instance = SelectPackage(config, package);

    Transition(RunState::kStartingAuxiliaries);
    StartAuxiliaries();

    Transition(RunState::kDriverStarting);
    const auto identity = StartPackage(*instance, package, config.target);

    Transition(RunState::kPolling);
    auto summary = Poll(*instance, identity, config.timeout);
    summary.started_auxiliaries = StartedAuxiliaryNames();
    // A signal that arrived outside a pause has not been seen yet.
    if (InterruptRequested()) {
      throw InterruptedError();
    }

    Transition(RunState::kStopping);
    FinishPackage(*instance, identity);
    StopAuxiliaries();
    return summary;
  } catch (...) {
    StopAuxiliaries();
    Transition(RunState::kAborted);
    throw;
  }
}

void ExecutionSupervisor::Report(CompletionReporter &reporter,
                                 const OutcomeRecord &outcome) {
  Transition(RunState::kReporting);
  reporter.Complete(outcome);
  Transition(RunState::kDone);
}

std::unique_ptr<AnalysisPackage>
ExecutionSupervisor::SelectPackage(const AnalysisConfig &config,
                                   const std::string &package) {
  const auto options = ParseOptions(config.options.value_or(""), *logger_);
  auto instance = registry_->CreatePackage(package, options);
  logger_->Log(LogLevel::kInfo, "package.selected",
               {{"package", package},
                {"options", std::to_string(options.size())}});
  return instance;
}

void ExecutionSupervisor::StartAuxiliaries() {
  for (auto &module : registry_->CreateAuxiliaries(*logger_)) {
    auto identity =
        containment_.Identify(PluginKind::kAuxiliary, "<unnamed>", *module);
    if (!identity) {
      continue;
    }
    const auto result = containment_.Invoke(
        {PluginKind::kAuxiliary, identity->name, Capability::kStart},
        identity->capabilities, FaultPolicy::kContain,
        [&module]() { module->Start(); });
    if (result.Completed()) {
      logger_->Log(LogLevel::kInfo, "auxiliary.started",
                   {{"module", identity->name}});
    }
    auxiliaries_.push_back(AuxiliarySlot{
        std::move(module), std::move(*identity), result.Completed()});
  }
}

PluginIdentity
ExecutionSupervisor::StartPackage(AnalysisPackage &package,
                                  const std::string &registered_name,
                                  const std::string &target) {
  auto identity =
      containment_.Identify(PluginKind::kPackage, registered_name, package);
  if (!identity) {
    throw AnalysisError("The package \"" + registered_name +
                        "\" could not report its name and capabilities.");
  }

  bool started = false;
  containment_.Invoke({PluginKind::kPackage, identity->name, Capability::kStart},
                      identity->capabilities, FaultPolicy::kEscalate,
                      [&]() { started = package.Start(target); });
  logger_->Log(LogLevel::kInfo, "package.started",
               {{"package", identity->name},
                {"target", target},
                {"result", started ? "true" : "false"}});
  return std::move(*identity);
}

RunSummary ExecutionSupervisor::Poll(AnalysisPackage &package,
                                     const PluginIdentity &identity,
                                     int timeout) {
  const PluginCall check{PluginKind::kPackage, identity.name,
                         Capability::kCheck};
  RunSummary summary;
  int iterations = 0;
  while (true) {
    if (iterations == timeout) {
      logger_->Log(LogLevel::kInfo, "analysis.timeout_hit",
                   {{"timeout", std::to_string(timeout)}});
      summary.termination = Termination::kTimeout;
      break;
    }
    ++iterations;

    // A faulting check counts as "keep going".
    bool keep_running = true;
    containment_.Invoke(check, identity.capabilities, FaultPolicy::kContain,
                        [&]() { keep_running = package.Check(); });
    if (!keep_running) {
      logger_->Log(LogLevel::kInfo, "package.requested_termination",
                   {{"package", identity.name},
                    {"iteration", std::to_string(iterations)}});
      summary.termination = Termination::kPackageRequested;
      break;
    }
    timer_->Pause();
  }
  summary.iterations = iterations;
  return summary;
}

void ExecutionSupervisor::FinishPackage(AnalysisPackage &package,
                                        const PluginIdentity &identity) {
  containment_.Invoke({PluginKind::kPackage, identity.name, Capability::kFinish},
                      identity.capabilities, FaultPolicy::kContain,
                      [&package]() { package.Finish(); });
}

void ExecutionSupervisor::StopAuxiliaries() {
  for (auto &slot : auxiliaries_) {
    if (!slot.started) {
      continue;
    }
    slot.started = false;
    const auto &name = slot.identity.name;
    const auto result = containment_.Invoke(
        {PluginKind::kAuxiliary, name, Capability::kStop},
        slot.identity.capabilities, FaultPolicy::kContain,
        [&slot]() { slot.module->Stop(); });
    if (result.Completed()) {
      logger_->Log(LogLevel::kDebug, "auxiliary.stopped", {{"module", name}});
    }
  }
}

std::vector<std::string> ExecutionSupervisor::StartedAuxiliaryNames() const {
  std::vector<std::string> names;
  for (const auto &slot : auxiliaries_) {
    if (slot.started) {
      names.push_back(slot.identity.name);
    }
  }
  return names;
}

void ExecutionSupervisor::Transition(RunState next) {
  logger_->Log(LogLevel::kDebug, "supervisor.state",
               {{"from", RunStateName(state_)}, {"to", RunStateName(next)}});
  state_ = next;
  transitions_.push_back(next);
}

} // namespace guest
