#pragma once

#include <guest/fault_containment.h>
#include <guest/interfaces.h>
#include <guest/logging.h>
#include <guest/models.h>
#include <guest/plugin_registry.h>

#include <memory>
#include <string>
#include <vector>

namespace guest {

class ExecutionSupervisor {
public:
  ExecutionSupervisor(const PluginRegistry &registry, PollTimer &timer,
                      std::shared_ptr<Logger> logger);

  RunSummary Run(const AnalysisConfig &config, const std::string &package);

  // Hands the outcome to the reporter. Valid after Run() returned or threw.
  void Report(CompletionReporter &reporter, const OutcomeRecord &outcome);

  RunState State() const { return state_; }
  const std::vector<RunState> &Transitions() const { return transitions_; }

private:
  struct AuxiliarySlot {
    std::unique_ptr<AuxiliaryModule> module;
    PluginIdentity identity;
    bool started = false;
  };

  std::unique_ptr<AnalysisPackage> SelectPackage(const AnalysisConfig &config,
                                                 const std::string &package);
  void StartAuxiliaries();
  PluginIdentity StartPackage(AnalysisPackage &package,
                              const std::string &registered_name,
                              const std::string &target);
  RunSummary Poll(AnalysisPackage &package, const PluginIdentity &identity,
                  int timeout);
  void FinishPackage(AnalysisPackage &package, const PluginIdentity &identity);
  void StopAuxiliaries();
  std::vector<std::string> StartedAuxiliaryNames() const;
  void Transition(RunState next);

  const PluginRegistry *registry_;
  PollTimer *timer_;
  std::shared_ptr<Logger> logger_;
  FaultContainment containment_;
  std::vector<AuxiliarySlot> auxiliaries_;
  RunState state_ = RunState::kSelecting;
  std::vector<RunState> transitions_;
};

} // namespace guest
