#pragma once

#include <guest/child_process.h>
#include <guest/interfaces.h>
#include <guest/models.h>
#include <guest/plugin_registry.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace guest {

class ExecPackage : public AnalysisPackage {
public:
  explicit ExecPackage(OptionsMap options);

  std::string Name() const override { return "exec"; }
  CapabilitySet Capabilities() const override;
  bool Start(const std::string &target) override;
  bool Check() override;
  void Finish() override;

private:
  OptionsMap options_;
  std::chrono::milliseconds kill_timeout_;
  ChildProcess process_;
};

class ApkPackage : public AnalysisPackage {
public:
  explicit ApkPackage(OptionsMap options);

  std::string Name() const override { return "apk"; }
  CapabilitySet Capabilities() const override;
  bool Start(const std::string &target) override;
  void Finish() override;

private:
  std::string Tool(const std::string &name) const;

  OptionsMap options_;
  std::string app_;
};

class DefaultBrowserPackage : public AnalysisPackage {
public:
  explicit DefaultBrowserPackage(OptionsMap options);

  std::string Name() const override { return "default_browser"; }
  CapabilitySet Capabilities() const override;
  bool Start(const std::string &target) override;

private:
  OptionsMap options_;
};

// Runs a command for the duration of the analysis and keeps its output.
class CommandCaptureAuxiliary : public AuxiliaryModule {
public:
  CommandCaptureAuxiliary(std::string name, std::vector<std::string> command,
                          std::filesystem::path output_path);

  std::string Name() const override { return name_; }
  CapabilitySet Capabilities() const override;
  void Start() override;
  void Stop() override;

private:
  std::string name_;
  std::vector<std::string> command_;
  std::filesystem::path output_path_;
  ChildProcess process_;
};

void RegisterBuiltinPlugins(PluginRegistry &registry,
                            const BuiltinPluginSettings &settings);

} // namespace guest
