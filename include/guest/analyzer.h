#pragma once

#include <guest/execution_supervisor.h>
#include <guest/interfaces.h>
#include <guest/logging.h>
#include <guest/models.h>
#include <guest/plugin_registry.h>

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace guest {

constexpr const char kDefaultConfigFile[] = "analysis.conf";
constexpr const char kDefaultStagingDirectory[] = "/data/local/tmp";
constexpr const char kDefaultResultsPath[] = "/data/local/tmp/results";

struct AnalyzerOptions {
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> agent_url;
  std::optional<std::filesystem::path> staging_directory;
  std::optional<std::filesystem::path> results_directory;
  std::optional<std::string> package;
  std::optional<int> timeout;
  std::optional<LogLevel> log_level;
  bool list_plugins = false;
  bool show_help = false;
};

struct ConfigEntry {
  std::string key;
  std::string value;
};

void PrintUsage(std::ostream &stream);
AnalyzerOptions ParseAnalyzerArguments(const std::vector<std::string> &arguments);
LogLevel ParseLogLevel(const std::string &value);

std::optional<ConfigEntry> ParseConfigLine(std::string line);
bool ApplyConfigEntry(const ConfigEntry &entry, AnalysisConfig &config);
AnalysisConfig ParseAnalysisConfigFile(const std::filesystem::path &path,
                                       Logger &logger);
void ValidateAnalysisConfig(const AnalysisConfig &config);

AnalysisConfig LoadAnalysisConfig(const AnalyzerOptions &options,
                                  Logger &logger);

std::optional<std::string> ChoosePackage(const std::string &file_type,
                                         const std::string &file_name);
std::string ResolvePackageName(const AnalysisConfig &config, Logger &logger);

std::string StageTarget(const AnalysisConfig &config,
                        const std::filesystem::path &staging_directory,
                        Logger &logger);

class Analyzer {
public:
  using RegistryFactory =
      std::function<PluginRegistry(const AnalysisConfig &config)>;

  Analyzer(RegistryFactory registry_factory, PollTimer &timer,
           CompletionReporter &reporter, std::shared_ptr<Logger> logger);

  // Only a CompletionError from the reporter escapes.
  OutcomeRecord Run(const AnalyzerOptions &options);

private:
  struct RunContext {
    std::unique_ptr<PluginRegistry> registry;
    std::unique_ptr<ExecutionSupervisor> supervisor;
  };

  void Execute(const AnalyzerOptions &options, OutcomeRecord &outcome,
               RunContext &context);

  RegistryFactory registry_factory_;
  PollTimer *timer_;
  CompletionReporter *reporter_;
  std::shared_ptr<Logger> logger_;
};

PluginRegistry DefaultRegistryFor(const AnalysisConfig &config);

int RunAnalyzer(const std::vector<std::string> &arguments);

} // namespace guest
