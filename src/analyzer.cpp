#include <guest/analyzer.h>

#include <guest/cli_exit_codes.h>
#include <guest/completion_reporter.h>
#include <guest/errors.h>
#include <guest/interruption.h>
#include <guest/text.h>
#include <guest/xml_rpc.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using guest::AnalyzerOptions;
using guest::ConfigError;

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

int ParsePositiveInt(const std::string &value, const std::string &name) {
  const auto trimmed = guest::Trim(value);
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(trimmed, &consumed);
  } catch (const std::exception &) {
    throw ConfigError(name + " must be a positive integer, got '" + value +
                      "'");
  }
  if (consumed != trimmed.size() || parsed <= 0) {
    throw ConfigError(name + " must be a positive integer, got '" + value +
                      "'");
  }
  return parsed;
}

guest::Category ParseCategory(const std::string &value) {
  const auto normalized = guest::ToLower(guest::Trim(value));
  if (normalized == "file") {
    return guest::Category::kFile;
  }
  if (normalized == "url") {
    return guest::Category::kUrl;
  }
  throw ConfigError("Unknown analysis category: " + value +
                    " (expected file or url)");
}

std::vector<std::string> SplitList(const std::string &raw) {
  std::vector<std::string> values;
  for (auto value : guest::Split(raw, ',')) {
    value = guest::Trim(value);
    if (!value.empty()) {
      values.push_back(std::move(value));
    }
  }
  return values;
}

bool DispatchOption(const std::vector<std::string> &arguments,
                    std::size_t &index, AnalyzerOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--agent-url") {
    options.agent_url = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--staging-dir") {
    options.staging_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--results-dir") {
    options.results_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--package") {
    options.package = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--timeout") {
    options.timeout =
        ParsePositiveInt(RequireValue(arguments, index, argument), "--timeout");
    return true;
  }
  if (argument == "--log-level") {
    options.log_level =
        guest::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = guest::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = guest::LogLevel::kDebug;
    return true;
  }
  if (argument == "--list-plugins") {
    options.list_plugins = true;
    return true;
  }
  return false;
}

std::string YamlValueAsString(const YAML::Node &node, const std::string &key) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsSequence()) {
    std::string joined;
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw ConfigError("Config key '" + key + "' must be a list of strings");
      }
      if (!joined.empty()) {
        joined += ",";
      }
      joined += child.as<std::string>();
    }
    return joined;
  }
  if (node.IsNull()) {
    return "";
  }
  throw ConfigError("Config key '" + key + "' must be a scalar or a list");
}

std::vector<guest::ConfigEntry>
ReadYamlEntries(const std::filesystem::path &path) {
  YAML::Node loaded;
  try {
    loaded = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw ConfigError("Invalid YAML in " + path.string() + ": " +
                      error.what());
  }
  const YAML::Node &root = loaded;
  if (!root.IsMap()) {
    throw ConfigError("Config file must contain a mapping at the root");
  }
  const auto section = root["analysis"] && root["analysis"].IsMap()
                           ? root["analysis"]
                           : root;

  std::vector<guest::ConfigEntry> entries;
  for (const auto &entry : section) {
    const auto key = entry.first.as<std::string>();
    entries.push_back({key, YamlValueAsString(entry.second, key)});
  }
  return entries;
}

std::vector<guest::ConfigEntry>
ReadLineEntries(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw ConfigError("Failed to open config file: " + path.string());
  }
  std::vector<guest::ConfigEntry> entries;
  std::string line;
  while (std::getline(stream, line)) {
    if (auto entry = guest::ParseConfigLine(line)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

bool ContainsAny(const std::string &haystack,
                 const std::vector<std::string> &needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const auto &needle) {
    return haystack.find(needle) != std::string::npos;
  });
}

void CopyInto(const std::filesystem::path &source,
              const std::filesystem::path &destination) {
  try {
    std::filesystem::copy_file(
        source, destination,
        std::filesystem::copy_options::overwrite_existing);
  } catch (const std::filesystem::filesystem_error &error) {
    throw guest::AnalysisError("Unable to stage " + source.string() + " to " +
                               destination.string() + ": " + error.what());
  }
}

} // namespace

namespace guest {

void PrintUsage(std::ostream &stream) {
  stream << "Usage: guest-analyzer [options]\n"
         << "Options:\n"
         << "  --config <file>       Analysis configuration (default: "
         << kDefaultConfigFile << ")\n"
         << "  --agent-url <url>     Agent XML-RPC endpoint (default: "
         << kDefaultAgentUrl << ")\n"
         << "  --staging-dir <path>  Where file targets are staged (default: "
         << kDefaultStagingDirectory << ")\n"
         << "  --results-dir <path>  Results directory reported to the host\n"
         << "  --package <name>      Analysis package to run\n"
         << "  --timeout <seconds>   Analysis timeout\n"
         << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
         << "  --verbose             Shortcut for --log-level info\n"
         << "  --debug               Shortcut for --log-level debug\n"
         << "  --list-plugins        List registered packages and modules\n"
         << "  --help                Show this message\n";
}

AnalyzerOptions
ParseAnalyzerArguments(const std::vector<std::string> &arguments) {
  AnalyzerOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

LogLevel ParseLogLevel(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "error") {
    return LogLevel::kError;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::kWarn;
  }
  if (normalized == "info") {
    return LogLevel::kInfo;
  }
  if (normalized == "debug") {
    return LogLevel::kDebug;
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

std::optional<ConfigEntry> ParseConfigLine(std::string line) {
  line = Trim(line);
  if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
    return std::nullopt;
  }
  const auto separator = line.find('=');
  if (separator == std::string::npos) {
    throw ConfigError("Malformed config line (expected key = value): " +
                      line);
  }
  ConfigEntry entry;
  entry.key = ToLower(Trim(line.substr(0, separator)));
  entry.value = Trim(line.substr(separator + 1));
  if (entry.key.empty()) {
    throw ConfigError("Malformed config line (empty key): " + line);
  }
  return entry;
}

bool ApplyConfigEntry(const ConfigEntry &entry, AnalysisConfig &config) {
  const auto key = ToLower(Trim(entry.key));
  const auto &value = entry.value;
  if (key == "category") {
    config.category = ParseCategory(value);
    return true;
  }
  if (key == "target") {
    config.target = value;
    return true;
  }
  if (key == "file_name") {
    config.file_name = value;
    return true;
  }
  if (key == "file_type") {
    config.file_type = value;
    return true;
  }
  if (key == "package") {
    config.package =
        value.empty() ? std::nullopt : std::optional<std::string>(value);
    return true;
  }
  if (key == "options") {
    config.options =
        value.empty() ? std::nullopt : std::optional<std::string>(value);
    return true;
  }
  if (key == "timeout") {
    config.timeout = ParsePositiveInt(value, "timeout");
    return true;
  }
  if (key == "results_path") {
    config.results_path = value;
    return true;
  }
  if (key == "stage_files") {
    config.stage_files = SplitList(value);
    return true;
  }
  return false;
}

AnalysisConfig ParseAnalysisConfigFile(const std::filesystem::path &path,
                                       Logger &logger) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  const auto entries = extension == ".yml" || extension == ".yaml"
                           ? ReadYamlEntries(path)
                           : ReadLineEntries(path);

  AnalysisConfig config;
  for (const auto &entry : entries) {
    if (!ApplyConfigEntry(entry, config)) {
      logger.Log(LogLevel::kDebug, "config.key.ignored",
                 {{"key", entry.key}, {"path", path.string()}});
    }
  }
  logger.Log(LogLevel::kDebug, "config.loaded",
             {{"path", path.string()},
              {"entries", std::to_string(entries.size())}});
  return config;
}

void ValidateAnalysisConfig(const AnalysisConfig &config) {
  if (config.timeout <= 0) {
    throw ConfigError("timeout must be a positive integer");
  }
  if (config.category == Category::kFile && config.file_name.empty()) {
    throw ConfigError("file_name is required for file analyses");
  }
  if (config.category == Category::kUrl && config.target.empty()) {
    throw ConfigError("target is required for url analyses");
  }
}

AnalysisConfig LoadAnalysisConfig(const AnalyzerOptions &options,
                                  Logger &logger) {
  auto config = ParseAnalysisConfigFile(
      options.config_file.value_or(kDefaultConfigFile), logger);
  if (options.package) {
    config.package = *options.package;
  }
  if (options.timeout) {
    config.timeout = *options.timeout;
  }
  if (options.results_directory) {
    config.results_path = options.results_directory->string();
  }
  if (config.results_path.empty()) {
    config.results_path = kDefaultResultsPath;
  }
  ValidateAnalysisConfig(config);
  return config;
}

std::optional<std::string> ChoosePackage(const std::string &file_type,
                                         const std::string &file_name) {
  const auto type = ToLower(file_type);
  const auto extension =
      ToLower(std::filesystem::path(file_name).extension().string());

  if (extension == ".apk" ||
      ContainsAny(type, {"android", "dalvik", "java archive"})) {
    return std::string("apk");
  }
  if (extension == ".sh" || extension == ".elf" || extension == ".bin" ||
      ContainsAny(type, {"elf", "shell script"})) {
    return std::string("exec");
  }
  return std::nullopt;
}

std::string ResolvePackageName(const AnalysisConfig &config, Logger &logger) {
  if (config.package && !config.package->empty()) {
    return *config.package;
  }

  logger.Log(LogLevel::kInfo, "package.autodetect",
             {{"category", CategoryName(config.category)}});
  std::string package = "default_browser";
  if (config.category == Category::kFile) {
    const auto chosen = ChoosePackage(config.file_type, config.file_name);
    if (!chosen) {
      throw AnalysisError("No valid package available for file type: " +
                          config.file_type);
    }
    package = *chosen;
  }
  logger.Log(LogLevel::kInfo, "package.autoselected", {{"package", package}});
  return package;
}

std::string StageTarget(const AnalysisConfig &config,
                        const std::filesystem::path &staging_directory,
                        Logger &logger) {
  if (config.category == Category::kUrl) {
    return config.target;
  }
  if (config.file_name.empty()) {
    throw ConfigError("file_name is required for file analyses");
  }

  std::filesystem::create_directories(staging_directory);
  const auto staged = staging_directory / config.file_name;
  if (!config.target.empty() && std::filesystem::exists(config.target)) {
    const bool same_file = std::filesystem::exists(staged) &&
                           std::filesystem::equivalent(config.target, staged);
    if (!same_file) {
      CopyInto(config.target, staged);
    }
  }
  for (const auto &support_file : config.stage_files) {
    const std::filesystem::path source(support_file);
    CopyInto(source, staging_directory / source.filename());
  }

  logger.Log(LogLevel::kInfo, "target.staged",
             {{"target", staged.string()},
              {"support_files", std::to_string(config.stage_files.size())}});
  return staged.string();
}

Analyzer::Analyzer(RegistryFactory registry_factory, PollTimer &timer,
                   CompletionReporter &reporter, std::shared_ptr<Logger> logger)
    : registry_factory_(std::move(registry_factory)), timer_(&timer),
      reporter_(&reporter), logger_(EnsureLogger(std::move(logger))) {}

OutcomeRecord Analyzer::Run(const AnalyzerOptions &options) {
  OutcomeRecord outcome;
  outcome.results_path = options.results_directory
                             ? options.results_directory->string()
                             : std::string(kDefaultResultsPath);
  RunContext context;
  try {
    Execute(options, outcome, context);
    outcome.success = true;
  } catch (const std::exception &error) {
    outcome.error_message = error.what();
    logger_->Log(LogLevel::kError, "analysis.failed",
                 {{"error", outcome.error_message}});
  } catch (...) {
    outcome.error_message = "Unknown error during analysis";
    logger_->Log(LogLevel::kError, "analysis.failed",
                 {{"error", outcome.error_message}});
  }

  if (context.supervisor) {
    context.supervisor->Report(*reporter_, outcome);
  } else {
    reporter_->Complete(outcome);
  }
  return outcome;
}

void Analyzer::Execute(const AnalyzerOptions &options, OutcomeRecord &outcome,
                       RunContext &context) {
  std::error_code cwd_error;
  logger_->Log(LogLevel::kInfo, "analyzer.start",
               {{"cwd", std::filesystem::current_path(cwd_error).string()}});

  auto config = LoadAnalysisConfig(options, *logger_);
  outcome.results_path = config.results_path;
  config.target = StageTarget(
      config, options.staging_directory.value_or(kDefaultStagingDirectory),
      *logger_);
  logger_->Log(LogLevel::kInfo, "analysis.target",
               {{"category", CategoryName(config.category)},
                {"target", config.target},
                {"results_path", config.results_path}});

  const auto package = ResolvePackageName(config, *logger_);
  context.registry = std::make_unique<PluginRegistry>(registry_factory_(config));
  context.supervisor =
      std::make_unique<ExecutionSupervisor>(*context.registry, *timer_, logger_);
  const auto summary = context.supervisor->Run(config, package);

  logger_->Log(LogLevel::kInfo, "analysis.completed",
               {{"termination", summary.termination == Termination::kTimeout
                                    ? "timeout"
                                    : "package_requested"},
                {"iterations", std::to_string(summary.iterations)},
                {"auxiliaries",
                 std::to_string(summary.started_auxiliaries.size())}});
}

PluginRegistry DefaultRegistryFor(const AnalysisConfig &config) {
  return MakePluginRegistryWithDefaults(
      BuiltinPluginSettings{config.results_path});
}

namespace {

std::optional<std::string> FlagValue(const std::vector<std::string> &arguments,
                                     const std::string &flag) {
  std::optional<std::string> value;
  for (std::size_t i = 0; i + 1 < arguments.size(); ++i) {
    if (arguments[i] == flag) {
      value = arguments[++i];
    }
  }
  return value;
}

// Tells the agent the run failed on its command line. Nothing is sent when
// the agent URL itself does not parse.
void ReportUsageError(const std::vector<std::string> &arguments,
                      const std::string &error) {
  auto logger = MakeLogger(LoggingConfig{}, std::clog);
  OutcomeRecord outcome;
  outcome.error_message = "Invalid command line: " + error;
  outcome.results_path =
      FlagValue(arguments, "--results-dir").value_or(kDefaultResultsPath);
  logger->Log(LogLevel::kError, "analysis.failed",
              {{"error", outcome.error_message}});

  HttpEndpoint endpoint;
  try {
    endpoint = ParseHttpEndpoint(
        FlagValue(arguments, "--agent-url").value_or(kDefaultAgentUrl));
  } catch (const std::invalid_argument &url_error) {
    logger->Log(LogLevel::kError, "completion.skipped",
                {{"error", url_error.what()}});
    return;
  }

  XmlRpcCompletionReporter reporter(endpoint, logger);
  try {
    reporter.Complete(outcome);
  } catch (const CompletionError &completion_error) {
    logger->Log(LogLevel::kError, "completion.failed",
                {{"error", completion_error.what()}});
  }
}

} // namespace

int RunAnalyzer(const std::vector<std::string> &arguments) {
  AnalyzerOptions options;
  try {
    options = ParseAnalyzerArguments(arguments);
  } catch (const std::invalid_argument &error) {
    std::cerr << "Error: " << error.what() << "\n";
    PrintUsage(std::cerr);
    ReportUsageError(arguments, error.what());
    return kExitUsageError;
  }
  if (options.show_help) {
    PrintUsage(std::cout);
    return 0;
  }
  if (options.list_plugins) {
    const auto registry = MakePluginRegistryWithDefaults(
        BuiltinPluginSettings{kDefaultResultsPath});
    std::cout << "Packages:\n";
    for (const auto &name : registry.PackageNames()) {
      std::cout << "  " << name << "\n";
    }
    std::cout << "Auxiliary modules:\n";
    for (const auto &name : registry.AuxiliaryNames()) {
      std::cout << "  " << name << "\n";
    }
    return 0;
  }

  const auto endpoint =
      ParseHttpEndpoint(options.agent_url.value_or(kDefaultAgentUrl));
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kInfo);
  auto logger = MakeLogger(logging, std::clog);

  InstallInterruptHandlers();
  SleepingPollTimer timer;
  XmlRpcCompletionReporter reporter(endpoint, logger);
  Analyzer analyzer(DefaultRegistryFor, timer, reporter, logger);
  try {
    return OutcomeExitCode(analyzer.Run(options));
  } catch (const CompletionError &error) {
    logger->Log(LogLevel::kError, "completion.failed",
                {{"error", error.what()}});
    return kExitReportFailed;
  }
}

} // namespace guest
