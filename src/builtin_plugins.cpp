#include <guest/builtin_plugins.h>

#include <guest/errors.h>
#include <guest/text.h>

#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace guest {

namespace {

constexpr auto kDefaultKillTimeout = std::chrono::seconds(5);
constexpr auto kCaptureStopGrace = std::chrono::seconds(2);
constexpr const char kDefaultBrowserCommand[] =
    "am start -a android.intent.action.VIEW -d";
constexpr const char kLauncherCategory[] = "android.intent.category.LAUNCHER";

std::string OptionOr(const OptionsMap &options, const std::string &key,
                     const std::string &fallback) {
  const auto found = options.find(key);
  if (found == options.end() || found->second.empty()) {
    return fallback;
  }
  return found->second;
}

std::chrono::milliseconds KillTimeout(const OptionsMap &options) {
  const auto raw = OptionOr(options, "kill_timeout", "");
  if (raw.empty()) {
    return kDefaultKillTimeout;
  }
  const auto error = PackageError(
      "Option kill_timeout must be a positive number of seconds, got '" + raw +
      "'");
  std::size_t consumed = 0;
  int seconds = 0;
  try {
    seconds = std::stoi(raw, &consumed);
  } catch (const std::exception &) {
    throw error;
  }
  if (consumed != raw.size() || seconds <= 0) {
    throw error;
  }
  return std::chrono::seconds(seconds);
}

void RunOrThrow(const std::vector<std::string> &command,
                const std::string &action) {
  int exit_code = 0;
  try {
    exit_code = RunCommand(command);
  } catch (const std::system_error &error) {
    throw PackageError("Unable to " + action + ": " + error.what());
  }
  if (exit_code != 0) {
    throw PackageError("Unable to " + action + ": " + command.front() +
                       " exited with status " + std::to_string(exit_code));
  }
}

} // namespace

ExecPackage::ExecPackage(OptionsMap options)
    : options_(std::move(options)), kill_timeout_(KillTimeout(options_)) {}

CapabilitySet ExecPackage::Capabilities() const {
  return {Capability::kStart, Capability::kCheck, Capability::kFinish};
}

bool ExecPackage::Start(const std::string &target) {
  std::vector<std::string> command{target};
  for (auto &argument : SplitWhitespace(OptionOr(options_, "arguments", ""))) {
    command.push_back(std::move(argument));
  }
  try {
    process_ = ChildProcess::Spawn(command);
  } catch (const std::system_error &error) {
    throw PackageError(error.what());
  }
  return true;
}

bool ExecPackage::Check() { return process_.IsRunning(); }

void ExecPackage::Finish() { process_.Terminate(kill_timeout_); }

ApkPackage::ApkPackage(OptionsMap options)
    : options_(std::move(options)), app_(OptionOr(options_, "app", "")) {}

CapabilitySet ApkPackage::Capabilities() const {
  return {Capability::kStart, Capability::kCheck, Capability::kFinish};
}

std::string ApkPackage::Tool(const std::string &name) const {
  return OptionOr(options_, name, name);
}

bool ApkPackage::Start(const std::string &target) {
  if (app_.empty()) {
    throw PackageError("Option 'app' with the application package name is "
                       "required");
  }
  RunOrThrow({Tool("pm"), "install", "-r", target}, "install " + target);
  RunOrThrow({Tool("monkey"), "-p", app_, "-c", kLauncherCategory, "1"},
             "launch " + app_);
  return true;
}

void ApkPackage::Finish() {
  RunOrThrow({Tool("am"), "force-stop", app_}, "stop " + app_);
}

DefaultBrowserPackage::DefaultBrowserPackage(OptionsMap options)
    : options_(std::move(options)) {}

CapabilitySet DefaultBrowserPackage::Capabilities() const {
  return {Capability::kStart, Capability::kCheck};
}

bool DefaultBrowserPackage::Start(const std::string &target) {
  auto command =
      SplitWhitespace(OptionOr(options_, "browser", kDefaultBrowserCommand));
  command.push_back(target);
  RunOrThrow(command, "open " + target);
  return true;
}

CommandCaptureAuxiliary::CommandCaptureAuxiliary(
    std::string name, std::vector<std::string> command,
    std::filesystem::path output_path)
    : name_(std::move(name)), command_(std::move(command)),
      output_path_(std::move(output_path)) {}

CapabilitySet CommandCaptureAuxiliary::Capabilities() const {
  return {Capability::kStart, Capability::kStop};
}

void CommandCaptureAuxiliary::Start() {
  if (output_path_.has_parent_path()) {
    std::filesystem::create_directories(output_path_.parent_path());
  }
  process_ = ChildProcess::Spawn(command_, output_path_);
}

void CommandCaptureAuxiliary::Stop() { process_.Terminate(kCaptureStopGrace); }

void RegisterBuiltinPlugins(PluginRegistry &registry,
                            const BuiltinPluginSettings &settings) {
  registry.RegisterPackage("exec", [](const OptionsMap &options) {
    return std::make_unique<ExecPackage>(options);
  });
  registry.RegisterPackage("apk", [](const OptionsMap &options) {
    return std::make_unique<ApkPackage>(options);
  });
  registry.RegisterPackage("default_browser", [](const OptionsMap &options) {
    return std::make_unique<DefaultBrowserPackage>(options);
  });

  const auto logcat_output = settings.results_path / "logs" / "logcat.log";
  registry.RegisterAuxiliary("logcat", [logcat_output]() {
    return std::make_unique<CommandCaptureAuxiliary>(
        "logcat", std::vector<std::string>{"logcat", "-v", "time"},
        logcat_output);
  });
}

} // namespace guest
