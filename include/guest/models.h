#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace guest {

enum class Category { kFile, kUrl };

using OptionsMap = std::map<std::string, std::string>;

struct AnalysisConfig {
  Category category = Category::kFile;
  std::string target;
  std::string file_name;
  std::string file_type;
  std::optional<std::string> package;
  std::optional<std::string> options;
  int timeout = 0;
  std::string results_path;
  std::vector<std::string> stage_files;
};

struct OutcomeRecord {
  bool success = false;
  std::string error_message;
  std::string results_path;
};

enum class RunState {
  kSelecting,
  kStartingAuxiliaries,
  kDriverStarting,
  kPolling,
  kStopping,
  kReporting,
  kDone,
  kAborted
};

enum class Termination { kTimeout, kPackageRequested };

struct RunSummary {
  Termination termination = Termination::kTimeout;
  int iterations = 0;
  std::vector<std::string> started_auxiliaries;
};

std::string CategoryName(Category category);
std::string RunStateName(RunState state);

} // namespace guest
