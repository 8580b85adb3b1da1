#pragma once

#include <guest/interfaces.h>
#include <guest/logging.h>
#include <guest/models.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace guest {

class PluginRegistry {
public:
  using PackageFactory =
      std::function<std::unique_ptr<AnalysisPackage>(const OptionsMap &)>;
  using AuxiliaryFactory = std::function<std::unique_ptr<AuxiliaryModule>()>;

  void RegisterPackage(const std::string &name, PackageFactory factory);
  void RegisterAuxiliary(const std::string &name, AuxiliaryFactory factory);

  std::unique_ptr<AnalysisPackage>
  CreatePackage(const std::string &name, const OptionsMap &options) const;

  // Best effort: modules whose factory fails are skipped with a warning.
  std::vector<std::unique_ptr<AuxiliaryModule>>
  CreateAuxiliaries(Logger &logger) const;

  bool HasPackage(const std::string &name) const;
  std::vector<std::string> PackageNames() const;
  std::vector<std::string> AuxiliaryNames() const;

  template <typename Factory> struct PluginSet {
    std::unordered_map<std::string, Factory> factories;
  };

private:
  template <typename Factory>
  static std::vector<std::string> RegisteredNames(const PluginSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const PluginSet<Factory> &set);

  template <typename Factory>
  static void RegisterPlugin(const std::string &name, Factory factory,
                             const std::string &kind, PluginSet<Factory> &set);

  PluginSet<PackageFactory> packages_;
  PluginSet<AuxiliaryFactory> auxiliaries_;
};

struct BuiltinPluginSettings {
  std::filesystem::path results_path;
};

PluginRegistry
MakePluginRegistryWithDefaults(const BuiltinPluginSettings &settings);

} // namespace guest
