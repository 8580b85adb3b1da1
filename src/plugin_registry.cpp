#include <guest/plugin_registry.h>

#include <guest/builtin_plugins.h>
#include <guest/errors.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace guest {

template <typename Factory>
std::vector<std::string>
PluginRegistry::RegisteredNames(const PluginSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string PluginRegistry::JoinNames(const PluginSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
void PluginRegistry::RegisterPlugin(const std::string &name, Factory factory,
                                    const std::string &kind,
                                    PluginSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Plugin name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for " + kind + " '" + name +
                                "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw PluginCollisionError("The " + kind + " '" + name +
                               "' is already registered");
  }
  set.factories.emplace(name, std::move(factory));
}

void PluginRegistry::RegisterPackage(const std::string &name,
                                     PackageFactory factory) {
  RegisterPlugin(name, std::move(factory), "package", packages_);
}

void PluginRegistry::RegisterAuxiliary(const std::string &name,
                                       AuxiliaryFactory factory) {
  RegisterPlugin(name, std::move(factory), "auxiliary module", auxiliaries_);
}

std::unique_ptr<AnalysisPackage>
PluginRegistry::CreatePackage(const std::string &name,
                              const OptionsMap &options) const {
  const auto found = packages_.factories.find(name);
  if (found == packages_.factories.end()) {
    throw PluginNotFoundError("Unable to import package \"" + name +
                              "\", does not exist. Registered: " +
                              JoinNames(packages_));
  }
  std::unique_ptr<AnalysisPackage> instance;
  try {
    instance = found->second(options);
  } catch (const std::exception &error) {
    throw PluginSelectionError("Unable to initialize package \"" + name +
                               "\": " + error.what());
  }
  if (!instance) {
    throw PluginSelectionError("Unable to select package class (package=" +
                               name + "): factory returned no instance");
  }
  return instance;
}

std::vector<std::unique_ptr<AuxiliaryModule>>
PluginRegistry::CreateAuxiliaries(Logger &logger) const {
  std::vector<std::unique_ptr<AuxiliaryModule>> modules;
  for (const auto &name : RegisteredNames(auxiliaries_)) {
    const auto &factory = auxiliaries_.factories.at(name);
    try {
      auto module = factory();
      if (!module) {
        logger.Log(LogLevel::kWarn, "auxiliary.import.failed",
                   {{"module", name}, {"error", "factory returned null"}});
        continue;
      }
      modules.push_back(std::move(module));
    } catch (const std::exception &error) {
      logger.Log(LogLevel::kWarn, "auxiliary.import.failed",
                 {{"module", name}, {"error", error.what()}});
    }
  }
  return modules;
}

bool PluginRegistry::HasPackage(const std::string &name) const {
  return packages_.factories.count(name) != 0;
}

std::vector<std::string> PluginRegistry::PackageNames() const {
  return RegisteredNames(packages_);
}

std::vector<std::string> PluginRegistry::AuxiliaryNames() const {
  return RegisteredNames(auxiliaries_);
}

PluginRegistry
MakePluginRegistryWithDefaults(const BuiltinPluginSettings &settings) {
  PluginRegistry registry;
  RegisterBuiltinPlugins(registry, settings);
  return registry;
}

} // namespace guest
