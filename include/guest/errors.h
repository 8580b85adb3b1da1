#pragma once

#include <stdexcept>
#include <string>

namespace guest {

class AnalysisError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class PluginNotFoundError : public AnalysisError {
public:
  using AnalysisError::AnalysisError;
};

// A registered factory produced no instance.
class PluginSelectionError : public AnalysisError {
public:
  using AnalysisError::AnalysisError;
};

class PluginCollisionError : public AnalysisError {
public:
  using AnalysisError::AnalysisError;
};

class PackageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class CompletionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InterruptedError : public std::runtime_error {
public:
  InterruptedError() : std::runtime_error("Keyboard Interrupt") {}
};

} // namespace guest
