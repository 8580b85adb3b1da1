#pragma once

#include <guest/models.h>

#include <initializer_list>
#include <string>

namespace guest {

enum class Capability : unsigned {
  kStart = 1u << 0,
  kCheck = 1u << 1,
  kFinish = 1u << 2,
  kStop = 1u << 3
};

std::string CapabilityName(Capability capability);

class CapabilitySet {
public:
  CapabilitySet() = default;
  CapabilitySet(std::initializer_list<Capability> capabilities) {
    for (const auto capability : capabilities) {
      Add(capability);
    }
  }

  CapabilitySet &Add(Capability capability) {
    bits_ |= static_cast<unsigned>(capability);
    return *this;
  }
  bool Has(Capability capability) const {
    return (bits_ & static_cast<unsigned>(capability)) != 0;
  }

private:
  unsigned bits_ = 0;
};

class AnalysisPackage {
public:
  virtual ~AnalysisPackage() = default;
  virtual std::string Name() const = 0;
  virtual CapabilitySet Capabilities() const = 0;

  virtual bool Start(const std::string &) { return false; }
  // Returning false asks the supervisor to end the analysis.
  virtual bool Check() { return true; }
  virtual void Finish() {}
};

class AuxiliaryModule {
public:
  virtual ~AuxiliaryModule() = default;
  virtual std::string Name() const = 0;
  virtual CapabilitySet Capabilities() const = 0;

  virtual void Start() {}
  virtual void Stop() {}
};

class CompletionReporter {
public:
  virtual ~CompletionReporter() = default;
  virtual void Complete(const OutcomeRecord &outcome) = 0;
};

class PollTimer {
public:
  virtual ~PollTimer() = default;
  virtual void Pause() = 0;
};

} // namespace guest
