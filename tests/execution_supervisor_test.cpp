#include <guest/errors.h>
#include <guest/execution_supervisor.h>

#include <guest/interruption.h>

#include <csignal>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fake_plugins.h"
#include "test_support/recording_logger.h"

namespace guest {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::Pair;
using test::Behavior;

const CapabilitySet kFullPackage{Capability::kStart, Capability::kCheck,
                                 Capability::kFinish};
const CapabilitySet kFullAuxiliary{Capability::kStart, Capability::kStop};

class ExecutionSupervisorTest : public ::testing::Test {
protected:
  void AddPackage(const std::string &name, CapabilitySet capabilities,
                  std::function<void(test::ScriptedPackage &)> configure = {}) {
    registry_.RegisterPackage(
        name, [this, name, capabilities, configure](const OptionsMap &options) {
          journal_->last_options = options;
          auto package = std::make_unique<test::ScriptedPackage>(
              name, capabilities, journal_);
          if (configure) {
            configure(*package);
          }
          return package;
        });
  }

  void AddAuxiliary(const std::string &name,
                    CapabilitySet capabilities = kFullAuxiliary,
                    Behavior start = Behavior::kSucceed,
                    Behavior stop = Behavior::kSucceed) {
    registry_.RegisterAuxiliary(name, [this, name, capabilities, start, stop]() {
      return std::make_unique<test::ScriptedAuxiliary>(name, capabilities,
                                                       journal_, start, stop);
    });
  }

  AnalysisConfig Config(int timeout = 3) const {
    AnalysisConfig config;
    config.category = Category::kFile;
    config.target = "/data/local/tmp/sample.bin";
    config.file_name = "sample.bin";
    config.timeout = timeout;
    return config;
  }

  ExecutionSupervisor MakeSupervisor() {
    return ExecutionSupervisor(registry_, timer_, logger_);
  }

  std::shared_ptr<test::PluginJournal> journal_ =
      std::make_shared<test::PluginJournal>();
  std::shared_ptr<test::RecordingLogger> logger_ =
      std::make_shared<test::RecordingLogger>();
  test::CountingPollTimer timer_;
  PluginRegistry registry_;
};

TEST_F(ExecutionSupervisorTest, RunsUntilTimeoutWithOneCheckPerPause) {
  AddPackage("sample", kFullPackage);
  AddAuxiliary("logcat");
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(3), "sample");

  EXPECT_EQ(summary.termination, Termination::kTimeout);
  EXPECT_EQ(summary.iterations, 3);
  EXPECT_EQ(timer_.pauses, 3);
  EXPECT_THAT(summary.started_auxiliaries, ElementsAre("logcat"));
  EXPECT_THAT(journal_->calls,
              ElementsAre("logcat.start", "sample.start", "sample.check",
                          "sample.check", "sample.check", "sample.finish",
                          "logcat.stop"));
  EXPECT_EQ(journal_->last_target, "/data/local/tmp/sample.bin");
  EXPECT_EQ(logger_->Count("analysis.timeout_hit"), 1u);
}

TEST_F(ExecutionSupervisorTest, WalksTheStatesInOrder) {
  AddPackage("sample", kFullPackage);
  auto supervisor = MakeSupervisor();
  test::RecordingReporter reporter;

  supervisor.Run(Config(1), "sample");
  supervisor.Report(reporter, OutcomeRecord{true, "", "/results"});

  EXPECT_THAT(supervisor.Transitions(),
              ElementsAre(RunState::kSelecting, RunState::kStartingAuxiliaries,
                          RunState::kDriverStarting, RunState::kPolling,
                          RunState::kStopping, RunState::kReporting,
                          RunState::kDone));
  EXPECT_EQ(supervisor.State(), RunState::kDone);
  ASSERT_EQ(reporter.outcomes.size(), 1u);
  EXPECT_TRUE(reporter.outcomes.front().success);
}

TEST_F(ExecutionSupervisorTest, StopsEarlyWhenPackageRequestsTermination) {
  AddPackage("sample", kFullPackage,
             [](test::ScriptedPackage &package) { package.stop_after = 2; });
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(10), "sample");

  EXPECT_EQ(summary.termination, Termination::kPackageRequested);
  EXPECT_EQ(summary.iterations, 2);
  EXPECT_EQ(timer_.pauses, 1);
  EXPECT_EQ(logger_->Count("package.requested_termination"), 1u);
  EXPECT_EQ(journal_->calls.back(), "sample.finish");
}

TEST_F(ExecutionSupervisorTest, FaultingCheckKeepsTheAnalysisRunning) {
  AddPackage("sample", kFullPackage, [](test::ScriptedPackage &package) {
    package.check = Behavior::kUnexpectedFault;
  });
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(4), "sample");

  EXPECT_EQ(summary.termination, Termination::kTimeout);
  EXPECT_EQ(summary.iterations, 4);
  EXPECT_EQ(logger_->Count("plugin.callback.fault"), 4u);
}

TEST_F(ExecutionSupervisorTest, MissingCheckCountsAsStillRunning) {
  AddPackage("sample", CapabilitySet{Capability::kStart});
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(2), "sample");

  EXPECT_EQ(summary.termination, Termination::kTimeout);
  EXPECT_THAT(journal_->calls, ElementsAre("sample.start"));
  // check (twice) and finish
  EXPECT_EQ(logger_->Count("plugin.callback.not_implemented"), 3u);
}

TEST_F(ExecutionSupervisorTest, PassesParsedOptionsToThePackage) {
  AddPackage("sample", kFullPackage);
  auto supervisor = MakeSupervisor();
  auto config = Config(1);
  config.options = "app=com.example, mode = fast,junk";

  supervisor.Run(config, "sample");

  EXPECT_THAT(journal_->last_options,
              ElementsAre(Pair("app", "com.example"), Pair("mode", "fast")));
  EXPECT_EQ(logger_->Count("options.malformed"), 1u);
}

TEST_F(ExecutionSupervisorTest, UnknownPackageAbortsBeforeAuxiliariesStart) {
  AddAuxiliary("logcat");
  auto supervisor = MakeSupervisor();

  EXPECT_THROW(supervisor.Run(Config(), "missing"), PluginNotFoundError);

  EXPECT_THAT(journal_->calls, IsEmpty());
  EXPECT_EQ(supervisor.State(), RunState::kAborted);
  EXPECT_EQ(timer_.pauses, 0);
}

TEST_F(ExecutionSupervisorTest, MissingStartAbortsAndStopsAuxiliaries) {
  AddPackage("sample", CapabilitySet{Capability::kCheck});
  AddAuxiliary("logcat");
  auto supervisor = MakeSupervisor();

  try {
    supervisor.Run(Config(), "sample");
    FAIL() << "Expected AnalysisError";
  } catch (const AnalysisError &error) {
    EXPECT_THAT(error.what(), HasSubstr("doesn't contain a start function"));
  }

  EXPECT_THAT(journal_->calls, ElementsAre("logcat.start", "logcat.stop"));
  EXPECT_EQ(supervisor.State(), RunState::kAborted);
  EXPECT_THAT(supervisor.Transitions(), Not(Contains(RunState::kPolling)));
}

TEST_F(ExecutionSupervisorTest, FailingStartEscalatesWithItsCause) {
  AddPackage("sample", kFullPackage, [](test::ScriptedPackage &package) {
    package.start = Behavior::kOperationalFault;
  });
  auto supervisor = MakeSupervisor();

  try {
    supervisor.Run(Config(), "sample");
    FAIL() << "Expected AnalysisError";
  } catch (const AnalysisError &error) {
    EXPECT_THAT(error.what(),
                HasSubstr("start function raised an error: sample.start failed"));
  }
  EXPECT_EQ(timer_.pauses, 0);
}

TEST_F(ExecutionSupervisorTest, ForeignExceptionFromStartIsStillAnAnalysisError) {
  AddPackage("sample", kFullPackage, [](test::ScriptedPackage &package) {
    package.start = Behavior::kForeign;
  });
  auto supervisor = MakeSupervisor();

  EXPECT_THROW(supervisor.Run(Config(), "sample"), AnalysisError);
}

TEST_F(ExecutionSupervisorTest, FailedAuxiliaryIsNeitherCountedNorStopped) {
  AddPackage("sample", kFullPackage);
  AddAuxiliary("a_broken", kFullAuxiliary, Behavior::kOperationalFault);
  AddAuxiliary("b_logcat");
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(1), "sample");

  EXPECT_THAT(summary.started_auxiliaries, ElementsAre("b_logcat"));
  EXPECT_THAT(journal_->calls, Contains("b_logcat.stop"));
  EXPECT_THAT(journal_->calls, Not(Contains("a_broken.stop")));
}

TEST_F(ExecutionSupervisorTest, AuxiliaryWithoutStartIsSkipped) {
  AddPackage("sample", kFullPackage);
  AddAuxiliary("passive", CapabilitySet{Capability::kStop});
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(1), "sample");

  EXPECT_THAT(summary.started_auxiliaries, IsEmpty());
  EXPECT_THAT(journal_->calls, Not(Contains("passive.stop")));
  EXPECT_EQ(logger_->Count("plugin.callback.not_implemented"), 1u);
}

TEST_F(ExecutionSupervisorTest, FaultingStopDoesNotPreventOtherStops) {
  AddPackage("sample", kFullPackage);
  AddAuxiliary("a_first", kFullAuxiliary, Behavior::kSucceed,
               Behavior::kUnexpectedFault);
  AddAuxiliary("b_second", CapabilitySet{Capability::kStart});
  AddAuxiliary("c_third");
  auto supervisor = MakeSupervisor();

  supervisor.Run(Config(1), "sample");

  EXPECT_THAT(journal_->calls, Contains("a_first.stop"));
  EXPECT_THAT(journal_->calls, Contains("c_third.stop"));
  EXPECT_EQ(logger_->Count("plugin.callback.fault"), 1u);
  EXPECT_EQ(logger_->Count("plugin.callback.not_implemented"), 1u);
}

TEST_F(ExecutionSupervisorTest, FaultingFinishIsContained) {
  AddPackage("sample", kFullPackage, [](test::ScriptedPackage &package) {
    package.finish = Behavior::kOperationalFault;
  });
  AddAuxiliary("logcat");
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(1), "sample");

  EXPECT_EQ(summary.termination, Termination::kTimeout);
  EXPECT_EQ(journal_->calls.back(), "logcat.stop");
  EXPECT_EQ(supervisor.State(), RunState::kStopping);
}

TEST_F(ExecutionSupervisorTest, InterruptDuringPollingAbortsAndStopsAuxiliaries) {
  AddPackage("sample", kFullPackage);
  AddAuxiliary("logcat");
  timer_.on_pause = [](int pauses) {
    if (pauses == 2) {
      throw InterruptedError();
    }
  };
  auto supervisor = MakeSupervisor();

  EXPECT_THROW(supervisor.Run(Config(10), "sample"), InterruptedError);

  EXPECT_EQ(journal_->calls.back(), "logcat.stop");
  EXPECT_EQ(supervisor.State(), RunState::kAborted);
}

TEST_F(ExecutionSupervisorTest, AuxiliaryThatCannotNameItselfIsSkipped) {
  AddPackage("sample", kFullPackage);
  registry_.RegisterAuxiliary("a_nameless", [this]() {
    return std::make_unique<test::NamelessAuxiliary>(journal_);
  });
  AddAuxiliary("b_logcat");
  auto supervisor = MakeSupervisor();

  const auto summary = supervisor.Run(Config(2), "sample");

  EXPECT_EQ(summary.termination, Termination::kTimeout);
  EXPECT_THAT(summary.started_auxiliaries, ElementsAre("b_logcat"));
  EXPECT_THAT(journal_->calls, Not(Contains("nameless.start")));
  EXPECT_THAT(journal_->calls, Contains("b_logcat.stop"));
  const auto faults = logger_->WithMessage("plugin.identity.fault");
  ASSERT_EQ(faults.size(), 1u);
  EXPECT_EQ(faults.front().Field("error"), "aux name blew up");
  EXPECT_EQ(supervisor.State(), RunState::kStopping);
}

TEST_F(ExecutionSupervisorTest, PackageThatCannotDescribeItselfAborts) {
  AddPackage("sample", kFullPackage, [](test::ScriptedPackage &package) {
    package.describe = Behavior::kUnexpectedFault;
  });
  AddAuxiliary("logcat");
  auto supervisor = MakeSupervisor();

  try {
    supervisor.Run(Config(), "sample");
    FAIL() << "Expected AnalysisError";
  } catch (const AnalysisError &error) {
    EXPECT_THAT(error.what(), HasSubstr("\"sample\" could not report"));
  }

  EXPECT_THAT(journal_->calls, ElementsAre("logcat.start", "logcat.stop"));
  EXPECT_EQ(logger_->Count("plugin.identity.fault"), 1u);
  EXPECT_EQ(supervisor.State(), RunState::kAborted);
}

TEST_F(ExecutionSupervisorTest, InterruptOutsideAPauseStillAbortsTheRun) {
  InstallInterruptHandlers();
  ClearInterruptRequest();
  AddPackage("sample", kFullPackage, [](test::ScriptedPackage &package) {
    package.stop_after = 1;
    package.on_start = []() { std::raise(SIGINT); };
  });
  AddAuxiliary("logcat");
  auto supervisor = MakeSupervisor();

  EXPECT_THROW(supervisor.Run(Config(5), "sample"), InterruptedError);
  ClearInterruptRequest();

  EXPECT_EQ(timer_.pauses, 0);
  EXPECT_EQ(journal_->calls.back(), "logcat.stop");
  EXPECT_THAT(journal_->calls, Not(Contains("sample.finish")));
  EXPECT_EQ(supervisor.State(), RunState::kAborted);
}

TEST_F(ExecutionSupervisorTest, RejectsNonPositiveTimeout) {
  AddPackage("sample", kFullPackage);
  auto supervisor = MakeSupervisor();

  EXPECT_THROW(supervisor.Run(Config(0), "sample"), AnalysisError);
  EXPECT_THAT(journal_->calls, IsEmpty());
}

TEST_F(ExecutionSupervisorTest, ReportAfterAbortStillReachesDone) {
  auto supervisor = MakeSupervisor();
  test::RecordingReporter reporter;

  EXPECT_THROW(supervisor.Run(Config(), "missing"), AnalysisError);
  supervisor.Report(reporter, OutcomeRecord{false, "boom", "/results"});

  EXPECT_EQ(supervisor.State(), RunState::kDone);
  ASSERT_EQ(reporter.outcomes.size(), 1u);
  EXPECT_EQ(reporter.outcomes.front().error_message, "boom");
}

} // namespace
} // namespace guest
