#include <guest/completion_reporter.h>
#include <guest/errors.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fake_agent_server.h"
#include "test_support/recording_logger.h"

namespace guest {
namespace {

using ::testing::HasSubstr;

TEST(XmlRpcCompletionReporterTest, SendsOutcomeAsCompleteCall) {
  test::FakeAgentServer server;
  auto logger = std::make_shared<test::RecordingLogger>();
  XmlRpcCompletionReporter reporter(ParseHttpEndpoint(server.Url()), logger);

  reporter.Complete(
      OutcomeRecord{false, "Unable to import package \"pdf\"", "/results"});

  const auto requests = server.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_THAT(requests.front(),
              HasSubstr("<methodName>complete</methodName>"));
  EXPECT_THAT(requests.front(), HasSubstr("<boolean>0</boolean>"));
  EXPECT_THAT(requests.front(),
              HasSubstr("Unable to import package \"pdf\""));
  EXPECT_THAT(requests.front(), HasSubstr("<string>/results</string>"));
  EXPECT_EQ(logger->Count("completion.send"), 1u);
  EXPECT_EQ(logger->Count("completion.delivered"), 1u);
}

TEST(XmlRpcCompletionReporterTest, HttpErrorIsACompletionError) {
  test::FakeAgentServer server(500, "internal error");
  XmlRpcCompletionReporter reporter(ParseHttpEndpoint(server.Url()));

  try {
    reporter.Complete(OutcomeRecord{true, "", "/results"});
    FAIL() << "Expected CompletionError";
  } catch (const CompletionError &error) {
    EXPECT_THAT(error.what(), HasSubstr("500"));
  }
}

TEST(XmlRpcCompletionReporterTest, FaultResponseIsACompletionError) {
  test::FakeAgentServer server(
      200, "<methodResponse><fault><value><struct><member>"
           "<name>faultString</name><value><string>no such method</string>"
           "</value></member></struct></value></fault></methodResponse>");
  XmlRpcCompletionReporter reporter(ParseHttpEndpoint(server.Url()));

  try {
    reporter.Complete(OutcomeRecord{true, "", "/results"});
    FAIL() << "Expected CompletionError";
  } catch (const CompletionError &error) {
    EXPECT_THAT(error.what(), HasSubstr("no such method"));
  }
}

} // namespace
} // namespace guest
