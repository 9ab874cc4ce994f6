#include <gtest/gtest.h>
#include "core/errors/protocol_errors.hpp"
#include "protocol/event_contract.hpp"
#include "verify/event_verifier.hpp"

namespace {

using agui::core::errors::ErrorCategory;
using agui::core::errors::get_error;
using agui::core::errors::get_value;
using agui::core::errors::is_error;
using agui::protocol::EventStream;
using agui::protocol::Role;
using agui::verify::EventVerifier;
using agui::verify::RunPhase;
using agui::verify::verify_stream;
namespace protocol = agui::protocol;

TEST(EventVerifierTest, AcceptsSimpleTextRun) {
    const EventStream events = {
        protocol::RunStartedEvent{"t1", "r1"},
        protocol::TextMessageStartEvent{"m1", Role::Assistant},
        protocol::TextMessageContentEvent{"m1", "Hello!"},
        protocol::TextMessageEndEvent{"m1"},
        protocol::RunFinishedEvent{"t1", "r1"},
    };
    auto result = verify_stream(events);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), RunPhase::Finished);
}

TEST(EventVerifierTest, RunErrorRightAfterStartThenRecovery) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    auto errored = verifier.verify(protocol::RunErrorEvent{"model overloaded"});
    ASSERT_FALSE(is_error(errored));
    EXPECT_EQ(get_value(errored), RunPhase::Errored);

    auto final_check = verifier.finalize();
    ASSERT_FALSE(is_error(final_check));
    EXPECT_EQ(get_value(final_check), RunPhase::Errored);

    auto restarted = verifier.verify(protocol::RunStartedEvent{"t1", "r2"});
    ASSERT_FALSE(is_error(restarted));
    EXPECT_EQ(get_value(restarted), RunPhase::Running);
}

TEST(EventVerifierTest, ToolEndWithoutStartIsRejected) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    auto result = verifier.verify(protocol::ToolCallEndEvent{"tc1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Verify);
    EXPECT_EQ(get_error(result).code, "tool_not_started");
}

TEST(EventVerifierTest, FirstEventMustBeRunStarted) {
    EventVerifier verifier;
    auto result = verifier.verify(protocol::TextMessageStartEvent{"m1", Role::Assistant});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "first_event_must_be_run_started");

    auto error_first = verifier.verify(protocol::RunErrorEvent{"boom"});
    ASSERT_TRUE(is_error(error_first));
    EXPECT_EQ(get_error(error_first).code, "first_event_must_be_run_started");
}

TEST(EventVerifierTest, RejectedEventLeavesStateUntouched) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    ASSERT_FALSE(is_error(verifier.verify(protocol::TextMessageStartEvent{"m1", Role::Assistant})));

    auto duplicate = verifier.verify(protocol::TextMessageStartEvent{"m1", Role::Assistant});
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "text_already_started");
    EXPECT_EQ(verifier.state().open_texts.size(), 1u);
    EXPECT_EQ(verifier.state().status, RunPhase::Running);
}

TEST(EventVerifierTest, SecondRunStartedWhileRunningIsRejected) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    auto result = verifier.verify(protocol::RunStartedEvent{"t1", "r2"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "run_already_started");
}

TEST(EventVerifierTest, OnlyRunErrorOrRunStartedAfterFinish) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunFinishedEvent{"t1", "r1"})));

    auto late = verifier.verify(protocol::StepStartedEvent{"plan"});
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).code, "run_already_finished");

    auto errored = verifier.verify(protocol::RunErrorEvent{"late failure"});
    ASSERT_FALSE(is_error(errored));
    EXPECT_EQ(get_value(errored), RunPhase::Errored);

    auto after_error = verifier.verify(protocol::CustomEvent{"ping", nullptr});
    ASSERT_TRUE(is_error(after_error));
    EXPECT_EQ(get_error(after_error).code, "run_already_errored");
}

TEST(EventVerifierTest, RunFinishedWithOpenWorkIsRejected) {
    {
        EventVerifier verifier;
        ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
        ASSERT_FALSE(is_error(verifier.verify(protocol::StepStartedEvent{"plan"})));
        auto result = verifier.verify(protocol::RunFinishedEvent{"t1", "r1"});
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "step_not_finished");
    }
    {
        EventVerifier verifier;
        ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
        ASSERT_FALSE(is_error(verifier.verify(protocol::ToolCallStartEvent{"tc1", "search"})));
        auto result = verifier.verify(protocol::RunFinishedEvent{"t1", "r1"});
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "tool_not_ended");
    }
}

TEST(EventVerifierTest, RunErrorAbandonsOpenWork) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    ASSERT_FALSE(is_error(verifier.verify(protocol::TextMessageStartEvent{"m1", Role::Assistant})));
    ASSERT_FALSE(is_error(verifier.verify(protocol::ToolCallStartEvent{"tc1", "search"})));
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunErrorEvent{"boom"})));
    EXPECT_TRUE(verifier.state().open_texts.empty());
    EXPECT_TRUE(verifier.state().open_tools.empty());
    EXPECT_FALSE(is_error(verifier.finalize()));
}

TEST(EventVerifierTest, StepRules) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));

    auto unknown = verifier.verify(protocol::StepFinishedEvent{"plan"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "step_not_started");

    ASSERT_FALSE(is_error(verifier.verify(protocol::StepStartedEvent{"plan"})));
    auto twice = verifier.verify(protocol::StepStartedEvent{"plan"});
    ASSERT_TRUE(is_error(twice));
    EXPECT_EQ(get_error(twice).code, "step_already_started");
    EXPECT_FALSE(is_error(verifier.verify(protocol::StepFinishedEvent{"plan"})));
}

TEST(EventVerifierTest, ThinkingRules) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));

    auto orphan = verifier.verify(protocol::ThinkingTextMessageStartEvent{});
    ASSERT_TRUE(is_error(orphan));
    EXPECT_EQ(get_error(orphan).code, "thinking_not_started");

    ASSERT_FALSE(is_error(verifier.verify(protocol::ThinkingStartEvent{std::string("Planning")})));
    auto nested = verifier.verify(protocol::ThinkingStartEvent{});
    ASSERT_TRUE(is_error(nested));
    EXPECT_EQ(get_error(nested).code, "thinking_already_started");

    auto content = verifier.verify(protocol::ThinkingTextMessageContentEvent{"hmm"});
    ASSERT_TRUE(is_error(content));
    EXPECT_EQ(get_error(content).code, "thinking_message_not_started");

    ASSERT_FALSE(is_error(verifier.verify(protocol::ThinkingTextMessageStartEvent{})));
    auto again = verifier.verify(protocol::ThinkingTextMessageStartEvent{});
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "thinking_message_already_started");

    EXPECT_FALSE(is_error(verifier.verify(protocol::ThinkingTextMessageContentEvent{"hmm"})));
    EXPECT_FALSE(is_error(verifier.verify(protocol::ThinkingTextMessageEndEvent{})));
    EXPECT_FALSE(is_error(verifier.verify(protocol::ThinkingEndEvent{})));

    auto stray_end = verifier.verify(protocol::ThinkingEndEvent{});
    ASSERT_TRUE(is_error(stray_end));
    EXPECT_EQ(get_error(stray_end).code, "thinking_not_started");
}

TEST(EventVerifierTest, FinalizeReportsWhatWasLeftOpen) {
    {
        EventVerifier verifier;
        ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
        ASSERT_FALSE(is_error(verifier.verify(protocol::TextMessageStartEvent{"m1", Role::Assistant})));
        auto result = verifier.finalize();
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "text_not_ended");
    }
    {
        EventVerifier verifier;
        ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
        ASSERT_FALSE(is_error(verifier.verify(protocol::ToolCallStartEvent{"tc1", "search"})));
        auto result = verifier.finalize();
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "tool_not_ended");
    }
    {
        EventVerifier verifier;
        ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
        ASSERT_FALSE(is_error(verifier.verify(protocol::StepStartedEvent{"plan"})));
        auto result = verifier.finalize();
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "step_not_finished");
    }
    {
        EventVerifier verifier;
        ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
        auto result = verifier.finalize();
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "run_not_finished");
    }
    {
        EventVerifier verifier;
        auto result = verifier.finalize();
        ASSERT_FALSE(is_error(result));
        EXPECT_EQ(get_value(result), RunPhase::Idle);
    }
}

TEST(EventVerifierTest, ResetStartsOver) {
    EventVerifier verifier;
    ASSERT_FALSE(is_error(verifier.verify(protocol::RunStartedEvent{"t1", "r1"})));
    verifier.reset();
    EXPECT_EQ(verifier.state().status, RunPhase::Idle);
    EXPECT_FALSE(verifier.state().first_event_received);
}

}  // namespace
