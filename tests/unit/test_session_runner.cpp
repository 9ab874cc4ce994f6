#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/pipeline_options.hpp"
#include "core/errors/protocol_errors.hpp"
#include "middleware/filter_tool_calls.hpp"
#include "middleware/subscriber.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_agent_input.hpp"
#include "session/session_runner.hpp"

namespace {

using agui::core::config::PipelineOptions;
using agui::core::errors::ErrorCategory;
using agui::core::errors::get_error;
using agui::core::errors::get_value;
using agui::core::errors::is_error;
using agui::protocol::EventStream;
using agui::protocol::EventType;
using agui::protocol::Role;
using agui::protocol::RunAgentInput;
using agui::session::RunStatus;
using agui::session::SessionRunner;
using nlohmann::json;
namespace protocol = agui::protocol;

RunAgentInput make_input() {
    RunAgentInput input;
    input.thread_id = "t1";
    input.run_id = "r1";
    return input;
}

std::vector<EventType> types_of(const EventStream& events) {
    std::vector<EventType> types;
    for (const auto& event : events) {
        types.push_back(protocol::type_of(event));
    }
    return types;
}

class CountingSubscriber : public agui::middleware::Subscriber {
public:
    std::optional<agui::middleware::SubscriberResult> on_event(
        const protocol::Event& event, const agui::session::Session&) override {
        ++events;
        if (swallow_custom && protocol::type_of(event) == EventType::Custom) {
            agui::middleware::SubscriberResult result;
            result.stop_propagation = true;
            return result;
        }
        return std::nullopt;
    }
    void on_messages_changed(const agui::session::Session&) override { ++messages_changed; }
    void on_run_finalized(const agui::session::Session&) override { ++finalized; }
    void on_run_failed(const agui::session::Session&,
                       const agui::core::errors::ProtocolError& error) override {
        failed_code = error.code;
    }

    bool swallow_custom = false;
    int events = 0;
    int messages_changed = 0;
    int finalized = 0;
    std::string failed_code;
};

TEST(SessionRunnerTest, ReducesSimpleTextRun) {
    SessionRunner runner;
    auto outcome = runner.run(make_input(), [](const RunAgentInput& input) {
        return EventStream{
            protocol::RunStartedEvent{input.thread_id, input.run_id},
            protocol::TextMessageStartEvent{"m1", Role::Assistant},
            protocol::TextMessageContentEvent{"m1", "Hello!"},
            protocol::TextMessageEndEvent{"m1"},
            protocol::RunFinishedEvent{input.thread_id, input.run_id},
        };
    });

    ASSERT_FALSE(is_error(outcome));
    const auto& result = get_value(outcome);
    EXPECT_EQ(result.session.status, RunStatus::Finished);
    ASSERT_EQ(result.session.messages.size(), 1u);
    EXPECT_EQ(result.session.messages[0].content, std::optional<std::string>("Hello!"));
    EXPECT_EQ(result.events.size(), 5u);
}

TEST(SessionRunnerTest, ExpandsChunksBeforeReducing) {
    SessionRunner runner;
    auto outcome = runner.run(make_input(), [](const RunAgentInput&) {
        return EventStream{
            protocol::RunStartedEvent{"t1", "r1"},
            protocol::TextMessageChunkEvent{std::string("m1"), Role::Assistant, std::string("Hello ")},
            protocol::TextMessageChunkEvent{std::nullopt, std::nullopt, std::string("World!")},
            protocol::RunFinishedEvent{"t1", "r1"},
        };
    });

    ASSERT_FALSE(is_error(outcome));
    const auto& result = get_value(outcome);
    const std::vector<EventType> expected = {
        EventType::RunStarted,         EventType::TextMessageStart,
        EventType::TextMessageContent, EventType::TextMessageContent,
        EventType::TextMessageEnd,     EventType::RunFinished,
    };
    EXPECT_EQ(types_of(result.events), expected);
    ASSERT_EQ(result.session.messages.size(), 1u);
    EXPECT_EQ(result.session.messages[0].content, std::optional<std::string>("Hello World!"));
}

TEST(SessionRunnerTest, FinishClosesChunkStreamsLeftOpen) {
    SessionRunner runner;
    runner.start(make_input());
    ASSERT_FALSE(is_error(runner.ingest(protocol::RunStartedEvent{"t1", "r1"})));
    ASSERT_FALSE(is_error(runner.ingest(
        protocol::TextMessageChunkEvent{std::string("m1"), std::nullopt, std::string("cut off")})));

    auto closing = runner.finish();
    ASSERT_FALSE(is_error(closing));
    EXPECT_EQ(types_of(get_value(closing)), std::vector<EventType>{EventType::TextMessageEnd});
    ASSERT_EQ(runner.session().messages.size(), 1u);
    EXPECT_EQ(runner.session().messages[0].content, std::optional<std::string>("cut off"));
}

TEST(SessionRunnerTest, StrictModeStopsAtFirstViolation) {
    PipelineOptions options;
    options.strict = true;
    SessionRunner runner(options);
    auto subscriber = std::make_shared<CountingSubscriber>();
    runner.add_subscriber(subscriber);

    auto outcome = runner.run(make_input(), [](const RunAgentInput&) {
        return EventStream{
            protocol::RunStartedEvent{"t1", "r1"},
            protocol::ToolCallEndEvent{"tc1"},
            protocol::RunFinishedEvent{"t1", "r1"},
        };
    });

    ASSERT_TRUE(is_error(outcome));
    EXPECT_EQ(get_error(outcome).category, ErrorCategory::Verify);
    EXPECT_EQ(get_error(outcome).code, "tool_not_started");
    EXPECT_EQ(subscriber->failed_code, "tool_not_started");
    EXPECT_EQ(subscriber->finalized, 0);
    EXPECT_EQ(runner.session().status, RunStatus::Running);
    EXPECT_EQ(runner.verifier_state().status, agui::verify::RunPhase::Running);
    EXPECT_TRUE(runner.verifier_state().open_tools.empty());

    auto after = runner.ingest(protocol::RunFinishedEvent{"t1", "r1"});
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).code, "tool_not_started");
}

TEST(SessionRunnerTest, LenientModeLogsAndKeepsGoing) {
    SessionRunner runner;
    auto outcome = runner.run(make_input(), [](const RunAgentInput&) {
        return EventStream{
            protocol::RunStartedEvent{"t1", "r1"},
            protocol::ToolCallEndEvent{"tc1"},
            protocol::RunFinishedEvent{"t1", "r1"},
        };
    });

    ASSERT_FALSE(is_error(outcome));
    EXPECT_EQ(get_value(outcome).session.status, RunStatus::Finished);
}

TEST(SessionRunnerTest, RunErrorThenRecovery) {
    SessionRunner runner;
    auto outcome = runner.run(make_input(), [](const RunAgentInput&) {
        return EventStream{
            protocol::RunStartedEvent{"t1", "r1"},
            protocol::RunErrorEvent{"model overloaded"},
            protocol::RunStartedEvent{"t1", "r2"},
            protocol::TextMessageStartEvent{"m1", Role::Assistant},
            protocol::TextMessageContentEvent{"m1", "second try"},
            protocol::TextMessageEndEvent{"m1"},
            protocol::RunFinishedEvent{"t1", "r2"},
        };
    });

    ASSERT_FALSE(is_error(outcome));
    const auto& session = get_value(outcome).session;
    EXPECT_EQ(session.status, RunStatus::Finished);
    EXPECT_EQ(session.run_id, "r2");
    EXPECT_FALSE(session.error_message.has_value());
    EXPECT_EQ(session.messages.size(), 1u);
}

TEST(SessionRunnerTest, StrictModeRejectsUnfinishedStream) {
    PipelineOptions options;
    options.strict = true;
    SessionRunner runner(options);
    runner.start(make_input());
    ASSERT_FALSE(is_error(runner.ingest(protocol::RunStartedEvent{"t1", "r1"})));

    auto closing = runner.finish();
    ASSERT_TRUE(is_error(closing));
    EXPECT_EQ(get_error(closing).code, "run_not_finished");
}

TEST(SessionRunnerTest, SeedsSessionFromInput) {
    RunAgentInput input = make_input();
    input.state = json{{"counter", 3}};
    protocol::Message user;
    user.id = "u1";
    user.role = Role::User;
    user.content = "hi";
    input.messages.push_back(user);

    SessionRunner runner;
    runner.start(input);
    EXPECT_EQ(runner.session().status, RunStatus::Idle);
    EXPECT_EQ(runner.session().state, (json{{"counter", 3}}));
    ASSERT_EQ(runner.session().messages.size(), 1u);
    EXPECT_EQ(runner.session().messages[0].id, "u1");
}

TEST(SessionRunnerTest, SubscribersSeeEveryCanonicalEvent) {
    SessionRunner runner;
    auto subscriber = std::make_shared<CountingSubscriber>();
    subscriber->swallow_custom = true;
    runner.add_subscriber(subscriber);

    auto outcome = runner.run(make_input(), [](const RunAgentInput&) {
        return EventStream{
            protocol::RunStartedEvent{"t1", "r1"},
            protocol::CustomEvent{"internal", nullptr},
            protocol::TextMessageChunkEvent{std::string("m1"), std::nullopt, std::string("hi")},
            protocol::RunFinishedEvent{"t1", "r1"},
        };
    });

    ASSERT_FALSE(is_error(outcome));
    const auto& result = get_value(outcome);
    // RunStarted, Custom, Start, Content, End, RunFinished
    EXPECT_EQ(subscriber->events, 6);
    EXPECT_EQ(subscriber->messages_changed, 1);
    EXPECT_EQ(subscriber->finalized, 1);
    EXPECT_EQ(result.events.size(), 5u);
    for (const auto& event : result.events) {
        EXPECT_NE(protocol::type_of(event), EventType::Custom);
    }
}

TEST(SessionRunnerTest, MiddlewareFiltersBeforeThePipeline) {
    agui::middleware::ToolCallFilter filter;
    filter.disallowed_tools = std::set<std::string>{"delete_file"};
    auto created = agui::middleware::FilterToolCallsMiddleware::create(filter);
    ASSERT_FALSE(is_error(created));

    SessionRunner runner;
    runner.use(get_value(created));
    auto outcome = runner.run(make_input(), [](const RunAgentInput&) {
        return EventStream{
            protocol::RunStartedEvent{"t1", "r1"},
            protocol::ToolCallStartEvent{"tc1", "delete_file"},
            protocol::ToolCallEndEvent{"tc1"},
            protocol::RunFinishedEvent{"t1", "r1"},
        };
    });

    ASSERT_FALSE(is_error(outcome));
    EXPECT_TRUE(get_value(outcome).session.messages.empty());
    EXPECT_EQ(get_value(outcome).events.size(), 2u);
}

TEST(SessionRunnerTest, VerificationCanBeDisabled) {
    PipelineOptions options;
    options.verify = false;
    options.strict = true;
    SessionRunner runner(options);
    runner.start(make_input());
    auto result = runner.ingest(protocol::TextMessageStartEvent{"m1", Role::Assistant});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(runner.session().text_buffers.count("m1"), 1u);
}

}  // namespace
