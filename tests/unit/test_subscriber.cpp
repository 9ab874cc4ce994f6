#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "middleware/subscriber.hpp"
#include "protocol/event_contract.hpp"
#include "session/session.hpp"

namespace {

using agui::middleware::DispatchOutcome;
using agui::middleware::Subscriber;
using agui::middleware::SubscriberChain;
using agui::middleware::SubscriberResult;
using agui::session::Session;
using nlohmann::json;
namespace protocol = agui::protocol;

// Records what it saw and answers with a canned result.
class RecordingSubscriber : public Subscriber {
public:
    RecordingSubscriber(std::string name, std::vector<std::string>* log,
                        std::optional<SubscriberResult> reply = std::nullopt)
        : name_(std::move(name)), log_(log), reply_(std::move(reply)) {}

    std::optional<SubscriberResult> on_event(const protocol::Event& event,
                                             const Session& session) override {
        log_->push_back(name_ + ":" + protocol::to_string(protocol::type_of(event)));
        seen_state = session.state;
        return reply_;
    }

    void on_messages_changed(const Session&) override { ++messages_changed; }
    void on_state_changed(const Session&) override { ++state_changed; }
    void on_run_finalized(const Session&) override { ++finalized; }
    void on_run_failed(const Session&, const agui::core::errors::ProtocolError& error) override {
        failed_code = error.code;
    }

    json seen_state;
    int messages_changed = 0;
    int state_changed = 0;
    int finalized = 0;
    std::string failed_code;

private:
    std::string name_;
    std::vector<std::string>* log_;
    std::optional<SubscriberResult> reply_;
};

TEST(SubscriberChainTest, RunsInRegistrationOrder) {
    std::vector<std::string> log;
    SubscriberChain chain;
    chain.add(std::make_shared<RecordingSubscriber>("first", &log));
    chain.add(std::make_shared<RecordingSubscriber>("second", &log));

    DispatchOutcome outcome = chain.dispatch(protocol::StepStartedEvent{"plan"}, Session{});
    EXPECT_TRUE(outcome.propagate);
    EXPECT_EQ(log, (std::vector<std::string>{"first:STEP_STARTED", "second:STEP_STARTED"}));
}

TEST(SubscriberChainTest, StopPropagationSkipsLaterSubscribers) {
    std::vector<std::string> log;
    SubscriberResult stop;
    stop.stop_propagation = true;

    SubscriberChain chain;
    chain.add(std::make_shared<RecordingSubscriber>("first", &log, stop));
    chain.add(std::make_shared<RecordingSubscriber>("second", &log));

    DispatchOutcome outcome = chain.dispatch(protocol::CustomEvent{"ping", nullptr}, Session{});
    EXPECT_FALSE(outcome.propagate);
    EXPECT_EQ(log, (std::vector<std::string>{"first:CUSTOM"}));
}

TEST(SubscriberChainTest, MutationsAreVisibleDownTheChain) {
    std::vector<std::string> log;
    SubscriberResult rewrite;
    rewrite.state = json{{"seeded", true}};

    auto second = std::make_shared<RecordingSubscriber>("second", &log);
    SubscriberChain chain;
    chain.add(std::make_shared<RecordingSubscriber>("first", &log, rewrite));
    chain.add(second);

    DispatchOutcome outcome = chain.dispatch(protocol::StepStartedEvent{"plan"}, Session{});
    EXPECT_EQ(second->seen_state, (json{{"seeded", true}}));
    EXPECT_EQ(outcome.session.state, (json{{"seeded", true}}));
}

TEST(SubscriberChainTest, MessageReplacementIsApplied) {
    std::vector<std::string> log;
    protocol::Message note;
    note.id = "sys";
    note.role = protocol::Role::System;
    note.content = "be brief";
    SubscriberResult rewrite;
    rewrite.messages = std::vector<protocol::Message>{note};

    SubscriberChain chain;
    chain.add(std::make_shared<RecordingSubscriber>("only", &log, rewrite));
    DispatchOutcome outcome = chain.dispatch(protocol::StepStartedEvent{"plan"}, Session{});
    ASSERT_EQ(outcome.session.messages.size(), 1u);
    EXPECT_EQ(outcome.session.messages[0].id, "sys");
}

TEST(SubscriberChainTest, NotifiesOnlyWhatChanged) {
    std::vector<std::string> log;
    auto subscriber = std::make_shared<RecordingSubscriber>("only", &log);
    SubscriberChain chain;
    chain.add(subscriber);

    Session before;
    Session after = before;
    after.state = json{{"x", 1}};
    ++after.state_revision;
    chain.notify_changes(before, after);
    EXPECT_EQ(subscriber->state_changed, 1);
    EXPECT_EQ(subscriber->messages_changed, 0);

    protocol::Message message;
    message.id = "m1";
    after.messages.push_back(message);
    ++after.messages_revision;
    chain.notify_changes(before, after);
    EXPECT_EQ(subscriber->state_changed, 2);
    EXPECT_EQ(subscriber->messages_changed, 1);

    chain.notify_finalized(after);
    chain.notify_failed(after, agui::core::errors::ProtocolError{
                                   agui::core::errors::ErrorCategory::Verify, "bad", "tool_not_started"});
    EXPECT_EQ(subscriber->finalized, 1);
    EXPECT_EQ(subscriber->failed_code, "tool_not_started");
}

TEST(SubscriberChainTest, MutationsBumpRevisions) {
    std::vector<std::string> log;
    SubscriberResult rewrite;
    rewrite.state = json{{"seeded", true}};

    SubscriberChain chain;
    chain.add(std::make_shared<RecordingSubscriber>("only", &log, rewrite));
    const Session before;
    DispatchOutcome outcome = chain.dispatch(protocol::StepStartedEvent{"plan"}, before);
    EXPECT_EQ(outcome.session.state_revision, before.state_revision + 1);
    EXPECT_EQ(outcome.session.messages_revision, before.messages_revision);
}

TEST(SubscriberChainTest, IgnoresNullSubscriber) {
    SubscriberChain chain;
    chain.add(nullptr);
    EXPECT_EQ(chain.size(), 0u);
}

}  // namespace
