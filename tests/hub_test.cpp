#include "simpleshare/hub.hpp"
#include "simpleshare/registry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace simpleshare;
using namespace std::chrono_literals;

namespace {

Snapshot downloadingAt(int progress) {
    Snapshot snapshot;
    snapshot.status = Status::Downloading;
    snapshot.progress = progress;
    return snapshot;
}

class HubTest : public ::testing::Test {
protected:
    Registry registry_;
    Hub hub_{registry_};
};

}

TEST_F(HubTest, AttachQueuesCurrentSnapshot) {
    JobId id = registry_.create("src");
    auto subscriber = std::make_shared<Subscriber>();

    ASSERT_EQ(hub_.attach(id, subscriber), AttachResult::Attached);
    EXPECT_EQ(hub_.subscriberCount(id), 1u);

    auto first = subscriber->next(100ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, EventKind::Snapshot);
    EXPECT_EQ(first->snapshot.status, Status::Queued);
    EXPECT_EQ(first->snapshot.progress, 0);
}

TEST_F(HubTest, AttachToUnknownJobFails) {
    auto subscriber = std::make_shared<Subscriber>();
    EXPECT_EQ(hub_.attach("nope", subscriber), AttachResult::NotFound);
    EXPECT_EQ(subscriber->pending(), 0u);
    EXPECT_EQ(hub_.subscriberCount("nope"), 0u);
}

TEST_F(HubTest, BroadcastReachesEverySubscriberInOrder) {
    JobId id = registry_.create("src");
    auto a = std::make_shared<Subscriber>();
    auto b = std::make_shared<Subscriber>();
    ASSERT_EQ(hub_.attach(id, a), AttachResult::Attached);
    ASSERT_EQ(hub_.attach(id, b), AttachResult::Attached);

    EXPECT_EQ(hub_.broadcast(id, EventKind::Update, downloadingAt(0)), 2u);
    EXPECT_EQ(hub_.broadcast(id, EventKind::DownloadProgress, downloadingAt(33)), 2u);
    EXPECT_EQ(hub_.broadcast(id, EventKind::DownloadProgress, downloadingAt(66)), 2u);

    for (auto& subscriber : {a, b}) {
        ASSERT_TRUE(subscriber->next(10ms).has_value());  // snapshot
        auto update = subscriber->next(10ms);
        ASSERT_TRUE(update.has_value());
        EXPECT_EQ(update->kind, EventKind::Update);
        auto p1 = subscriber->next(10ms);
        auto p2 = subscriber->next(10ms);
        ASSERT_TRUE(p1.has_value());
        ASSERT_TRUE(p2.has_value());
        EXPECT_EQ(p1->snapshot.progress, 33);
        EXPECT_EQ(p2->snapshot.progress, 66);
        EXPECT_FALSE(subscriber->next(10ms).has_value());
    }
}

TEST_F(HubTest, BroadcastWithoutSubscribersIsNoop) {
    JobId id = registry_.create("src");
    EXPECT_EQ(hub_.broadcast(id, EventKind::Update, downloadingAt(0)), 0u);
    EXPECT_EQ(hub_.broadcast("unknown", EventKind::Update, downloadingAt(0)), 0u);
}

TEST_F(HubTest, DetachIsIdempotent) {
    JobId id = registry_.create("src");
    auto subscriber = std::make_shared<Subscriber>();
    ASSERT_EQ(hub_.attach(id, subscriber), AttachResult::Attached);

    hub_.detach(id, subscriber);
    hub_.detach(id, subscriber);
    hub_.detach("unknown", subscriber);
    EXPECT_EQ(hub_.subscriberCount(id), 0u);

    EXPECT_EQ(hub_.broadcast(id, EventKind::Update, downloadingAt(5)), 0u);
    EXPECT_EQ(subscriber->pending(), 1u);  // only the attach snapshot
}

TEST_F(HubTest, ClosedSubscribersArePruned) {
    JobId id = registry_.create("src");
    auto open = std::make_shared<Subscriber>();
    auto gone = std::make_shared<Subscriber>();
    ASSERT_EQ(hub_.attach(id, open), AttachResult::Attached);
    ASSERT_EQ(hub_.attach(id, gone), AttachResult::Attached);

    gone->close();
    EXPECT_EQ(hub_.broadcast(id, EventKind::Update, downloadingAt(1)), 1u);
    EXPECT_EQ(hub_.subscriberCount(id), 1u);
}

TEST_F(HubTest, OverflowClosesSlowSubscriber) {
    JobId id = registry_.create("src");
    auto slow = std::make_shared<Subscriber>(3);
    ASSERT_EQ(hub_.attach(id, slow), AttachResult::Attached);

    EXPECT_EQ(hub_.broadcast(id, EventKind::DownloadProgress, downloadingAt(1)), 1u);
    EXPECT_EQ(hub_.broadcast(id, EventKind::DownloadProgress, downloadingAt(2)), 1u);
    EXPECT_EQ(hub_.broadcast(id, EventKind::DownloadProgress, downloadingAt(3)), 0u);

    EXPECT_TRUE(slow->closed());
    EXPECT_EQ(hub_.subscriberCount(id), 0u);
    EXPECT_FALSE(slow->next(10ms).has_value());
}

TEST_F(HubTest, NextWakesOnPushFromAnotherThread) {
    JobId id = registry_.create("src");
    auto subscriber = std::make_shared<Subscriber>();
    ASSERT_EQ(hub_.attach(id, subscriber), AttachResult::Attached);
    ASSERT_TRUE(subscriber->next(10ms).has_value());

    std::thread producer([&] {
        std::this_thread::sleep_for(50ms);
        hub_.broadcast(id, EventKind::Update, downloadingAt(0));
    });
    auto event = subscriber->next(5s);
    producer.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EventKind::Update);
}

TEST_F(HubTest, CloseAllReleasesWaiters) {
    JobId id = registry_.create("src");
    auto subscriber = std::make_shared<Subscriber>();
    ASSERT_EQ(hub_.attach(id, subscriber), AttachResult::Attached);
    ASSERT_TRUE(subscriber->next(10ms).has_value());

    hub_.closeAll();
    EXPECT_TRUE(subscriber->closed());
    EXPECT_EQ(hub_.subscriberCount(id), 0u);
    EXPECT_FALSE(subscriber->next(1s).has_value());
}

TEST_F(HubTest, SubscriberBelongsToOneJobAtATime) {
    JobId first = registry_.create("a");
    JobId second = registry_.create("b");
    auto subscriber = std::make_shared<Subscriber>();

    ASSERT_EQ(hub_.attach(first, subscriber), AttachResult::Attached);
    EXPECT_EQ(hub_.attach(second, subscriber), AttachResult::AlreadyAttached);
    EXPECT_EQ(hub_.subscriberCount(second), 0u);

    // Re-attaching to the same job neither duplicates nor re-queues
    EXPECT_EQ(hub_.attach(first, subscriber), AttachResult::Attached);
    EXPECT_EQ(hub_.subscriberCount(first), 1u);
    EXPECT_EQ(subscriber->pending(), 1u);

    EXPECT_EQ(hub_.broadcast(second, EventKind::Update, downloadingAt(0)), 0u);
    EXPECT_EQ(subscriber->pending(), 1u);

    hub_.detach(first, subscriber);
    EXPECT_EQ(hub_.attach(second, subscriber), AttachResult::Attached);
    EXPECT_EQ(hub_.subscriberCount(second), 1u);
}
