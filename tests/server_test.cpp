#include <gtest/gtest.h>
#include "server.hpp"
#include "fakes.hpp"
#include <thread>
#include <future>

using namespace cmdb;
using namespace cmdb::test;
using namespace std::chrono_literals;

namespace {

// Runs serve() on a background thread.
class ServerFixture : public ::testing::Test {
protected:
    std::shared_ptr<FakeStorage> storage = std::make_shared<FakeStorage>();
    std::shared_ptr<FakeExecutor> executor = std::make_shared<FakeExecutor>();
    FakeSchedule* schedule = nullptr;
    std::unique_ptr<Server> server;
    std::future<ShutdownReason> result;

    void make_server(std::optional<std::chrono::milliseconds> offset,
                     std::chrono::milliseconds revalidate = 10ms) {
        auto s = std::make_unique<FakeSchedule>(offset);
        schedule = s.get();
        ServerOptions options;
        options.revalidate_interval = revalidate;
        options.dispatch_workers = 2;
        server = std::make_unique<Server>(std::move(s), options);
        server->prepare(storage, quiet_logger());
        server->handler().register_executor(executor);
    }

    void start() {
        result = std::async(std::launch::async, [this] { return server->serve(); });
        ASSERT_TRUE(eventually([this] { return server->state() == ServerState::running; }));
    }

    ShutdownReason finish() {
        EXPECT_EQ(result.wait_for(5s), std::future_status::ready);
        return result.get();
    }

    void TearDown() override {
        if (server && result.valid()) {
            server->stop();
            result.wait();
        }
    }
};

} // namespace

TEST(ServerConstruction, AcceptsValidExpressions) {
    for (const char* expr : {"@daily", "@weekly", "@hourly", "@every 1h30m", "0 30 8 * * MON-FRI",
                             "*/5 * * * * *", "@yearly"}) {
        EXPECT_NO_THROW(Server s(expr)) << expr;
    }
}

TEST(ServerConstruction, RejectsMalformedExpressions) {
    for (const char* expr : {"", "@sometimes", "* * * * *", "61 * * * * *", "@every", "@every 5x",
                             "0 0 0 32 * *"}) {
        std::unique_ptr<Server> s;
        EXPECT_THROW(s = std::make_unique<Server>(expr), ScheduleParseError) << expr;
        EXPECT_EQ(s, nullptr);
    }
}

TEST_F(ServerFixture, IndefiniteScheduleOnlyRevalidates) {
    make_server(std::nullopt, 5ms);
    start();
    ASSERT_TRUE(eventually([this] { return server->revalidations() >= 4; }));
    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);

    EXPECT_EQ(server->ticks(), 0u);
    EXPECT_EQ(server->dispatched(), 0u);
    EXPECT_EQ(storage->creates(kinds::machine_digest), 0);
    EXPECT_EQ(storage->updates(kinds::discovered_machines), 0);
    EXPECT_EQ(schedule->calls(), static_cast<int>(server->revalidations()));
}

TEST_F(ServerFixture, ConcreteActivationDispatchesTwoActionsPerTick) {
    make_server(15ms);
    start();
    ASSERT_TRUE(eventually([this] { return server->ticks() >= 3; }));
    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);

    // Drained on stop, so every dispatched action has run.
    std::size_t ticks = server->ticks();
    EXPECT_EQ(server->dispatched(), 2 * ticks);
    EXPECT_EQ(storage->creates(kinds::machine_digest), static_cast<int>(ticks));
    EXPECT_EQ(storage->updates(kinds::discovered_machines), static_cast<int>(ticks));
    EXPECT_EQ(server->revalidations(), 0u);
    // One initial arm plus one rearm per tick.
    EXPECT_EQ(schedule->calls(), static_cast<int>(ticks) + 1);
}

TEST_F(ServerFixture, MachineWatchErrorIsFatal) {
    make_server(1h);
    start();
    ASSERT_TRUE(storage->emit(kinds::machine, WatchEventType::error, ""));
    EXPECT_EQ(finish(), ShutdownReason::machine_watch_failed);
    EXPECT_EQ(server->state(), ServerState::stopped);
    EXPECT_EQ(storage->open_watchers(), 0);
}

TEST_F(ServerFixture, DigestWatchErrorIsFatal) {
    make_server(1h);
    start();
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::error, ""));
    EXPECT_EQ(finish(), ShutdownReason::digest_watch_failed);
    EXPECT_EQ(storage->open_watchers(), 0);
}

TEST_F(ServerFixture, DiscoveryWatchErrorIsNotFatal) {
    make_server(1h);
    start();
    // The store ends the stream; nothing more arrives on it.
    ASSERT_TRUE(storage->fail_stream(kinds::discovered_machines));
    ASSERT_TRUE(eventually([this] { return storage->watches(kinds::discovered_machines) == 2; }));
    EXPECT_EQ(result.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(server->state(), ServerState::running);
    EXPECT_EQ(server->auto_disc_reopens(), 1u);
    EXPECT_EQ(storage->open_watchers(), 3);

    // Updates flow through the re-established watch.
    ASSERT_TRUE(storage->emit(kinds::discovered_machines, WatchEventType::update,
                              R"({"state":"Started"})"));
    ASSERT_TRUE(eventually([this] { return executor->discoveries().size() == 1; }));

    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);
    EXPECT_EQ(storage->open_watchers(), 0);
}

TEST_F(ServerFixture, DiscoveryWatchLostForGoodKeepsServing) {
    make_server(1h);
    start();
    storage->fail_watch_kind = kinds::discovered_machines;
    ASSERT_TRUE(storage->fail_stream(kinds::discovered_machines));
    ASSERT_TRUE(eventually([this] { return storage->open_watchers() == 2; }));
    EXPECT_EQ(server->auto_disc_reopens(), 0u);

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(server->state(), ServerState::running);
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::create, R"({"guid":"m1"})"));
    ASSERT_TRUE(eventually([this] { return executor->digests().size() == 1; }));

    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);
    EXPECT_EQ(storage->open_watchers(), 0);
}

TEST_F(ServerFixture, MachineDeleteIsIgnored) {
    make_server(1h);
    start();
    ASSERT_TRUE(storage->emit(kinds::machine, WatchEventType::remove, R"({"name":"m"})"));
    ASSERT_TRUE(storage->emit(kinds::machine, WatchEventType::create, R"({"name":"m"})"));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(server->state(), ServerState::running);
    EXPECT_EQ(server->dispatched(), 0u);
}

TEST_F(ServerFixture, MalformedPayloadsNeverReachExecutors) {
    make_server(1h);
    start();
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::create, "not json"));
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::create, R"({"guid": 42})"));
    ASSERT_TRUE(storage->emit(kinds::discovered_machines, WatchEventType::create, "[1,2,3]"));
    ASSERT_TRUE(eventually([this] { return server->dispatched() == 3; }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(executor->calls(), 0u);
    EXPECT_EQ(server->state(), ServerState::running);

    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);
}

TEST_F(ServerFixture, DigestCreateReachesTheExecutor) {
    make_server(1h);
    start();
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::create, R"({"guid":"m1"})"));
    ASSERT_TRUE(eventually([this] { return executor->digests().size() == 1; }));
    server->stop();
    finish();

    auto digests = executor->digests();
    ASSERT_EQ(digests.size(), 1u);
    EXPECT_EQ(digests[0].guid, "m1");
    EXPECT_TRUE(executor->discoveries().empty());
}

TEST_F(ServerFixture, DigestUpdatesAreNotDispatched) {
    make_server(1h);
    start();
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::update, R"({"guid":"m1"})"));
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::remove, R"({"guid":"m1"})"));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(server->dispatched(), 0u);
}

TEST_F(ServerFixture, SubscribersAreNotifiedOnceInOrder) {
    make_server(1h);
    auto before1 = server->subscribe();
    auto before2 = server->subscribe();
    start();
    auto during = server->subscribe();
    EXPECT_EQ(server->subscriber_count(), 3u);

    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);

    EXPECT_EQ(before1.get(), ShutdownReason::stopped);
    EXPECT_EQ(before2.get(), ShutdownReason::stopped);
    EXPECT_EQ(during.get(), ShutdownReason::stopped);
    EXPECT_EQ(server->subscriber_count(), 0u);

    // Late subscribers see the outcome right away.
    auto late = server->subscribe();
    EXPECT_EQ(late.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(late.get(), ShutdownReason::stopped);
}

TEST_F(ServerFixture, SubscribersSeeFatalReason) {
    make_server(1h);
    auto sub = server->subscribe();
    start();
    ASSERT_TRUE(storage->emit(kinds::machine_digest, WatchEventType::error, ""));
    EXPECT_EQ(finish(), ShutdownReason::digest_watch_failed);
    EXPECT_EQ(sub.get(), ShutdownReason::digest_watch_failed);
}

TEST_F(ServerFixture, WatchEstablishmentFailureReleasesOpenedWatches) {
    make_server(1h);
    storage->fail_watch_kind = kinds::discovered_machines;
    auto sub = server->subscribe();

    EXPECT_THROW(server->serve(), WatchEstablishmentError);
    EXPECT_EQ(storage->open_watchers(), 0);
    EXPECT_EQ(server->state(), ServerState::stopped);
    EXPECT_EQ(server->subscriber_count(), 0u);
    EXPECT_THROW(sub.get(), WatchEstablishmentError);
}

TEST_F(ServerFixture, UnexpectedWatchFailureStillReleasesAndNotifies) {
    make_server(1h);
    storage->break_watch_kind = kinds::discovered_machines;
    auto sub = server->subscribe();

    EXPECT_THROW(server->serve(), std::runtime_error);
    EXPECT_EQ(storage->open_watchers(), 0);
    EXPECT_EQ(server->state(), ServerState::stopped);
    EXPECT_EQ(server->subscriber_count(), 0u);
    ASSERT_EQ(sub.wait_for(0ms), std::future_status::ready);
    EXPECT_THROW(sub.get(), std::runtime_error);

    // Late subscribers see the same failure.
    EXPECT_THROW(server->subscribe().get(), std::runtime_error);
}

TEST(ServerConstruction, RejectsEmptyDispatchPool) {
    ServerOptions no_workers;
    no_workers.dispatch_workers = 0;
    EXPECT_THROW(Server(std::make_unique<FakeSchedule>(std::nullopt), no_workers), std::invalid_argument);

    ServerOptions no_queue;
    no_queue.dispatch_queue = 0;
    EXPECT_THROW(Server("@daily", no_queue), std::invalid_argument);
}

TEST_F(ServerFixture, StopTwiceIsHarmless) {
    make_server(1h);
    start();
    server->stop();
    server->stop();
    EXPECT_EQ(finish(), ShutdownReason::stopped);
    server->stop();
}

TEST_F(ServerFixture, StopBeforeServeExitsOnFirstIteration) {
    make_server(1h);
    server->stop();
    EXPECT_EQ(server->serve(), ShutdownReason::stopped);
    EXPECT_EQ(storage->open_watchers(), 0);
}

TEST_F(ServerFixture, ExecutorPoolIsFrozenOnceServing) {
    make_server(1h);
    start();
    EXPECT_THROW(server->handler().register_executor(std::make_shared<FakeExecutor>()),
                 std::logic_error);
}

TEST_F(ServerFixture, ServeRunsOnlyOnce) {
    make_server(1h);
    server->stop();
    server->serve();
    EXPECT_THROW(server->serve(), std::logic_error);
}

TEST(ServerPreparation, ServeRequiresPrepare) {
    Server s(std::make_unique<FakeSchedule>(std::nullopt));
    EXPECT_THROW(s.serve(), std::logic_error);
    EXPECT_THROW(s.handler(), std::logic_error);
}
