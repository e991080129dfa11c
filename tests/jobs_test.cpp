#include <gtest/gtest.h>
#include "jobs.hpp"
#include "sqlite_storage.hpp"
#include "fakes.hpp"
#include <future>

using namespace cmdb;
using namespace cmdb::test;
using namespace std::chrono_literals;

namespace {

class JobsTest : public ::testing::Test {
protected:
    std::shared_ptr<SqliteStorage> storage = std::make_shared<SqliteStorage>(":memory:");

    void add_machine(const std::string& name, const std::string& zone) {
        Machine m;
        m.name = name;
        m.hostname = name + ".example.net";
        m.zone = zone;
        storage->create(m);
    }
};

} // namespace

TEST_F(JobsTest, DigestCapturesStoredMachines) {
    add_machine("a", "z1");
    add_machine("b", "z2");
    MachineDigest d = new_machine_digest();
    storage->create(d);

    make_digest_job(storage, quiet_logger())(d);

    MachineDigest got;
    got.name = d.name;
    storage->get(got);
    EXPECT_EQ(got.state, digest_state::completed);
    EXPECT_EQ(got.machines.size(), 2u);
    EXPECT_EQ(got.guid, d.guid);
}

TEST_F(JobsTest, DigestRemovedMeanwhileIsSkipped) {
    MachineDigest d = new_machine_digest();
    EXPECT_NO_THROW(make_digest_job(storage, quiet_logger())(d));
    ObjectList<MachineDigest> digests;
    storage->list(digests);
    EXPECT_TRUE(digests.items.empty());
}

TEST_F(JobsTest, DiscoveryCollectsZoneMachines) {
    add_machine("a", "z1");
    add_machine("b", "z2");
    add_machine("c", "z1");
    DiscoveredMachines latest;
    latest.state = discovery_state::started;
    latest.zones = {"z1"};
    storage->create(latest);

    make_discovery_job(storage, quiet_logger())(latest);

    DiscoveredMachines got;
    storage->get(got);
    EXPECT_EQ(got.state, discovery_state::finished);
    EXPECT_EQ(got.machines, (std::vector<std::string>{"a.example.net", "c.example.net"}));
}

TEST_F(JobsTest, DiscoveryIgnoresSettledRecords) {
    DiscoveredMachines latest;
    latest.state = discovery_state::finished;
    storage->create(latest);
    auto w = storage->watch(DiscoveredMachines(), WatchMode::name);

    make_discovery_job(storage, quiet_logger())(latest);
    EXPECT_FALSE(w->output().try_pop().has_value());
}

TEST_F(JobsTest, DiscoveryRejectedWriteLeavesRecord) {
    DiscoveredMachines latest;
    latest.state = discovery_state::started;
    storage->create(latest);
    // A guid the store does not know makes the final update fail.
    DiscoveredMachines stale = latest;
    stale.guid = "stale";

    make_discovery_job(storage, quiet_logger())(stale);

    DiscoveredMachines got;
    storage->get(got);
    EXPECT_EQ(got.state, discovery_state::started);
}

TEST(QueueExecutor, RunsJobsInOrder) {
    std::mutex mu;
    std::vector<std::string> seen;
    QueueExecutor exec(
        "executor-0",
        [&](const MachineDigest& d) {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back("digest " + d.guid);
        },
        [&](const DiscoveredMachines& l) {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back("discovery " + l.state);
        },
        0s, quiet_logger());

    MachineDigest d;
    d.guid = "g1";
    DiscoveredMachines l;
    l.state = discovery_state::started;

    // Not started yet: ignored.
    exec.notify_digest(d);
    exec.start();
    exec.notify_digest(d);
    exec.notify_discovered_machines(l);
    ASSERT_TRUE(eventually([&] { return exec.processed() == 2; }));
    exec.stop();

    std::lock_guard<std::mutex> lock(mu);
    EXPECT_EQ(seen, (std::vector<std::string>{"digest g1", "discovery Started"}));
}

TEST(QueueExecutor, JobFailureKeepsWorkerAlive) {
    std::atomic<int> runs{0};
    QueueExecutor exec(
        "executor-0",
        [&](const MachineDigest&) {
            ++runs;
            throw std::runtime_error("boom");
        },
        {}, 0s, quiet_logger());
    exec.start();
    MachineDigest d;
    exec.notify_digest(d);
    exec.notify_digest(d);
    ASSERT_TRUE(eventually([&] { return exec.processed() == 2; }));
    EXPECT_EQ(runs, 2);
}

TEST(QueueExecutor, NonStandardThrowKeepsWorkerAlive) {
    std::atomic<int> discoveries{0};
    QueueExecutor exec(
        "executor-0",
        [](const MachineDigest&) { throw 42; },
        [&](const DiscoveredMachines&) { ++discoveries; },
        0s, quiet_logger());
    exec.start();
    exec.notify_digest(MachineDigest());
    exec.notify_discovered_machines(DiscoveredMachines());
    ASSERT_TRUE(eventually([&] { return exec.processed() == 2; }));
    EXPECT_EQ(discoveries, 1);
}

TEST(QueueExecutor, FullQueueDropsNewJobs) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> started{false};
    std::atomic<int> runs{0};
    QueueExecutor exec(
        "executor-0",
        [&](const MachineDigest&) {
            started = true;
            gate.wait();
            ++runs;
        },
        {}, 0s, quiet_logger(), 2);
    exec.start();

    MachineDigest d;
    exec.notify_digest(d);
    EXPECT_TRUE(eventually([&] { return started.load(); }));
    // One job running, two waiting, the rest refused.
    for (int i = 0; i < 4; ++i) exec.notify_digest(d);
    EXPECT_EQ(exec.dropped(), 2u);

    release.set_value();
    ASSERT_TRUE(eventually([&] { return exec.processed() == 3; }));
    EXPECT_EQ(runs, 3);
    exec.stop();
}

TEST(QueueExecutor, RejectsZeroQueue) {
    EXPECT_THROW(QueueExecutor("executor-0", {}, {}, 0s, quiet_logger(), 0), std::invalid_argument);
}
