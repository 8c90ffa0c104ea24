#include "agentlink/data/offline_queue.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

using namespace agentlink;
using namespace agentlink::data;
using namespace std::chrono_literals;
using agentlink::testing::ManualClock;
using agentlink::testing::MemoryActionStore;

namespace {

struct Harness {
    MemoryActionStore store;
    ManualClock clock;
    StaticConnectivity connectivity{true};
    std::vector<PendingAction> dispatched;
    bool sink_ok = true;
    OfflineActionQueue queue{store, clock, connectivity, [this](const PendingAction &a) {
                                 if (!sink_ok) {
                                     return false;
                                 }
                                 dispatched.push_back(a);
                                 return true;
                             }};
};

} // namespace

TEST(OfflineActionQueue, QueueApprovalPersists) {
    Harness h;
    auto action = h.queue.queue_approval("req-1", true);

    EXPECT_EQ(action.request_id, "req-1");
    EXPECT_TRUE(action.approved);
    EXPECT_EQ(action.id.size(), 36u);
    EXPECT_EQ(action.timestamp, h.clock.now());

    EXPECT_EQ(h.store.save_count, 1);
    ASSERT_EQ(h.store.stored.size(), 1u);
    EXPECT_EQ(h.store.stored[0], action);
    EXPECT_TRUE(h.queue.has_pending());
    EXPECT_EQ(h.queue.ttl(), 120s);
}

TEST(OfflineActionQueue, PreservesInsertionOrder) {
    Harness h;
    h.queue.queue_approval("a", true);
    h.queue.queue_approval("b", false);
    h.queue.queue_approval("c", true);

    auto pending = h.queue.pending_actions();
    ASSERT_EQ(pending.size(), 3u);
    EXPECT_EQ(pending[0].request_id, "a");
    EXPECT_EQ(pending[1].request_id, "b");
    EXPECT_EQ(pending[2].request_id, "c");
    EXPECT_NE(pending[0].id, pending[1].id);
}

TEST(OfflineActionQueue, RestoresFromStore) {
    MemoryActionStore store;
    store.stored = {PendingAction{"id-1", "req-1", false, TimePoint(1000s)}};
    ManualClock clock;
    StaticConnectivity connectivity;
    OfflineActionQueue queue(store, clock, connectivity,
                             [](const PendingAction &) { return true; });

    EXPECT_EQ(store.load_count, 1);
    ASSERT_EQ(queue.pending_count(), 1u);
    EXPECT_EQ(queue.pending_actions()[0].request_id, "req-1");
}

TEST(OfflineActionQueue, ProcessDispatchesExactlyOnce) {
    Harness h;
    h.queue.queue_approval("req-1", false);

    auto result = h.queue.process_queue();

    EXPECT_EQ(result.dispatched, 1u);
    EXPECT_EQ(result.expired, 0u);
    EXPECT_EQ(result.remaining, 0u);
    ASSERT_EQ(h.dispatched.size(), 1u);
    EXPECT_EQ(h.dispatched[0].request_id, "req-1");
    EXPECT_FALSE(h.dispatched[0].approved);
    EXPECT_FALSE(h.queue.has_pending());
    EXPECT_TRUE(h.store.stored.empty());

    h.queue.process_queue();
    EXPECT_EQ(h.dispatched.size(), 1u);
}

TEST(OfflineActionQueue, ExpiredEntryDroppedSilently) {
    Harness h;
    h.queue.queue_approval("old", true);
    h.clock.advance(100s);
    h.queue.queue_approval("fresh", true);
    h.clock.advance(21s);

    auto result = h.queue.process_queue();

    EXPECT_EQ(result.expired, 1u);
    EXPECT_EQ(result.dispatched, 1u);
    ASSERT_EQ(h.dispatched.size(), 1u);
    EXPECT_EQ(h.dispatched[0].request_id, "fresh");
    EXPECT_FALSE(h.queue.has_pending());
}

TEST(OfflineActionQueue, EntryAtExactlyTtlIsKept) {
    Harness h;
    h.queue.queue_approval("edge", true);
    h.clock.advance(120s);

    auto result = h.queue.process_queue();
    EXPECT_EQ(result.expired, 0u);
    EXPECT_EQ(result.dispatched, 1u);
}

TEST(OfflineActionQueue, PartialBatch) {
    Harness h;
    h.queue.queue_approval("expired", true);
    h.clock.advance(200s);
    h.queue.queue_approval("fresh1", true);
    h.queue.queue_approval("fresh2", false);

    auto result = h.queue.process_queue();

    EXPECT_EQ(result.expired, 1u);
    EXPECT_EQ(result.dispatched, 2u);
    ASSERT_EQ(h.dispatched.size(), 2u);
    EXPECT_EQ(h.dispatched[0].request_id, "fresh1");
    EXPECT_EQ(h.dispatched[1].request_id, "fresh2");
    EXPECT_EQ(h.queue.pending_count(), 0u);
    EXPECT_TRUE(h.store.stored.empty());
}

TEST(OfflineActionQueue, OfflinePassDoesNoIo) {
    Harness h;
    h.queue.queue_approval("req-1", true);
    h.clock.advance(500s);
    const int saves = h.store.save_count;
    h.connectivity.set_connected(false);

    auto result = h.queue.process_queue();

    EXPECT_EQ(result.dispatched, 0u);
    EXPECT_EQ(result.expired, 0u);
    EXPECT_EQ(result.remaining, 1u);
    EXPECT_EQ(h.store.save_count, saves);
    EXPECT_TRUE(h.dispatched.empty());
}

TEST(OfflineActionQueue, DispatchFailureStopsPass) {
    Harness h;
    h.queue.queue_approval("a", true);
    h.queue.queue_approval("b", true);
    const int saves = h.store.save_count;
    h.sink_ok = false;

    auto result = h.queue.process_queue();

    EXPECT_EQ(result.dispatched, 0u);
    EXPECT_EQ(result.remaining, 2u);
    EXPECT_EQ(h.store.save_count, saves);

    h.sink_ok = true;
    result = h.queue.process_queue();
    EXPECT_EQ(result.dispatched, 2u);
    ASSERT_EQ(h.dispatched.size(), 2u);
    EXPECT_EQ(h.dispatched[0].request_id, "a");
}

TEST(OfflineActionQueue, ConnectivityLostMidPass) {
    MemoryActionStore store;
    ManualClock clock;
    StaticConnectivity connectivity{true};
    std::vector<std::string> sent;
    OfflineActionQueue queue(store, clock, connectivity, [&](const PendingAction &a) {
        sent.push_back(a.request_id);
        connectivity.set_connected(false);
        return true;
    });
    queue.queue_approval("a", true);
    queue.queue_approval("b", true);
    queue.queue_approval("c", true);

    auto result = queue.process_queue();

    EXPECT_EQ(result.dispatched, 1u);
    EXPECT_EQ(result.remaining, 2u);
    EXPECT_EQ(sent, std::vector<std::string>{"a"});
    auto pending = queue.pending_actions();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].request_id, "b");
    EXPECT_EQ(pending[1].request_id, "c");
    EXPECT_EQ(store.stored, pending);
}

TEST(OfflineActionQueue, ExpiryPersistsEvenWhenDispatchFails) {
    Harness h;
    h.queue.queue_approval("old", true);
    h.clock.advance(130s);
    h.queue.queue_approval("new", true);
    h.sink_ok = false;

    auto result = h.queue.process_queue();

    EXPECT_EQ(result.expired, 1u);
    EXPECT_EQ(result.remaining, 1u);
    ASSERT_EQ(h.store.stored.size(), 1u);
    EXPECT_EQ(h.store.stored[0].request_id, "new");
}

TEST(OfflineActionQueue, RemoveAction) {
    Harness h;
    h.queue.queue_approval("a", true);
    h.queue.queue_approval("b", true);
    h.queue.queue_approval("a", false);
    const int saves = h.store.save_count;

    h.queue.remove_action("missing");
    EXPECT_EQ(h.store.save_count, saves);

    h.queue.remove_action("a");
    EXPECT_EQ(h.store.save_count, saves + 1);
    auto pending = h.queue.pending_actions();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].request_id, "b");
}

TEST(OfflineActionQueue, ClearAll) {
    Harness h;
    h.queue.queue_approval("a", true);
    h.queue.queue_approval("b", true);

    h.queue.clear_all();
    EXPECT_FALSE(h.queue.has_pending());
    EXPECT_TRUE(h.store.stored.empty());
}

TEST(OfflineActionQueue, FailedSaveLeavesQueueUnchanged) {
    Harness h;
    h.queue.queue_approval("a", true);
    h.store.fail_saves = true;

    EXPECT_THROW(h.queue.queue_approval("b", false), std::runtime_error);
    EXPECT_EQ(h.queue.pending_count(), 1u);

    EXPECT_THROW(h.queue.remove_action("a"), std::runtime_error);
    EXPECT_THROW(h.queue.clear_all(), std::runtime_error);
    ASSERT_EQ(h.queue.pending_count(), 1u);
    EXPECT_EQ(h.queue.pending_actions()[0].request_id, "a");
    EXPECT_EQ(h.store.stored, h.queue.pending_actions());

    h.store.fail_saves = false;
    h.queue.queue_approval("b", false);
    EXPECT_EQ(h.store.stored.size(), 2u);
}

TEST(OfflineActionQueue, CustomTtl) {
    MemoryActionStore store;
    ManualClock clock;
    StaticConnectivity connectivity;
    int sent = 0;
    OfflineActionQueue queue(
        store, clock, connectivity,
        [&](const PendingAction &) {
            ++sent;
            return true;
        },
        10s);
    queue.queue_approval("a", true);
    clock.advance(11s);

    auto result = queue.process_queue();
    EXPECT_EQ(result.expired, 1u);
    EXPECT_EQ(sent, 0);
}

TEST(OfflineActionQueue, SurvivesRestartWithFileStore) {
    namespace fs = std::filesystem;
    const auto path = fs::temp_directory_path() / "agentlink_offline_queue_restart.json";
    fs::remove(path);

    ManualClock clock;
    StaticConnectivity connectivity{false};
    auto never = [](const PendingAction &) { return false; };
    {
        FileActionStore store(path.string());
        OfflineActionQueue queue(store, clock, connectivity, never);
        queue.queue_approval("req-1", true);
        queue.queue_approval("req-2", false);
    }

    FileActionStore store(path.string());
    OfflineActionQueue reloaded(store, clock, connectivity, never);
    auto pending = reloaded.pending_actions();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].request_id, "req-1");
    EXPECT_FALSE(pending[1].approved);
    EXPECT_EQ(pending[0].timestamp, clock.now());

    fs::remove(path);
}
