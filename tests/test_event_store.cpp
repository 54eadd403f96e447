/**
 * test_event_store.cpp
 *
 * Unit tests for the SQLite event table and the asynchronous EventSink.
 */

#include "core/events/EventSink.hpp"
#include "core/events/EventStore.hpp"
#include "core/events/InitDb.hpp"
#include "test_support.hpp"

#include <thread>

using namespace potlog;

static std::string fresh_db(const TempDir& dir) {
    const std::string db = (dir.path() / "events.db").string();
    initDatabase(db, POTLOG_SCHEMA_PATH);
    return db;
}

bool TestInitIsIdempotent() {
    TempDir dir;
    const std::string db = fresh_db(dir);
    ASSERT_TRUE(initDatabase(db, POTLOG_SCHEMA_PATH), "second init succeeds");
    EventStore store(db);
    ASSERT_EQ(store.countEvents("export"), static_cast<int64_t>(0), "empty table");
    return true;
}

bool TestAppendAndQuery() {
    TempDir dir;
    EventStore store(fresh_db(dir));
    store.appendEvent({"export", "dev1", "{\"bytes\":10}", 1700000000});
    store.appendEvent({"import", "dev1", "{}", 1700000001});
    store.appendEvent({"export", "dev2", "{}", 1700000002});

    ASSERT_EQ(store.countEvents("export"), static_cast<int64_t>(2), "export count");
    ASSERT_EQ(store.countEvents("import"), static_cast<int64_t>(1), "import count");

    auto events = store.eventsForDevice("dev1");
    ASSERT_EQ(events.size(), static_cast<std::size_t>(2), "dev1 events");
    ASSERT_EQ(events[0].event_type, std::string("export"), "insertion order");
    ASSERT_EQ(events[0].details_json, std::string("{\"bytes\":10}"), "details kept");
    ASSERT_EQ(events[0].at, static_cast<int64_t>(1700000000), "timestamp kept");
    ASSERT_EQ(events[1].event_type, std::string("import"), "second event");
    return true;
}

bool TestSinkDrainsIntoStore() {
    TempDir dir;
    EventStore store(fresh_db(dir));
    EventSink sink(store);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&sink, t] {
            for (int i = 0; i < 25; ++i) {
                sink.emit("image-upload", "dev" + std::to_string(t), {{"n", i}});
            }
        });
    }
    for (auto& th : threads) th.join();
    sink.flush();

    ASSERT_EQ(store.countEvents("image-upload"), static_cast<int64_t>(100), "all events written");
    auto events = store.eventsForDevice("dev2");
    ASSERT_EQ(events.size(), static_cast<std::size_t>(25), "per-device events");
    ASSERT_EQ(events[0].details_json, std::string("{\"n\":0}"), "details serialized");
    return true;
}

bool TestEmptyDeviceIsAnonymous() {
    TempDir dir;
    EventStore store(fresh_db(dir));
    EventSink sink(store);
    sink.emit("error", "", {{"message", "boom"}});
    sink.flush();

    auto events = store.eventsForDevice("anonymous");
    ASSERT_EQ(events.size(), static_cast<std::size_t>(1), "recorded as anonymous");
    ASSERT_EQ(events[0].event_type, std::string("error"), "event type");
    return true;
}

bool TestFullQueueDrops() {
    TempDir dir;
    EventStore store(fresh_db(dir));
    {
        EventSink sink(store, 0);
        sink.emit("export", "dev5");
        sink.flush();
    }
    ASSERT_EQ(store.countEvents("export"), static_cast<int64_t>(0), "zero-capacity sink drops");
    return true;
}

int main() {
    TestRunner runner("EventStore / EventSink Tests");
    runner.run(TestInitIsIdempotent, "Init is idempotent");
    runner.run(TestAppendAndQuery, "Append and query");
    runner.run(TestSinkDrainsIntoStore, "Sink drains into store");
    runner.run(TestEmptyDeviceIsAnonymous, "Empty device is anonymous");
    runner.run(TestFullQueueDrops, "Full queue drops");
    return runner.finish();
}
