#include "doctest.h"

#include "event_log.hpp"
#include "fakes.hpp"

#include <string>
#include <vector>

using namespace trainer_link;

TEST_CASE("EventLog: entries keep severity, text and timestamp") {
    EventLog log("test", 10, test::FixedClock);
    log.Info("connecting %d", 1);
    log.Success("done");
    log.Warning("slow");
    log.Error("failed: %s", "timeout");

    const auto entries = log.Snapshot();
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].message == "connecting 1");
    CHECK(entries[0].severity == Severity::Info);
    CHECK(entries[1].severity == Severity::Success);
    CHECK(entries[2].severity == Severity::Warning);
    CHECK(entries[3].message == "failed: timeout");
    CHECK(entries[3].severity == Severity::Error);
    CHECK(entries[3].timestamp_ms == 1234);
    CHECK(std::string(ToString(Severity::Success)) == "success");
}

TEST_CASE("EventLog: oldest entries are dropped past capacity") {
    EventLog log("test", 3, test::FixedClock);
    for (int i = 0; i < 5; ++i) {
        log.Info("entry %d", i);
    }
    const auto entries = log.Snapshot();
    REQUIRE(entries.size() == 3);
    CHECK(entries.front().message == "entry 2");
    CHECK(entries.back().message == "entry 4");

    log.SetCapacity(1);
    CHECK(log.Size() == 1);
    CHECK(log.Snapshot().front().message == "entry 4");
}

TEST_CASE("EventLog: callback sees every entry and may read the log") {
    EventLog log("test", 10, test::FixedClock);
    std::vector<std::string> seen;
    size_t size_in_callback = 0;
    log.SetCallback([&](const LogEntry& e) {
        seen.push_back(e.message);
        size_in_callback = log.Size();
    });

    log.Info("a");
    log.Error("b");
    CHECK(seen == std::vector<std::string>{"a", "b"});
    CHECK(size_in_callback == 2);

    log.Clear();
    CHECK(log.Size() == 0);
}

TEST_CASE("EventLog: long messages are truncated") {
    EventLog log("test", 10, test::FixedClock);
    const std::string long_text(500, 'x');
    log.Info("%s", long_text.c_str());
    CHECK(log.Snapshot().front().message.size() == EventLog::MAX_MESSAGE_LEN_ - 1);
}
