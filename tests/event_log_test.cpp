#include <gtest/gtest.h>
#include <sstream>
#include <nlohmann/json.hpp>
#include "runtime/event_log.hpp"

using namespace sandkit::runtime;

// NOLINTNEXTLINE
TEST(event_log, entries_are_numbered_and_tagged) {
    EventLog log("abc123");
    log.log(EventCategory::LIFECYCLE, "PROVISION_START", {{"image", "python:3.9-slim"}});
    log.log(EventCategory::EXECUTION, "RUN_CODE");

    auto entries = log.get_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, 1u);
    EXPECT_EQ(entries[1].id, 2u);
    EXPECT_EQ(entries[0].sandbox_id, "abc123");
    EXPECT_EQ(entries[0].details["image"], "python:3.9-slim");
    EXPECT_TRUE(entries[1].success);
    EXPECT_EQ(log.last_entry_id(), 2u);
}

// NOLINTNEXTLINE
TEST(event_log, filters_by_category_since_and_limit) {
    EventLog log("s");
    for (int i = 0; i < 5; i++) {
        log.log(EventCategory::FILESYSTEM, "WRITE_FILE", {{"n", i}});
        log.log(EventCategory::CLEANUP, "STOP_CONTAINER");
    }

    auto fs = log.get_entries(EventCategory::FILESYSTEM);
    ASSERT_EQ(fs.size(), 5u);
    for (const auto& e : fs) {
        EXPECT_EQ(e.category, EventCategory::FILESYSTEM);
    }

    auto since = log.get_entries(std::nullopt, 8);
    ASSERT_EQ(since.size(), 2u);
    EXPECT_EQ(since[0].id, 9u);

    // Limit keeps the newest, in chronological order
    auto newest = log.get_entries(EventCategory::FILESYSTEM, 0, 2);
    ASSERT_EQ(newest.size(), 2u);
    EXPECT_EQ(newest[0].details["n"], 3);
    EXPECT_EQ(newest[1].details["n"], 4);
}

// NOLINTNEXTLINE
TEST(event_log, failures_carry_the_error) {
    EventLog log("s");
    log.log(EventCategory::CLEANUP, "STOP_CONTAINER");
    log.log_failure(EventCategory::CLEANUP, "REMOVE_IMAGE", "conflict: image in use", {{"image", "sandkit/s"}});

    auto failures = log.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_FALSE(failures[0].success);
    EXPECT_EQ(failures[0].event_type, "REMOVE_IMAGE");
    EXPECT_EQ(failures[0].details["error"], "conflict: image in use");
    EXPECT_EQ(failures[0].details["image"], "sandkit/s");
}

// NOLINTNEXTLINE
TEST(event_log, bounded_capacity_drops_oldest) {
    EventLog log("s", 3);
    for (int i = 0; i < 10; i++) {
        log.log(EventCategory::EXECUTION, "RUN_CODE", {{"n", i}});
    }
    EXPECT_EQ(log.entry_count(), 3u);
    auto entries = log.get_entries();
    EXPECT_EQ(entries.front().details["n"], 7);
    EXPECT_EQ(log.last_entry_id(), 10u);

    log.clear();
    EXPECT_EQ(log.entry_count(), 0u);
    log.log(EventCategory::EXECUTION, "RUN_CODE");
    // Ids keep increasing across clear()
    EXPECT_EQ(log.get_entries().front().id, 11u);
}

// NOLINTNEXTLINE
TEST(event_log, jsonl_export) {
    EventLog log("s");
    log.log(EventCategory::LIFECYCLE, "READY", {{"container", "c1"}});
    log.log_failure(EventCategory::CLEANUP, "REMOVE_CONTAINER", "boom");

    std::istringstream in(log.export_jsonl());
    std::string line;
    std::vector<nlohmann::json> rows;
    while (std::getline(in, line)) {
        rows.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["category"], "LIFECYCLE");
    EXPECT_EQ(rows[0]["event_type"], "READY");
    EXPECT_EQ(rows[0]["sandbox_id"], "s");
    EXPECT_EQ(rows[1]["success"], false);

    std::string ts = rows[0]["timestamp"];
    ASSERT_EQ(ts.size(), 24u) << ts;   // 2026-01-02T03:04:05.678Z
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');

    EXPECT_EQ(log.export_jsonl(1).find('\n'), log.export_jsonl(1).size() - 1);
}

// NOLINTNEXTLINE
TEST(event_log, category_names_round_trip) {
    for (auto cat : {EventCategory::LIFECYCLE, EventCategory::EXECUTION,
                     EventCategory::FILESYSTEM, EventCategory::CLEANUP}) {
        auto parsed = event_category_from_string(event_category_to_string(cat));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, cat);
    }
    EXPECT_FALSE(event_category_from_string("lifecycle"));
}
