/**
 * @file test_event_log.cpp
 * @brief Unit tests for the append-only event stream.
 */

#include "telemetry/event_log.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

using namespace agent_orchestrator;

TEST(EventLogTest, AppendAssignsIncreasingSeq) {
    auto sink = std::make_unique<MemorySink>();
    auto* memory = sink.get();
    EventLog log("run1", std::move(sink));

    EXPECT_EQ(log.append("", events::kRunStart), 1u);
    EXPECT_EQ(log.append("a", events::kTaskReady), 2u);
    EXPECT_EQ(log.append("a", events::kTaskStart, {{"attempt", 1}}), 3u);
    EXPECT_EQ(log.size(), 3u);

    auto lines = memory->lines();
    ASSERT_EQ(lines.size(), 3u);
    auto record = nlohmann::json::parse(lines[2]);
    EXPECT_EQ(record["seq"], 3);
    EXPECT_EQ(record["run_id"], "run1");
    EXPECT_EQ(record["task"], "a");
    EXPECT_EQ(record["event"], "task_start");
    EXPECT_EQ(record["payload"]["attempt"], 1);
    EXPECT_TRUE(record["ts"].is_string());
}

TEST(EventLogTest, Queries) {
    EventLog log("run1", std::make_unique<NullSink>());
    log.append("a", events::kTaskStart);
    log.append("b", events::kTaskStart);
    log.append("a", events::kTaskSucceeded);

    EXPECT_TRUE(log.has_event("a", events::kTaskSucceeded));
    EXPECT_FALSE(log.has_event("b", events::kTaskSucceeded));
    EXPECT_EQ(log.first_seq("b", events::kTaskStart), 2u);
    EXPECT_FALSE(log.first_seq("c", events::kTaskStart).has_value());
    EXPECT_EQ(log.events_for("a").size(), 2u);
    EXPECT_EQ(log.snapshot().size(), 3u);
}

TEST(EventLogTest, ConcurrentAppendsNeverInterleave) {
    auto sink = std::make_unique<MemorySink>();
    auto* memory = sink.get();
    EventLog log("run1", std::move(sink));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&log, t] {
            for (int i = 0; i < 100; ++i) {
                log.append("t" + std::to_string(t), events::kEscalation, {{"i", i}});
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto lines = memory->lines();
    ASSERT_EQ(lines.size(), 800u);
    std::set<uint64_t> seqs;
    for (const auto& line : lines) {
        auto event = parse_event_line(line);
        ASSERT_TRUE(event.has_value()) << line;
        seqs.insert(event->seq);
    }
    EXPECT_EQ(seqs.size(), 800u);
    EXPECT_EQ(*seqs.begin(), 1u);
    EXPECT_EQ(*seqs.rbegin(), 800u);
}

TEST(EventLogTest, ParseRejectsMalformed) {
    EXPECT_FALSE(parse_event_line("not json").has_value());
    EXPECT_FALSE(parse_event_line("[1,2]").has_value());
    EXPECT_FALSE(parse_event_line(R"({"seq":1,"event":"x"})").has_value());
    EXPECT_FALSE(parse_event_line(R"({"seq":1,"ts":"garbage","event":"x"})").has_value());
}

TEST(EventLogTest, ReadEventFileFiltersRunAndSkipsBadLines) {
    auto path = std::filesystem::temp_directory_path() / "ao_test_events.jsonl";
    std::filesystem::remove(path);
    {
        EventLog first("run1", std::make_unique<JsonFileSink>(path, 0));
        first.append("", events::kRunStart);
        first.append("a", events::kTaskStart);
    }
    std::ofstream(path, std::ios::app) << "{truncated\n\n";
    {
        EventLog second("run2", std::make_unique<JsonFileSink>(path, 0));
        second.append("", events::kRunStart);
    }

    auto all = read_event_file(path);
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->size(), 3u);

    auto run1 = read_event_file(path, "run1");
    ASSERT_TRUE(run1.has_value());
    ASSERT_EQ(run1->size(), 2u);
    EXPECT_EQ((*run1)[1].task_id, "a");
    EXPECT_EQ((*run1)[1].event_type, "task_start");

    std::filesystem::remove(path);
    auto missing = read_event_file(path);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::Io);
}
