#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "profile/orchestrator.hpp"
#include "source/memory_source.hpp"
#include "test_helpers.hpp"

using namespace dprof;
using namespace dprof::testing;

namespace {

table sample_table(const std::string& name, std::int64_t rows) {
    table t;
    t.name = name;
    std::vector<std::int64_t> ids;
    std::vector<std::optional<std::string>> labels;
    for (std::int64_t i = 0; i < rows; ++i) {
        ids.push_back(i);
        labels.emplace_back(i % 2 ? "odd" : "even");
    }
    t.columns.push_back(int_column("id", ids));
    t.columns.push_back(text_column("label", labels));
    return t;
}

// Delegates to a memory source but fails the listed tables.
class flaky_source : public data_source {
public:
    memory_source inner;
    std::vector<std::string> failing;

    table fetch(const std::string& name, std::optional<std::uint64_t> cap) override {
        for (const auto& f : failing) {
            if (f == name) throw data_source_error("connection reset while reading " + name);
        }
        return inner.fetch(name, cap);
    }
    std::vector<table_info> list_tables() override { return inner.list_tables(); }
    std::uint64_t count_records(const std::string& name) override { return inner.count_records(name); }
};

// Ignores the row cap.
class oversized_source : public memory_source {
public:
    table fetch(const std::string& name, std::optional<std::uint64_t>) override {
        return memory_source::fetch(name, std::nullopt);
    }
};

// Hands out a table whose columns disagree on length.
class ragged_source : public memory_source {
public:
    table fetch(const std::string& name, std::optional<std::uint64_t>) override {
        table t = sample_table(name, 3);
        t.columns[1].values.pop_back();
        return t;
    }
};

struct progress_log {
    std::mutex       mtx;
    std::vector<int> values;
    progress_sink sink() {
        return [this](int pct) {
            std::lock_guard<std::mutex> lock(mtx);
            values.push_back(pct);
        };
    }
};

}

TEST(Orchestrator, FailingTableIsIsolated) {
    flaky_source source;
    for (int i = 1; i <= 5; ++i) source.inner.add(sample_table("t" + std::to_string(i), 20));
    source.failing = {"t3"};

    settings cfg;
    cfg.max_threads = 3;
    profile_orchestrator orch(source, cfg);
    progress_log progress;
    const auto report = orch.profile({"t1", "t2", "t3", "t4", "t5"}, std::nullopt, progress.sink());

    ASSERT_EQ(report.size(), 5u);
    for (std::size_t i = 0; i < report.tables.size(); ++i) {
        EXPECT_EQ(report.tables[i].first, "t" + std::to_string(i + 1));
    }
    const auto* failed = report.find("t3");
    ASSERT_NE(failed, nullptr);
    ASSERT_TRUE(is_error(*failed));
    EXPECT_NE(std::get<profile_error>(*failed).message.find("connection reset"), std::string::npos);

    for (const char* name : {"t1", "t2", "t4", "t5"}) {
        const auto& tp = std::get<table_profile>(*report.find(name));
        EXPECT_EQ(tp.total_records, 20u);
        EXPECT_EQ(tp.total_columns, 2u);
        ASSERT_EQ(tp.columns.size(), 2u);
        EXPECT_EQ(tp.columns[0].first, "id");
        EXPECT_EQ(tp.columns[1].first, "label");
        EXPECT_FALSE(tp.profiled_at.empty());
    }

    ASSERT_EQ(progress.values.size(), 5u);
    for (std::size_t i = 1; i < progress.values.size(); ++i) {
        EXPECT_GE(progress.values[i], progress.values[i - 1]);
    }
    EXPECT_EQ(progress.values.back(), 100);
    EXPECT_LT(progress.values[3], 100);
}

TEST(Orchestrator, ZeroRowTableKeepsItsColumns) {
    memory_source source;
    source.add(sample_table("empty", 0));
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"empty"});

    const auto& tp = std::get<table_profile>(*report.find("empty"));
    EXPECT_EQ(tp.total_records, 0u);
    EXPECT_EQ(tp.total_columns, 2u);
    ASSERT_EQ(tp.columns.size(), 2u);
    for (const auto& [name, entry] : tp.columns) {
        const auto& cp = std::get<column_profile>(entry);
        EXPECT_EQ(cp.total_values, 0u);
        EXPECT_DOUBLE_EQ(cp.quality_score, 100.0);
    }
}

TEST(Orchestrator, RowCapLimitsFetchedRows) {
    memory_source source;
    source.add(sample_table("big", 100));
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"big"}, 10);
    EXPECT_EQ(std::get<table_profile>(*report.find("big")).total_records, 10u);
}

TEST(Orchestrator, SourceIgnoringTheCapFailsTheTable) {
    oversized_source source;
    source.add(sample_table("big", 50));
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"big"}, 5);
    EXPECT_TRUE(is_error(*report.find("big")));
}

TEST(Orchestrator, RaggedTableBecomesAnError) {
    ragged_source source;
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"r"});
    ASSERT_EQ(report.size(), 1u);
    EXPECT_TRUE(is_error(*report.find("r")));
}

TEST(Orchestrator, MissingTableIsRecordedNotThrown) {
    memory_source source;
    source.add(sample_table("present", 3));
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"present", "absent"});
    EXPECT_FALSE(is_error(*report.find("present")));
    EXPECT_TRUE(is_error(*report.find("absent")));
}

TEST(Orchestrator, DuplicateIdentifiersProfiledOnce) {
    memory_source source;
    source.add(sample_table("a", 3));
    source.add(sample_table("b", 3));
    profile_orchestrator orch(source, settings{});
    progress_log progress;
    const auto report = orch.profile({"a", "b", "a"}, std::nullopt, progress.sink());
    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report.tables[0].first, "a");
    EXPECT_EQ(report.tables[1].first, "b");
    EXPECT_EQ(progress.values.back(), 100);
}

TEST(Orchestrator, EmptyRequestGivesEmptyReport) {
    memory_source source;
    profile_orchestrator orch(source, settings{});
    EXPECT_EQ(orch.profile({}).size(), 0u);
}

TEST(Orchestrator, InvalidConfigurationThrows) {
    memory_source source;
    source.add(sample_table("a", 3));
    settings bad;
    bad.max_threads = 0;
    EXPECT_THROW(profile_orchestrator(source, bad), configuration_error);

    profile_orchestrator orch(source, settings{});
    EXPECT_THROW(orch.profile({"a"}, 0), configuration_error);
}

TEST(Orchestrator, ThrowingProgressCallbackDoesNotFailTheRun) {
    memory_source source;
    source.add(sample_table("a", 3));
    profile_orchestrator orch(source, settings{});
    const auto report = orch.profile({"a"}, std::nullopt, [](int) { throw std::runtime_error("sink closed"); });
    EXPECT_FALSE(is_error(*report.find("a")));
}

TEST(Orchestrator, ProfileTableDirectly) {
    memory_source source;
    profile_orchestrator orch(source, settings{});
    const auto tp = orch.profile_table(sample_table("direct", 4));
    EXPECT_EQ(tp.table_name, "direct");
    EXPECT_EQ(tp.total_records, 4u);
    const auto& label = std::get<column_profile>(tp.columns[1].second);
    EXPECT_EQ(label.distinct_count, 2u);
}

TEST(Orchestrator, FailingColumnIsIsolated) {
    memory_source source;
    for (int i = 1; i <= 3; ++i) source.add(sample_table("t" + std::to_string(i), 10));

    settings cfg;
    cfg.max_threads = 3;
    auto failing_label = [](const column& c, const settings& s) -> column_profile {
        if (c.name == "label") throw column_profiling_error("column 'label': statistics failed: out of memory");
        return profile_column(c, s);
    };
    profile_orchestrator orch(source, cfg, failing_label);
    const auto report = orch.profile({"t1", "t2", "t3"});

    ASSERT_EQ(report.size(), 3u);
    for (const auto& [name, entry] : report.tables) {
        ASSERT_FALSE(is_error(entry)) << name;
        const auto& tp = std::get<table_profile>(entry);
        ASSERT_EQ(tp.columns.size(), tp.total_columns);
        EXPECT_EQ(tp.columns[0].first, "id");
        EXPECT_FALSE(is_error(tp.columns[0].second));
        EXPECT_EQ(std::get<column_profile>(tp.columns[0].second).distinct_count, 10u);
        EXPECT_EQ(tp.columns[1].first, "label");
        ASSERT_TRUE(is_error(tp.columns[1].second));
        EXPECT_NE(std::get<profile_error>(tp.columns[1].second).message.find("out of memory"), std::string::npos);
    }
}

TEST(Orchestrator, NonProfilingExceptionInColumnBecomesError) {
    memory_source source;
    profile_orchestrator orch(source, settings{}, [](const column& c, const settings& s) -> column_profile {
        if (c.name == "id") throw std::runtime_error("bad cell");
        return profile_column(c, s);
    });
    const auto tp = orch.profile_table(sample_table("direct", 4));
    ASSERT_EQ(tp.columns.size(), 2u);
    EXPECT_EQ(std::get<profile_error>(tp.columns[0].second).message, "bad cell");
    EXPECT_FALSE(is_error(tp.columns[1].second));
}

TEST(Orchestrator, EmptyColumnProfilerIsRejected) {
    memory_source source;
    EXPECT_THROW(profile_orchestrator(source, settings{}, column_profiler{}), configuration_error);
}

TEST(Orchestrator, ProgressSinkIsNeverEnteredConcurrently) {
    memory_source source;
    std::vector<std::string> names;
    for (int i = 0; i < 8; ++i) {
        names.push_back("t" + std::to_string(i));
        source.add(sample_table(names.back(), 5));
    }
    settings cfg;
    cfg.max_threads = 4;
    profile_orchestrator orch(source, cfg);

    std::atomic<int> inside{0};
    std::atomic<int> overlaps{0};
    std::vector<int> seen;
    const auto report = orch.profile(names, std::nullopt, [&](int pct) {
        if (inside.fetch_add(1) != 0) ++overlaps;
        seen.push_back(pct);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        inside.fetch_sub(1);
    });

    EXPECT_EQ(report.size(), names.size());
    EXPECT_EQ(overlaps.load(), 0);
    ASSERT_EQ(seen.size(), names.size());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.back(), 100);
}
