#include "simpleshare/registry.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace simpleshare;

TEST(Registry, CreateStartsQueued) {
    Registry registry;
    JobId id = registry.create("https://example.com/watch?v=1");

    EXPECT_FALSE(id.empty());
    EXPECT_EQ(id.find('.'), std::string::npos);

    auto record = registry.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->source, "https://example.com/watch?v=1");
    EXPECT_EQ(record->snapshot.status, Status::Queued);
    EXPECT_EQ(record->snapshot.progress, 0);
    EXPECT_FALSE(record->snapshot.url.has_value());
    EXPECT_FALSE(record->snapshot.error.has_value());
    EXPECT_EQ(registry.size(), 1u);
}

TEST(Registry, UnknownIdIsAbsent) {
    Registry registry;
    EXPECT_FALSE(registry.get("missing").has_value());
    EXPECT_FALSE(registry.snapshot("missing").has_value());
    EXPECT_FALSE(registry.exists("missing"));

    JobPatch patch;
    patch.progress = 10;
    EXPECT_FALSE(registry.update("missing", patch).has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(Registry, UpdateReturnsMergedSnapshot) {
    Registry registry;
    JobId id = registry.create("src");

    JobPatch downloading;
    downloading.status = Status::Downloading;
    downloading.progress = 0;
    auto merged = registry.update(id, downloading);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->status, Status::Downloading);

    JobPatch progress;
    progress.progress = 40;
    merged = registry.update(id, progress);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->progress, 40);

    auto stored = registry.snapshot(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, *merged);

    auto record = registry.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_GE(record->updated, record->created);
}

TEST(Registry, TerminalRecordIgnoresLaterPatches) {
    Registry registry;
    JobId id = registry.create("src");

    JobPatch failed;
    failed.status = Status::Error;
    failed.error = "fetch failed";
    (void)registry.update(id, failed);

    JobPatch late;
    late.status = Status::Done;
    late.progress = 100;
    late.url = "http://localhost/public/x.mp4";
    auto merged = registry.update(id, late);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->status, Status::Error);
    EXPECT_FALSE(merged->url.has_value());
}

TEST(Registry, ConcurrentCreatesYieldUniqueIds) {
    Registry registry(4);
    constexpr int threads = 8;
    constexpr int perThread = 250;

    std::mutex idsMutex;
    std::set<JobId> ids;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            std::vector<JobId> local;
            for (int i = 0; i < perThread; ++i) {
                local.push_back(registry.create("src"));
            }
            std::lock_guard<std::mutex> lock(idsMutex);
            ids.insert(local.begin(), local.end());
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(threads * perThread));
    EXPECT_EQ(registry.size(), static_cast<std::size_t>(threads * perThread));
}
