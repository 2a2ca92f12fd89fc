#include "simpleshare/event.hpp"
#include "simpleshare/job.hpp"

#include <gtest/gtest.h>

using namespace simpleshare;

namespace {
JobPatch stage(Status status, int progress) {
    JobPatch patch;
    patch.status = status;
    patch.progress = progress;
    return patch;
}
}

TEST(Apply, MergesOnlyPresentFields) {
    Snapshot current;
    current.status = Status::Downloading;
    current.progress = 30;

    JobPatch patch;
    patch.progress = 45;
    Snapshot next = apply(current, patch);

    EXPECT_EQ(next.status, Status::Downloading);
    EXPECT_EQ(next.progress, 45);
    EXPECT_FALSE(next.url.has_value());
    EXPECT_FALSE(next.error.has_value());
}

TEST(Apply, ProgressNeverDecreasesWithinStage) {
    Snapshot current;
    current.status = Status::Downloading;
    current.progress = 80;

    EXPECT_EQ(apply(current, stage(Status::Downloading, 5)).progress, 80);
    EXPECT_EQ(apply(current, stage(Status::Converting, 0)).progress, 0);
}

TEST(Apply, ClampsProgress) {
    Snapshot current;
    EXPECT_EQ(apply(current, stage(Status::Downloading, 250)).progress, 100);
    EXPECT_EQ(apply(current, stage(Status::Downloading, -4)).progress, 0);
}

TEST(Apply, BackwardPatchIsDiscardedWhole) {
    Snapshot current;
    current.status = Status::Converting;
    current.progress = 10;

    EXPECT_EQ(apply(current, stage(Status::Downloading, 97)), current);

    JobPatch stale = stage(Status::Starting, 60);
    stale.url = "http://elsewhere/x.mp4";
    EXPECT_EQ(apply(current, stale), current);
}

TEST(Apply, PatchWithoutStatusStaysInCurrentStage) {
    Snapshot current;
    current.status = Status::Converting;
    current.progress = 10;

    JobPatch patch;
    patch.progress = 40;
    Snapshot next = apply(current, patch);
    EXPECT_EQ(next.status, Status::Converting);
    EXPECT_EQ(next.progress, 40);
}

TEST(Apply, ErrorReachableFromAnyActiveState) {
    for (Status status : {Status::Queued, Status::Starting, Status::Downloading, Status::Converting}) {
        Snapshot current;
        current.status = status;
        current.progress = 12;

        JobPatch patch;
        patch.status = Status::Error;
        patch.error = "boom";
        Snapshot next = apply(current, patch);
        EXPECT_EQ(next.status, Status::Error);
        EXPECT_EQ(next.progress, 12);
        EXPECT_EQ(next.error, std::optional<std::string>("boom"));
    }
}

TEST(Apply, TerminalStatesAreFrozen) {
    Snapshot done;
    done.status = Status::Done;
    done.progress = 100;
    done.url = "http://localhost:5000/public/a.mp4";

    JobPatch patch;
    patch.status = Status::Error;
    patch.progress = 3;
    patch.error = "late failure";
    patch.url = "http://elsewhere";
    EXPECT_EQ(apply(done, patch), done);

    Snapshot failed;
    failed.status = Status::Error;
    failed.error = "fetch failed";
    EXPECT_EQ(apply(failed, stage(Status::Done, 100)), failed);
}

TEST(Event, SnapshotJsonHasAllFields) {
    Snapshot snapshot;
    snapshot.status = Status::Converting;
    snapshot.progress = 64;

    auto json = toJson(snapshot);
    EXPECT_EQ(json["status"], "converting");
    EXPECT_EQ(json["progress"], 64);
    EXPECT_TRUE(json["url"].is_null());
    EXPECT_TRUE(json["error"].is_null());
}

TEST(Event, SseFrames) {
    Snapshot snapshot;
    snapshot.status = Status::Done;
    snapshot.progress = 100;
    snapshot.url = "http://host/public/x.mp4";

    EXPECT_EQ(formatSse(Event{EventKind::Done, snapshot}),
              "event: done\n"
              "data: {\"error\":null,\"progress\":100,\"status\":\"done\",\"url\":\"http://host/public/x.mp4\"}\n\n");

    std::string initial = formatSse(Event{EventKind::Snapshot, snapshot});
    EXPECT_EQ(initial.rfind("data: ", 0), 0u);
}

TEST(Event, KindNames) {
    EXPECT_STREQ(toString(EventKind::DownloadProgress), "download-progress");
    EXPECT_STREQ(toString(EventKind::ConvertProgress), "convert-progress");
    EXPECT_STREQ(toString(EventKind::Message), "message");
    EXPECT_STREQ(toString(Status::Downloading), "downloading");
}
