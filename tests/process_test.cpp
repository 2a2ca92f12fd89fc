#include "simpleshare/job.hpp"
#include "simpleshare/process.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <stdexcept>

using namespace simpleshare;
using simpleshare::testing::TempDir;
using simpleshare::testing::writeScript;

TEST(Process, CapturesBothChannelsAndExitCode) {
    TempDir dir;
    auto script = writeScript(dir.path() / "talk.sh",
        "echo \"out:$1\"\n"
        "echo \"err:$2\" >&2\n"
        "exit 3\n");

    std::mutex mutex;
    std::string out;
    std::string err;
    Process process(script.string(), {"alpha", "beta"});
    process.onStdout([&](std::string_view chunk) {
        std::lock_guard<std::mutex> lock(mutex);
        out.append(chunk.data(), chunk.size());
    });
    process.onStderr([&](std::string_view chunk) {
        std::lock_guard<std::mutex> lock(mutex);
        err.append(chunk.data(), chunk.size());
    });

    ExitStatus status = process.run();
    EXPECT_EQ(status.code, 3);
    EXPECT_FALSE(status.signaled);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(out, "out:alpha\n");
    EXPECT_EQ(err, "err:beta\n");
    EXPECT_EQ(status.stderrTail, "err:beta\n");
}

TEST(Process, SuccessfulRun) {
    Process process("true", {});
    ExitStatus status = process.run();
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.code, 0);
}

TEST(Process, StderrTailKeepsLastBytes) {
    TempDir dir;
    auto script = writeScript(dir.path() / "noisy.sh",
        "i=0\n"
        "while [ $i -lt 200 ]; do echo \"line $i\" >&2; i=$((i+1)); done\n"
        "echo 'final words' >&2\n"
        "exit 1\n");

    Process process(script.string(), {});
    process.setStderrTailLimit(32);
    ExitStatus status = process.run();

    EXPECT_EQ(status.code, 1);
    EXPECT_LE(status.stderrTail.size(), 32u);
    EXPECT_NE(status.stderrTail.find("final words"), std::string::npos);
}

TEST(Process, KilledBySignal) {
    TempDir dir;
    auto script = writeScript(dir.path() / "die.sh", "kill -9 $$\n");

    Process process(script.string(), {});
    ExitStatus status = process.run();
    EXPECT_TRUE(status.signaled);
    EXPECT_EQ(status.code, 128 + 9);
    EXPECT_FALSE(status.ok());
}

TEST(Process, MissingProgramThrowsSpawnError) {
    Process process("simpleshare-no-such-program", {"x"});
    try {
        (void)process.run();
        FAIL() << "expected JobError";
    } catch (const JobError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessSpawn);
        EXPECT_NE(std::string(e.what()).find("simpleshare-no-such-program"), std::string::npos);
    }
}

TEST(Process, HandlerExceptionSurfacesAfterExit) {
    TempDir dir;
    auto script = writeScript(dir.path() / "chatty.sh",
        "i=0\n"
        "while [ $i -lt 100 ]; do echo \"row $i\"; i=$((i+1)); done\n");

    Process process(script.string(), {});
    process.onStdout([](std::string_view) { throw std::runtime_error("handler broke"); });
    EXPECT_THROW((void)process.run(), std::runtime_error);
}

TEST(Process, CommandLineJoinsArguments) {
    Process process("ffmpeg", {"-y", "-i", "in.webm", "out.mp4"});
    EXPECT_EQ(process.commandLine(), "ffmpeg -y -i in.webm out.mp4");
}

namespace {

// Starts threads normally until the given call, which fails like an
// exhausted thread limit.
ThreadStarter failingStarter(int failOnCall, std::atomic<int>& calls) {
    return [failOnCall, &calls](std::function<void()> body) {
        if (++calls == failOnCall) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::thread(std::move(body));
    };
}

void expectThreadFailureIsContained(int failOnCall) {
    TempDir dir;
    auto script = writeScript(dir.path() / "slow.sh",
        "echo started\n"
        "echo working >&2\n"
        "exec sleep 30\n");

    std::atomic<int> calls{0};
    Process process(script.string(), {});
    process.setThreadStarter(failingStarter(failOnCall, calls));

    auto begin = std::chrono::steady_clock::now();
    try {
        (void)process.run();
        FAIL() << "expected JobError";
    } catch (const JobError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessSpawn);
        EXPECT_NE(std::string(e.what()).find("I/O threads"), std::string::npos);
    }
    // The child is killed rather than waited out
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
    EXPECT_EQ(calls.load(), failOnCall);
}

}

TEST(Process, ReaderThreadFailureKillsChildAndThrows) {
    expectThreadFailureIsContained(2);
}

TEST(Process, WaiterThreadFailureKillsChildAndThrows) {
    expectThreadFailureIsContained(3);
}

TEST(Process, FirstThreadFailureKillsChildAndThrows) {
    expectThreadFailureIsContained(1);
}
