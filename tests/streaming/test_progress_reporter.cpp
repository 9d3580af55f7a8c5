#include <catch2/catch_test_macros.hpp>
#include "streaming/ProgressReporter.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace streaming;
using namespace std::chrono_literals;

TEST_CASE("StreamingProgress derived values", "[streaming][progress]") {
    StreamingProgress p;
    REQUIRE(p.progressPercentage() == 0.0);
    REQUIRE(p.isComplete());

    p.total_chunks = 4;
    p.processed_chunks = 1;
    REQUIRE(p.progressPercentage() == 25.0);
    REQUIRE_FALSE(p.isComplete());

    p.processed_chunks = 4;
    REQUIRE(p.isComplete());
}

TEST_CASE("ProgressReporter ticks callbacks until stopped", "[streaming][progress]") {
    std::atomic<std::size_t> counter{0};
    ProgressReporter reporter(
        [&counter] {
            StreamingProgress p;
            p.total_chunks = 10;
            p.processed_chunks = counter.load();
            return p;
        },
        10ms);

    std::atomic<int> ticks{0};
    std::atomic<std::size_t> last_seen{0};
    reporter.addCallback([&](const StreamingProgress& p) {
        ++ticks;
        last_seen = p.processed_chunks;
    });
    REQUIRE(reporter.hasCallbacks());

    REQUIRE(reporter.start());
    REQUIRE_FALSE(reporter.start());
    REQUIRE(reporter.running());

    counter = 3;
    std::this_thread::sleep_for(80ms);
    counter = 7;
    reporter.stop();

    REQUIRE_FALSE(reporter.running());
    REQUIRE(ticks.load() >= 2);
    // stop() delivers a final snapshot after joining.
    REQUIRE(last_seen.load() == 7);

    const int after_stop = ticks.load();
    std::this_thread::sleep_for(40ms);
    REQUIRE(ticks.load() == after_stop);
}

TEST_CASE("ProgressReporter isolates throwing callbacks", "[streaming][progress]") {
    ProgressReporter reporter([] { return StreamingProgress{}; }, 10ms);
    std::atomic<int> good{0};
    reporter.addCallback([](const StreamingProgress&) { throw std::runtime_error("bad callback"); });
    reporter.addCallback([](const StreamingProgress&) { throw 7; });
    reporter.addCallback([&good](const StreamingProgress&) { ++good; });

    REQUIRE(reporter.start());
    std::this_thread::sleep_for(50ms);
    reporter.Shutdown();
    REQUIRE(good.load() >= 1);
}
