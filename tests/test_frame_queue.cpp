#include <catch2/catch_test_macros.hpp>
#include "springy/FrameQueue.hpp"
#include "utils/ErrorReporter.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using springy::FrameQueue;
using springy::FrameRequestId;

TEST_CASE("FrameQueue - Running frames", "[frames]")
{
    FrameQueue frames;
    std::vector<int> order;
    std::vector<double> stamps;

    SECTION("Callbacks run once, in request order, with the frame timestamp")
    {
        frames.requestFrame([&](double ts) {
            order.push_back(1);
            stamps.push_back(ts);
        });
        frames.requestFrame([&](double ts) {
            order.push_back(2);
            stamps.push_back(ts);
        });

        REQUIRE(frames.runFrame(42.0) == 2);
        REQUIRE(order == std::vector<int>{ 1, 2 });
        REQUIRE(stamps == std::vector<double>{ 42.0, 42.0 });

        REQUIRE(frames.runFrame(58.0) == 0);
        REQUIRE(order.size() == 2);
    }

    SECTION("Requests made during a frame run on the next one")
    {
        frames.requestFrame([&](double) {
            order.push_back(1);
            frames.requestFrame([&](double) { order.push_back(2); });
        });

        REQUIRE(frames.runFrame(0.0) == 1);
        REQUIRE(order == std::vector<int>{ 1 });
        REQUIRE(frames.pendingCount() == 1);

        REQUIRE(frames.runFrame(16.0) == 1);
        REQUIRE(order == std::vector<int>{ 1, 2 });
        REQUIRE(frames.empty());
    }
}

TEST_CASE("FrameQueue - Cancellation", "[frames]")
{
    FrameQueue frames;
    int calls = 0;

    SECTION("Cancelled requests never run")
    {
        FrameRequestId id = frames.requestFrame([&](double) { ++calls; });
        frames.cancelFrame(id);
        REQUIRE(frames.empty());
        REQUIRE(frames.runFrame(0.0) == 0);
        REQUIRE(calls == 0);
    }

    SECTION("An earlier callback can cancel a later one in the same frame")
    {
        FrameRequestId later = 0;
        frames.requestFrame([&](double) { frames.cancelFrame(later); });
        later = frames.requestFrame([&](double) { ++calls; });

        REQUIRE(frames.runFrame(0.0) == 1);
        REQUIRE(calls == 0);
    }

    SECTION("Unknown ids are ignored")
    {
        frames.requestFrame([&](double) { ++calls; });
        REQUIRE_NOTHROW(frames.cancelFrame(9999));
        frames.runFrame(0.0);
        REQUIRE(calls == 1);
    }
}

TEST_CASE("FrameQueue - Failing callbacks", "[frames]")
{
    utils::ErrorReporter::ClearErrors();
    FrameQueue frames;
    int calls = 0;

    frames.requestFrame([](double) { throw std::runtime_error("frame exploded"); });
    frames.requestFrame([&](double) { ++calls; });

    REQUIRE_NOTHROW(frames.runFrame(0.0));
    REQUIRE(calls == 1);

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].category == utils::ErrorCategory::Scheduling);
    REQUIRE(errors[0].technical_details.find("frame exploded") != std::string::npos);
}

TEST_CASE("FrameQueue - Callbacks throwing non-standard exceptions", "[frames]")
{
    utils::ErrorReporter::ClearErrors();
    FrameQueue frames;
    int calls = 0;

    frames.requestFrame([](double) { throw 42; });
    frames.requestFrame([&](double) { ++calls; });

    REQUIRE_NOTHROW(frames.runFrame(0.0));
    REQUIRE(calls == 1);

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].category == utils::ErrorCategory::Scheduling);
    REQUIRE(errors[0].technical_details.find("unknown exception") != std::string::npos);
}
