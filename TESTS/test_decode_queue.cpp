#include "doctest/doctest.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>

#include "loader/decode_queue.hpp"
#include "loader/image_decoder.hpp"
#include "test_support.hpp"

using namespace mablocks;

TEST_CASE("Decode queue hands every finished result back on drain") {
    std::atomic<int> calls{0};
    DecodeQueue queue([&calls](const std::string& path, bool full) {
        ++calls;
        DecodeResult result;
        result.frames = mablocks::test::blank_frames(full ? 3 : 1);
        result.original_size = SDL_FPoint{64.0f, 32.0f};
        result.has_animation = path.find(".gif") != std::string::npos;
        return result;
    });

    queue.request("a.png", false);
    queue.request("b.gif", true);
    queue.request("", false);
    queue.wait_idle();
    CHECK_FALSE(queue.is_busy());

    auto results = queue.drain();
    REQUIRE(results.size() == 2);
    CHECK(calls == 2);
    std::sort(results.begin(), results.end(), [](const auto& l, const auto& r) { return l.path < r.path; });
    CHECK(results[0].path == "a.png");
    CHECK_FALSE(results[0].full);
    CHECK(results[0].frames.size() == 1);
    CHECK(results[1].path == "b.gif");
    CHECK(results[1].full);
    CHECK(results[1].frames.size() == 3);
    CHECK(results[1].has_animation);

    CHECK(queue.drain().empty());
}

TEST_CASE("Decoder exceptions become failed results") {
    DecodeQueue queue([](const std::string&, bool) -> DecodeResult {
        throw std::runtime_error("corrupt header");
    });
    queue.request("broken.png", false);
    queue.wait_idle();

    const auto results = queue.drain();
    REQUIRE(results.size() == 1);
    CHECK_FALSE(results[0].ok());
    CHECK(results[0].path == "broken.png");
    CHECK(results[0].error.find("corrupt header") != std::string::npos);
}

TEST_CASE("Missing files fail to decode without throwing") {
    const DecodeResult result = decode_image("/definitely/not/here.png", false);
    CHECK_FALSE(result.ok());
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("Display size fits the maximum dimension without upscaling") {
    const SDL_FPoint big = scaled_size(SDL_FPoint{840.0f, 420.0f});
    CHECK(big.x == doctest::Approx(kMaxBlockDimension));
    CHECK(big.y == doctest::Approx(kMaxBlockDimension / 2.0f));

    const SDL_FPoint small = scaled_size(SDL_FPoint{100.0f, 50.0f});
    CHECK(small.x == doctest::Approx(100.0f));
    CHECK(small.y == doctest::Approx(50.0f));
}
