#include "test.h"
#include "FrameGenerator.h"

#include <atomic>

using namespace GlyphMatrix;

TEST_CASE("rotating line") {
    FrameSequence frames = RotatingLineFrames(4);
    REQUIRE_EQ(frames.size(), 4u);

    SUBCASE("endpoints walk the quarter turns") {
        CHECK_EQ(cell(frames[0], 20, 12), 255);
        CHECK_EQ(cell(frames[1], 12, 20), 255);
        CHECK_EQ(cell(frames[2], 4, 12), 255);
        CHECK_EQ(cell(frames[3], 12, 4), 255);
    }
    SUBCASE("center dot is drawn on every frame") {
        for (const auto& frame : frames) {
            CHECK_EQ(cell(frame, 12, 12), 255);
            CHECK_EQ(cell(frame, 11, 12), 255);
            CHECK_EQ(cell(frame, 13, 12), 255);
            CHECK_EQ(cell(frame, 12, 11), 255);
            CHECK_EQ(cell(frame, 12, 13), 255);
        }
    }
    SUBCASE("frame zero line is horizontal") {
        for (int x = 12; x <= 20; ++x) {
            CHECK_EQ(cell(frames[0], x, 12), 255);
        }
        CHECK_EQ(cell(frames[0], 21, 12), 0);
    }
}

TEST_CASE("rotating line brightness is clamped") {
    FlatBuffer frame = RotatingLineFrame(0, 4, 8, 1000);
    CHECK_EQ(cell(frame, 16, 12), 255);
}

TEST_CASE("pulse") {
    FrameSequence frames = PulseFrames(8);
    REQUIRE_EQ(frames.size(), 8u);

    // sin(0) = 0, only the center dot
    CHECK_EQ(count_lit(frames[0]), 5);
    // halfway through the cycle the ring is at max_radius
    CHECK_EQ(cell(frames[4], 22, 12), 255);
    CHECK_EQ(cell(frames[4], 2, 12), 255);
    CHECK_EQ(cell(frames[4], 12, 12), 255);
    CHECK(count_lit(frames[2]) > 5);
}

TEST_CASE("vertical wave") {
    FrameSequence frames = WaveFrames(6, 5, 180);
    REQUIRE_EQ(frames.size(), 6u);

    for (const auto& frame : frames) {
        // one pixel per column
        CHECK_EQ(count_lit(frame), 25);
        for (int y = 0; y < 7; ++y) {
            for (int x = 0; x < MAX_COLUMNS; ++x) {
                CHECK_EQ(cell(frame, x, y), 0);
            }
        }
    }
    CHECK_EQ(cell(frames[0], 0, 12), 180);
}

TEST_CASE("horizontal wave") {
    SUBCASE("thickness dims the neighbours") {
        FlatBuffer buf = CreateEmptyFlat();
        DrawHorizontalWave(buf, 0, 1, 5, 255, 2.0, 3);
        CHECK_EQ(cell(buf, 0, 12), 255);
        CHECK(cell(buf, 0, 11) >= 152);
        CHECK(cell(buf, 0, 11) <= 153);
        CHECK(cell(buf, 0, 13) >= 152);
        CHECK(cell(buf, 0, 13) <= 153);
        CHECK_EQ(cell(buf, 0, 10), 0);
    }
    SUBCASE("amplitude is clamped to [1, 8]") {
        FlatBuffer big = CreateEmptyFlat();
        FlatBuffer capped = CreateEmptyFlat();
        DrawHorizontalWave(big, 0, 1, 100, 255);
        DrawHorizontalWave(capped, 0, 1, 8, 255);
        CHECK(big == capped);

        FlatBuffer zero = CreateEmptyFlat();
        FlatBuffer one = CreateEmptyFlat();
        DrawHorizontalWave(zero, 0, 1, 0, 255);
        DrawHorizontalWave(one, 0, 1, 1, 255);
        CHECK(zero == one);
    }
    SUBCASE("thickness is clamped to [1, 3]") {
        FlatBuffer thick = CreateEmptyFlat();
        FlatBuffer three = CreateEmptyFlat();
        DrawHorizontalWave(thick, 0, 1, 5, 255, 2.0, 9);
        DrawHorizontalWave(three, 0, 1, 5, 255, 2.0, 3);
        CHECK(thick == three);
    }
    SUBCASE("single-frame cycle has zero phase") {
        CHECK_EQ(PhaseOffset(5, 1), 0.0);
        CHECK_EQ(PhaseOffset(0, 0), 0.0);
        CHECK(HorizontalWaveFrame(3, 1) == HorizontalWaveFrame(0, 1));
    }
    SUBCASE("sequence matches the single frames") {
        FrameSequence frames = HorizontalWaveFrames(5, 4, 200, 1.5);
        REQUIRE_EQ(frames.size(), 5u);
        CHECK(frames[2] == HorizontalWaveFrame(2, 5, 4, 200, 1.5));
    }
}

TEST_CASE("frame count edge cases") {
    CHECK(RotatingLineFrames(0).empty());
    CHECK(PulseFrames(-3).empty());
    CHECK(WaveFrames(0).empty());
    CHECK(HorizontalWaveFrames(0).empty());

    // single frames treat a zero count as one
    CHECK(RotatingLineFrame(0, 0) == RotatingLineFrame(0, 1));
    CHECK(PulseFrame(0, 0) == PulseFrame(0, 1));
}

TEST_CASE("parallel generation matches sequential") {
    auto fn = [](int f) { return RotatingLineFrame(f, 24, 10, 200); };
    FrameSequence sequential = GenerateFrames(24, fn, 1);
    FrameSequence parallel = GenerateFrames(24, fn, 4);
    REQUIRE_EQ(parallel.size(), 24u);
    CHECK(parallel == sequential);

    std::atomic<int> calls{0};
    FrameSequence counted = GenerateFrames(7, [&calls](int f) {
        ++calls;
        FlatBuffer grid = CreateEmptyFlat();
        grid[0] = f;
        return grid;
    }, 16);
    CHECK_EQ(calls.load(), 7);
    for (int f = 0; f < 7; ++f) {
        CHECK_EQ(counted[f][0], f);
    }
}
