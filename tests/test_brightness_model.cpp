#include "test.h"
#include "BrightnessModel.h"

using namespace GlyphMatrix;

TEST_CASE("final brightness") {
    CHECK_EQ(FinalBrightness(200, 255), 200);
    CHECK_EQ(FinalBrightness(200, 128), 100);
    CHECK_EQ(FinalBrightness(0, 255), 0);
    CHECK_EQ(FinalBrightness(255, 0), 0);
    CHECK_EQ(FinalBrightness(255, 600), 255);
}

TEST_CASE("theme brightness over a buffer") {
    FlatBuffer buf = CreateEmptyFlat();
    buf[0] = 255;
    buf[1] = 100;
    ApplyThemeBrightness(buf, 51);
    CHECK_EQ(buf[0], 51);
    CHECK_EQ(buf[1], 20);
    CHECK_EQ(buf[2], 0);
}

TEST_CASE("preview alpha") {
    CHECK_EQ(PreviewAlpha(0, 255), 0.0);
    CHECK_EQ(PreviewAlpha(255, 255), doctest::Approx(1.0));
    double dim = PreviewAlpha(1, 255);
    CHECK(dim >= 0.5);
    CHECK(dim < 0.6);
    CHECK(PreviewAlpha(128, 255) < PreviewAlpha(200, 255));
}

TEST_CASE("multiplier conversions") {
    CHECK_EQ(MultiplierToBrightness(1.0), 255);
    CHECK_EQ(MultiplierToBrightness(0.5), 127);
    CHECK_EQ(MultiplierToBrightness(2.0), 255);
    CHECK_EQ(MultiplierToBrightness(-1.0), 0);
    CHECK_EQ(BrightnessToMultiplier(255), doctest::Approx(1.0));
    CHECK_EQ(BrightnessToMultiplier(510), doctest::Approx(1.0));
    CHECK_EQ(BrightnessToMultiplier(-5), doctest::Approx(0.0));
}

TEST_CASE("opacity") {
    FlatBuffer buf(FLAT_ARRAY_SIZE, 200);
    ApplyOpacity(buf, 2.0);
    CHECK_EQ(buf[0], 200);
    ApplyOpacity(buf, 0.5);
    CHECK_EQ(buf[0], 100);
    ApplyOpacity(buf, -1.0);
    CHECK_EQ(count_lit(buf), 0);
}

TEST_CASE("gamma") {
    CHECK_EQ(GammaCorrect(0), 0);
    CHECK_EQ(GammaCorrect(255), 255);
    CHECK(GammaCorrect(64) > 64);
    CHECK_EQ(GammaCorrect(300, 0.0), 255);
}
