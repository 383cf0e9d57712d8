#include "test.h"
#include "RenderConfig.h"
#include "utils.h"

#include <cstdlib>

namespace {

const char* VARS[] = {
    "GLYPH_PATTERN", "GLYPH_FRAMES", "GLYPH_FRAME_DELAY_MS", "GLYPH_BRIGHTNESS",
    "GLYPH_OUTPUT", "GLYPH_THREADS", "GLYPH_MASK", "GLYPH_BASS", "GLYPH_SCROLL_SPEED",
    "GLYPH_TEXT", "GLYPH_WAVELENGTH", "GLYPH_FFT_FILE", "GLYPH_FFT_CAPTURE_BYTES"
};

struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }
    static void clear() {
        for (const char* name : VARS) unsetenv(name);
    }
};

} // namespace

TEST_CASE("defaults") {
    EnvGuard env;
    RenderConfig cfg = LoadRenderConfig();
    CHECK(cfg.pattern == Pattern::RotatingLine);
    CHECK_EQ(cfg.frames, 12);
    CHECK_EQ(cfg.frame_delay_ms, 100);
    CHECK_EQ(cfg.brightness, 255);
    CHECK(cfg.output == OutputFormat::Pixels);
    CHECK_EQ(cfg.threads, 1);
    CHECK(cfg.mask);
    CHECK_EQ(cfg.text, "GLYPH");
    CHECK_EQ(cfg.font_size, doctest::Approx(7.0));
    CHECK(cfg.fft_path.empty());
    CHECK_EQ(cfg.fft_capture_bytes, 0);
}

TEST_CASE("environment overrides") {
    EnvGuard env;
    setenv("GLYPH_PATTERN", "horizontal_wave", 1);
    setenv("GLYPH_FRAMES", "30", 1);
    setenv("GLYPH_BRIGHTNESS", "400", 1);
    setenv("GLYPH_OUTPUT", "json", 1);
    setenv("GLYPH_MASK", "off", 1);
    setenv("GLYPH_BASS", "0.25", 1);
    setenv("GLYPH_WAVELENGTH", "3.5", 1);
    setenv("GLYPH_TEXT", "HELLO", 1);
    setenv("GLYPH_FFT_FILE", "/tmp/capture.fft", 1);
    setenv("GLYPH_FFT_CAPTURE_BYTES", "1024", 1);

    RenderConfig cfg = LoadRenderConfig();
    CHECK(cfg.pattern == Pattern::HorizontalWave);
    CHECK_EQ(cfg.frames, 30);
    // clamped later by the renderer
    CHECK_EQ(cfg.brightness, 400);
    CHECK(cfg.output == OutputFormat::Json);
    CHECK_FALSE(cfg.mask);
    CHECK_EQ(cfg.bass, doctest::Approx(0.25));
    CHECK_EQ(cfg.wavelength, doctest::Approx(3.5));
    CHECK_EQ(cfg.text, "HELLO");
    CHECK_EQ(cfg.fft_path, "/tmp/capture.fft");
    CHECK_EQ(cfg.fft_capture_bytes, 1024);
}

TEST_CASE("bad values fall back or clamp") {
    EnvGuard env;
    setenv("GLYPH_PATTERN", "spiral", 1);
    setenv("GLYPH_FRAMES", "abc", 1);
    setenv("GLYPH_THREADS", "0", 1);
    setenv("GLYPH_SCROLL_SPEED", "50", 1);
    setenv("GLYPH_MASK", "maybe", 1);
    RenderConfig cfg = LoadRenderConfig();
    CHECK(cfg.pattern == Pattern::RotatingLine);
    CHECK_EQ(cfg.frames, 12);
    CHECK_EQ(cfg.threads, 1);
    CHECK_EQ(cfg.scroll_speed, 10);
    CHECK(cfg.mask);

    setenv("GLYPH_FRAMES", "0", 1);
    setenv("GLYPH_FRAME_DELAY_MS", "-5", 1);
    cfg = LoadRenderConfig();
    CHECK_EQ(cfg.frames, 1);
    CHECK_EQ(cfg.frame_delay_ms, 1);

    setenv("GLYPH_FRAMES", "100000", 1);
    cfg = LoadRenderConfig();
    CHECK_EQ(cfg.frames, 3600);
}

TEST_CASE("pattern names") {
    Pattern p = Pattern::Fill;
    CHECK(ParsePattern("spectrum", p));
    CHECK(p == Pattern::Spectrum);
    CHECK_FALSE(ParsePattern("Spectrum", p));
    CHECK(p == Pattern::Spectrum);

    for (Pattern each : {Pattern::RotatingLine, Pattern::Pulse, Pattern::Wave, Pattern::HorizontalWave,
                         Pattern::Spectrum, Pattern::Cover, Pattern::Text, Pattern::Fill}) {
        Pattern parsed = Pattern::Fill;
        CHECK(ParsePattern(PatternName(each), parsed));
        CHECK(parsed == each);
    }
}

TEST_CASE("env helpers") {
    EnvGuard env;
    setenv("GLYPH_TEXT", "", 1);
    CHECK_EQ(getenv_string("GLYPH_TEXT", "fallback"), "fallback");
    setenv("GLYPH_BASS", "1e-1", 1);
    CHECK_EQ(getenv_double("GLYPH_BASS", 0.0), doctest::Approx(0.1));
    setenv("GLYPH_FRAMES", "99999999999999", 1);
    CHECK_EQ(getenv_int("GLYPH_FRAMES", 7), 7);
    CHECK(getenv_bool("GLYPH_MASK", true));
}
