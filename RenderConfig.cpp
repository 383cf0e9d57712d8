#include "RenderConfig.h"
#include "utils.h"
#include <iostream>
#include <map>
#include <thread>

namespace {

const std::map<std::string, Pattern> PATTERNS = {
    {"rotating_line", Pattern::RotatingLine},
    {"pulse", Pattern::Pulse},
    {"wave", Pattern::Wave},
    {"horizontal_wave", Pattern::HorizontalWave},
    {"spectrum", Pattern::Spectrum},
    {"cover", Pattern::Cover},
    {"text", Pattern::Text},
    {"fill", Pattern::Fill}
};

}

bool ParsePattern(const std::string& name, Pattern& out) {
    auto it = PATTERNS.find(name);
    if (it == PATTERNS.end()) return false;
    out = it->second;
    return true;
}

const char* PatternName(Pattern pattern) {
    for (const auto& pair : PATTERNS) {
        if (pair.second == pattern) return pair.first.c_str();
    }
    return "unknown";
}

RenderConfig LoadRenderConfig() {
    RenderConfig cfg;

    std::string pattern = getenv_string("GLYPH_PATTERN", PatternName(cfg.pattern));
    if (!ParsePattern(pattern, cfg.pattern)) {
        std::cerr << "Unknown GLYPH_PATTERN '" << pattern << "', using "
                  << PatternName(cfg.pattern) << std::endl;
    }

    cfg.frames = getenv_int_clamped("GLYPH_FRAMES", cfg.frames, 1, 3600);
    cfg.frame_delay_ms = getenv_int_clamped("GLYPH_FRAME_DELAY_MS", cfg.frame_delay_ms, 1, 10000);
    // Brightness is clamped by the renderer itself, pass it through untouched
    cfg.brightness = getenv_int("GLYPH_BRIGHTNESS", cfg.brightness);
    cfg.theme_brightness = getenv_int("GLYPH_THEME_BRIGHTNESS", cfg.theme_brightness);

    cfg.line_length = getenv_int("GLYPH_LINE_LENGTH", cfg.line_length);
    cfg.max_radius = getenv_int("GLYPH_MAX_RADIUS", cfg.max_radius);
    cfg.amplitude = getenv_int("GLYPH_AMPLITUDE", cfg.amplitude);
    cfg.wavelength = getenv_double("GLYPH_WAVELENGTH", cfg.wavelength);
    cfg.thickness = getenv_int("GLYPH_THICKNESS", cfg.thickness);

    cfg.bass = getenv_double("GLYPH_BASS", cfg.bass);
    cfg.mid = getenv_double("GLYPH_MID", cfg.mid);
    cfg.treble = getenv_double("GLYPH_TREBLE", cfg.treble);
    cfg.fft_path = getenv_string("GLYPH_FFT_FILE", cfg.fft_path);
    cfg.fft_capture_bytes = getenv_int_clamped("GLYPH_FFT_CAPTURE_BYTES", cfg.fft_capture_bytes, 0, 1 << 20);
    cfg.level_smoothing = getenv_double("GLYPH_LEVEL_SMOOTHING", cfg.level_smoothing);

    cfg.image_path = getenv_string("GLYPH_IMAGE", cfg.image_path);
    cfg.enhance_contrast = getenv_bool("GLYPH_CONTRAST", cfg.enhance_contrast);
    cfg.paused_opacity = getenv_double("GLYPH_OPACITY", cfg.paused_opacity);

    cfg.text = getenv_string("GLYPH_TEXT", cfg.text);
    cfg.font_path = getenv_string("GLYPH_FONT", cfg.font_path);
    cfg.font_size = static_cast<float>(getenv_double("GLYPH_FONT_SIZE", cfg.font_size));
    cfg.scroll_speed = getenv_int_clamped("GLYPH_SCROLL_SPEED", cfg.scroll_speed, 1, 10);

    std::string output = getenv_string("GLYPH_OUTPUT", "pixels");
    cfg.output = (output == "json") ? OutputFormat::Json : OutputFormat::Pixels;

    int hw = static_cast<int>(std::thread::hardware_concurrency());
    cfg.threads = getenv_int_clamped("GLYPH_THREADS", cfg.threads, 1, hw > 0 ? hw : 1);
    cfg.mask = getenv_bool("GLYPH_MASK", cfg.mask);
    cfg.debug = getenv_bool("GLYPH_DEBUG", cfg.debug);
    return cfg;
}
