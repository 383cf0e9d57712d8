#ifndef RENDER_CONFIG_H
#define RENDER_CONFIG_H

#include <string>

enum class Pattern {
    RotatingLine,
    Pulse,
    Wave,
    HorizontalWave,
    Spectrum,
    Cover,
    Text,
    Fill
};

enum class OutputFormat {
    Pixels,
    Json
};

// Everything the host reads from GLYPH_* environment variables
struct RenderConfig {
    Pattern pattern = Pattern::RotatingLine;
    int frames = 12;
    int frame_delay_ms = 100;
    int brightness = 255;
    int theme_brightness = 255;

    int line_length = 8;
    int max_radius = 10;
    int amplitude = 5;
    double wavelength = 2.0;
    int thickness = 1;

    double bass = 0.6;
    double mid = 0.4;
    double treble = 0.3;
    std::string fft_path;
    int fft_capture_bytes = 0;  // 0: whole file is one capture
    double level_smoothing = 0.3;

    std::string image_path;
    bool enhance_contrast = true;
    double paused_opacity = 1.0;

    std::string text = "GLYPH";
    std::string font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    float font_size = 7.0f;
    int scroll_speed = 5;

    OutputFormat output = OutputFormat::Pixels;
    int threads = 1;
    bool mask = true;
    bool debug = false;
};

// Unknown names fall back to the defaults above
bool ParsePattern(const std::string& name, Pattern& out);
const char* PatternName(Pattern pattern);

RenderConfig LoadRenderConfig();

#endif // RENDER_CONFIG_H
