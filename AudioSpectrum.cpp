#include "AudioSpectrum.h"
#include "FrameGenerator.h"
#include "Rasterizer.h"
#include <algorithm>
#include <cmath>

namespace {

constexpr double kPi = 3.141592653589793;

struct Band {
    int baseline;
    int amplitude_cap;      // also the level multiplier
    double brightness_scale;
    double cycles;          // half-cycles across the grid width
};

constexpr Band BASS   = {GlyphMatrix::BASS_ROW, 6, 0.9, 0.8};
constexpr Band MID    = {GlyphMatrix::MID_ROW, 4, 0.8, 1.5};
constexpr Band TREBLE = {GlyphMatrix::TREBLE_ROW, 3, 0.7, 2.5};

static void draw_band(FlatBuffer& buf, const Band& band, double level, double phase, int max_brightness) {
    // also rejects NaN
    if (!(level > GlyphMatrix::BAND_THRESHOLD)) return;

    // clamp as double, the products can exceed int range
    int amplitude = static_cast<int>(std::clamp(std::round(level * band.amplitude_cap),
                                                1.0, static_cast<double>(band.amplitude_cap)));
    int brightness = static_cast<int>(std::clamp(max_brightness * level * band.brightness_scale,
                                                 0.0, 255.0));

    for (int x = 0; x < MAX_COLUMNS; ++x) {
        int y = band.baseline + static_cast<int>(std::round(
            std::sin(x * band.cycles * kPi / MAX_COLUMNS + phase) * amplitude));
        GlyphMatrix::PlotPixel(buf, x, y, brightness);
    }
}

} // namespace

namespace GlyphMatrix {

void DrawAudioSpectrumWaves(FlatBuffer& buf,
                            double bass_level,
                            double mid_level,
                            double treble_level,
                            int frame_index,
                            int frame_count,
                            int max_brightness) {
    double phase = PhaseOffset(frame_index, frame_count);
    draw_band(buf, BASS, bass_level, phase, max_brightness);
    draw_band(buf, MID, mid_level, phase, max_brightness);
    draw_band(buf, TREBLE, treble_level, phase, max_brightness);
}

} // namespace GlyphMatrix
