#include "FrameGenerator.h"
#include "Rasterizer.h"
#include <algorithm>
#include <cmath>
#include <thread>

namespace {
constexpr double kPi = 3.141592653589793;

static int at_least_one(int frame_count) {
    return frame_count < 1 ? 1 : frame_count;
}
}

namespace GlyphMatrix {

double PhaseOffset(int frame_index, int frame_count) {
    if (frame_count <= 1) return 0.0;
    return frame_index * 2.0 * kPi / frame_count;
}

FrameSequence GenerateFrames(int frame_count,
                             const std::function<FlatBuffer(int)>& frame_fn,
                             int threads) {
    if (frame_count <= 0) return {};
    FrameSequence frames(static_cast<size_t>(frame_count));

    int workers = std::clamp(threads, 1, frame_count);
    if (workers == 1) {
        for (int f = 0; f < frame_count; ++f) {
            frames[f] = frame_fn(f);
        }
        return frames;
    }

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back([&frames, &frame_fn, frame_count, workers, w]() {
            for (int f = w; f < frame_count; f += workers) {
                frames[f] = frame_fn(f);
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    return frames;
}

FlatBuffer RotatingLineFrame(int frame_index, int frame_count, int line_length, int brightness) {
    frame_count = at_least_one(frame_count);
    FlatBuffer grid = CreateEmptyFlat();
    double angle = frame_index * 360.0 / frame_count;
    double rad = angle * kPi / 180.0;

    int end_x = CENTER_X + static_cast<int>(std::round(std::cos(rad) * line_length));
    int end_y = CENTER_Y + static_cast<int>(std::round(std::sin(rad) * line_length));

    DrawLine(grid, CENTER_X, CENTER_Y, end_x, end_y, brightness);
    DrawDot(grid, CENTER_X, CENTER_Y, 1, brightness);
    return grid;
}

FlatBuffer PulseFrame(int frame_index, int frame_count, int max_radius, int brightness) {
    frame_count = at_least_one(frame_count);
    FlatBuffer grid = CreateEmptyFlat();
    double progress = static_cast<double>(frame_index) / frame_count;
    int radius = static_cast<int>(std::round(std::sin(progress * kPi) * max_radius));

    if (radius > 0) {
        DrawCircle(grid, CENTER_X, CENTER_Y, radius, brightness);
    }
    DrawDot(grid, CENTER_X, CENTER_Y, 1, brightness);
    return grid;
}

FlatBuffer WaveFrame(int frame_index, int frame_count, int amplitude, int brightness) {
    frame_count = at_least_one(frame_count);
    FlatBuffer grid = CreateEmptyFlat();
    double phase = frame_index * 2.0 * kPi / frame_count;

    for (int x = 0; x < MAX_COLUMNS; ++x) {
        int y = CENTER_Y + static_cast<int>(std::round(std::sin(x * 0.5 + phase) * amplitude));
        PlotPixel(grid, x, y, brightness);
    }
    return grid;
}

FlatBuffer HorizontalWaveFrame(int frame_index, int frame_count, int amplitude,
                               int brightness, double wavelength) {
    FlatBuffer grid = CreateEmptyFlat();
    DrawHorizontalWave(grid, frame_index, frame_count, amplitude, brightness, wavelength);
    return grid;
}

void DrawHorizontalWave(FlatBuffer& buf,
                        int frame_index,
                        int frame_count,
                        int amplitude,
                        int brightness,
                        double wavelength,
                        int thickness) {
    int value = ClampBrightness(brightness);
    int amp = std::clamp(amplitude, 1, 8);
    int thick = std::clamp(thickness, 1, 3);
    int half = thick / 2;
    double phase = PhaseOffset(frame_index, frame_count);

    for (int x = 0; x < MAX_COLUMNS; ++x) {
        int wave_y = CENTER_Y + static_cast<int>(std::round(
            std::sin(x * wavelength * kPi / MAX_COLUMNS + phase) * amp));

        for (int offset = -half; offset <= half; ++offset) {
            double distance = static_cast<double>(std::abs(offset)) / std::max(half, 1);
            int adjusted = static_cast<int>(value * (1.0 - distance * 0.4));
            PlotPixel(buf, x, wave_y + offset, adjusted);
        }
    }
}

FrameSequence RotatingLineFrames(int frame_count, int line_length, int brightness) {
    return GenerateFrames(frame_count, [=](int f) {
        return RotatingLineFrame(f, frame_count, line_length, brightness);
    });
}

FrameSequence PulseFrames(int frame_count, int max_radius, int brightness) {
    return GenerateFrames(frame_count, [=](int f) {
        return PulseFrame(f, frame_count, max_radius, brightness);
    });
}

FrameSequence WaveFrames(int frame_count, int amplitude, int brightness) {
    return GenerateFrames(frame_count, [=](int f) {
        return WaveFrame(f, frame_count, amplitude, brightness);
    });
}

FrameSequence HorizontalWaveFrames(int frame_count, int amplitude, int brightness, double wavelength) {
    return GenerateFrames(frame_count, [=](int f) {
        return HorizontalWaveFrame(f, frame_count, amplitude, brightness, wavelength);
    });
}

} // namespace GlyphMatrix
