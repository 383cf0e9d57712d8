#include "Rasterizer.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace {

constexpr double kPi = 3.141592653589793;

static bool valid_buffer(const FlatBuffer& buf) {
    return buf.size() == static_cast<size_t>(FLAT_ARRAY_SIZE);
}

static inline void put(FlatBuffer& buf, int x, int y, int value) {
    if (x >= 0 && x < MAX_COLUMNS && y >= 0 && y < TOTAL_ROWS) {
        buf[y * MAX_COLUMNS + x] = value;
    }
}

} // namespace

namespace GlyphMatrix {

void PlotPixel(FlatBuffer& buf, int x, int y, int brightness) {
    if (!valid_buffer(buf)) return;
    put(buf, x, y, ClampBrightness(brightness));
}

void DrawLine(FlatBuffer& buf, int x1, int y1, int x2, int y2, int brightness) {
    if (!valid_buffer(buf)) return;
    int value = ClampBrightness(brightness);
    int dx = x2 - x1;
    int dy = y2 - y1;
    int steps = std::max({std::abs(dx), std::abs(dy), 1});
    for (int i = 0; i <= steps; ++i) {
        double t = static_cast<double>(i) / steps;
        int x = static_cast<int>(std::round(x1 + dx * t));
        int y = static_cast<int>(std::round(y1 + dy * t));
        put(buf, x, y, value);
    }
}

void DrawCircle(FlatBuffer& buf, int cx, int cy, int radius, int brightness) {
    if (!valid_buffer(buf)) return;
    if (radius < 0) return;
    int value = ClampBrightness(brightness);

    // Integer-degree step; past radius 45 the quotient truncates to 0, so floor at 1.
    int step = (radius == 0) ? 360 : std::max(1, 360 / (radius * 8));
    for (int angle = 0; angle < 360; angle += step) {
        double rad = angle * kPi / 180.0;
        int x = cx + static_cast<int>(std::round(std::cos(rad) * radius));
        int y = cy + static_cast<int>(std::round(std::sin(rad) * radius));
        put(buf, x, y, value);
    }
}

void DrawDot(FlatBuffer& buf, int cx, int cy, int radius, int brightness) {
    if (!valid_buffer(buf)) return;
    int value = ClampBrightness(brightness);
    const long r2 = static_cast<long>(radius) * radius;
    for (int y = cy - radius; y <= cy + radius; ++y) {
        for (int x = cx - radius; x <= cx + radius; ++x) {
            long ddx = x - cx;
            long ddy = y - cy;
            if (ddx * ddx + ddy * ddy <= r2) {
                put(buf, x, y, value);
            }
        }
    }
}

void FillGrid(FlatBuffer& buf, int brightness) {
    if (!valid_buffer(buf)) return;
    std::fill(buf.begin(), buf.end(), ClampBrightness(brightness));
}

} // namespace GlyphMatrix
