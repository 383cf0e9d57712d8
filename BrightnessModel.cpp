#include "BrightnessModel.h"
#include <algorithm>
#include <cmath>

namespace {
constexpr double MIN_VISIBLE_ALPHA = 0.5;
}

namespace GlyphMatrix {

int FinalBrightness(int pixel_value, int theme_brightness) {
    if (pixel_value == 0) return 0;
    double normalized = theme_brightness / 255.0;
    return ClampBrightness(static_cast<int>(pixel_value * normalized));
}

void ApplyThemeBrightness(FlatBuffer& buf, int theme_brightness) {
    for (int& v : buf) {
        v = FinalBrightness(v, theme_brightness);
    }
}

double PreviewAlpha(int pixel_value, int theme_brightness) {
    if (pixel_value == 0) return 0.0;
    double normalized = FinalBrightness(pixel_value, theme_brightness) / 255.0;
    double alpha = MIN_VISIBLE_ALPHA + std::sqrt(normalized) * (1.0 - MIN_VISIBLE_ALPHA);
    return std::clamp(alpha, 0.0, 1.0);
}

int MultiplierToBrightness(double multiplier) {
    return ClampBrightness(static_cast<int>(multiplier * 255));
}

double BrightnessToMultiplier(int brightness) {
    return std::clamp(brightness / 255.0, 0.0, 1.0);
}

void ApplyOpacity(FlatBuffer& buf, double opacity) {
    double o = std::clamp(opacity, 0.0, 1.0);
    for (int& v : buf) {
        v = ClampBrightness(static_cast<int>(v * o));
    }
}

int GammaCorrect(int value, double gamma) {
    if (gamma <= 0.0) return ClampBrightness(value);
    double normalized = std::clamp(value / 255.0, 0.0, 1.0);
    double corrected = std::pow(normalized, 1.0 / gamma);
    return ClampBrightness(static_cast<int>(corrected * 255));
}

} // namespace GlyphMatrix
