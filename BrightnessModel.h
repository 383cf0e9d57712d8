#ifndef BRIGHTNESS_MODEL_H
#define BRIGHTNESS_MODEL_H

#include "GlyphMatrix.h"

// One place for how a pattern's pixel values become what the matrix shows,
// so the hardware frame and any on-screen preview agree.
namespace GlyphMatrix {

// Theme brightness (0-255, 255 = 100%) applied as a multiplier; zero pixels stay zero.
int FinalBrightness(int pixel_value, int theme_brightness);
void ApplyThemeBrightness(FlatBuffer& buf, int theme_brightness);

// Alpha for previews. The panel has a high visible floor, so the curve
// starts at 0.5 and follows sqrt() to 1.0.
double PreviewAlpha(int pixel_value, int theme_brightness);

int MultiplierToBrightness(double multiplier);
double BrightnessToMultiplier(int brightness);

// Scales every cell by opacity (clamped to [0, 1]).
void ApplyOpacity(FlatBuffer& buf, double opacity);

int GammaCorrect(int value, double gamma = 2.2);

} // namespace GlyphMatrix

#endif // BRIGHTNESS_MODEL_H
