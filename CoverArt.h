#ifndef COVER_ART_H
#define COVER_ART_H

#include "GlyphMatrix.h"
#include <string>
#include <vector>

namespace GlyphMatrix {

// Decode an image (anything stb_image reads: PNG, JPEG, BMP, ...) into a
// 25x25 luminance buffer. Transparent pixels count as dark.
Status DecodeCoverArt(const std::vector<unsigned char>& encoded, FlatBuffer& out,
                      bool enhance_contrast = true);
Status LoadCoverArt(const std::string& path, FlatBuffer& out, bool enhance_contrast = true);

// Histogram stretch ignoring the darkest and brightest 1% of cells.
void EnhanceContrast(FlatBuffer& luminance);

// Rotated (degrees, clockwise on screen) and cut to the round face of the
// matrix with a one-pixel fade at the rim, then scaled by opacity.
FlatBuffer CoverArtFrame(const FlatBuffer& luminance, double rotation_degrees = 0.0,
                         double opacity = 1.0);

} // namespace GlyphMatrix

#endif // COVER_ART_H
