#ifndef RASTERIZER_H
#define RASTERIZER_H

#include "GlyphMatrix.h"

// Primitives over a 25x25 flat buffer. Brightness is clamped before writing,
// points outside the grid are skipped, later writes replace earlier ones.
// A buffer that is not FLAT_ARRAY_SIZE cells is left alone.
namespace GlyphMatrix {

// Parametric sampling: max(|dx|, |dy|, 1) steps, both endpoints included.
void DrawLine(FlatBuffer& buf, int x1, int y1, int x2, int y2, int brightness);

// Outline sampled every floor(360 / (radius * 8)) degrees, so small radii
// come out sparse. Radius 0 plots the center; negative radii draw nothing.
void DrawCircle(FlatBuffer& buf, int cx, int cy, int radius, int brightness);

// Filled disk: every cell within Euclidean distance `radius` of the center.
void DrawDot(FlatBuffer& buf, int cx, int cy, int radius, int brightness);

void FillGrid(FlatBuffer& buf, int brightness);

// Single checked write, used by the wave drawers.
void PlotPixel(FlatBuffer& buf, int x, int y, int brightness);

} // namespace GlyphMatrix

#endif // RASTERIZER_H
