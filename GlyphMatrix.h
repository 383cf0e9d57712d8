#ifndef GLYPH_MATRIX_H
#define GLYPH_MATRIX_H

#include <array>
#include <string>
#include <vector>

// Logical grid handed to the matrix driver (25x25, row-major)
const int TOTAL_ROWS = 25;
const int MAX_COLUMNS = 25;
const int FLAT_ARRAY_SIZE = TOTAL_ROWS * MAX_COLUMNS;

// Real pixels per row of the lens-shaped matrix
constexpr std::array<int, TOTAL_ROWS> GLYPH_SHAPE = {
    7, 11, 15, 17, 19, 21, 21, 23, 23, 25,
    25, 25, 25, 25, 25, 25, 23, 23, 21, 21,
    19, 17, 15, 11, 7
};

using FlatBuffer = std::vector<int>;
using ShapedGrid = std::vector<std::vector<int>>;

namespace GlyphMatrix {

enum class Status {
    Ok,
    ShapeMismatch,  // wrong row count or row length
    SizeMismatch,   // flat data not exactly FLAT_ARRAY_SIZE cells
    Parse,          // bad token or token count in a pixel string
    Range,          // row index outside [0, TOTAL_ROWS)
    Io,
    Decode
};

const char* StatusName(Status status);

// Shaped grid (only real pixels per row) -> centered 25x25 buffer.
// `out` is left untouched unless Status::Ok is returned.
Status ShapedToFlat(const ShapedGrid& grid, FlatBuffer& out);
Status FlatToShaped(const FlatBuffer& flat, ShapedGrid& out);

ShapedGrid CreateEmptyShaped();
FlatBuffer CreateEmptyFlat();

Status GetRowWidth(int row, int& width);
Status GetRowOffset(int row, int& offset);

// Column at which `row` starts once centered; callers guarantee 0 <= row < TOTAL_ROWS.
constexpr int RowOffset(int row) {
    return (MAX_COLUMNS - GLYPH_SHAPE[row]) / 2;
}

int ClampBrightness(int value);

// "v0,v1,...,v624" <-> flat buffer
Status ParsePixelString(const std::string& text, FlatBuffer& out);
Status FlatArrayToPixelString(const FlatBuffer& flat, std::string& out);

bool IsPixelInShape(int x, int y);
// Zero every cell that has no physical pixel behind it.
Status ApplyShapeMask(FlatBuffer& flat);

} // namespace GlyphMatrix

#endif // GLYPH_MATRIX_H
