#include "GlyphMatrix.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool parse_int(const std::string& token, int& value) {
    if (token.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(token.c_str(), &end, 10);
    if (!end || *end != '\0') return false;
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
    value = static_cast<int>(v);
    return true;
}

} // namespace

namespace GlyphMatrix {

const char* StatusName(Status status) {
    switch (status) {
        case Status::Ok: return "ok";
        case Status::ShapeMismatch: return "shape_mismatch";
        case Status::SizeMismatch: return "size_mismatch";
        case Status::Parse: return "parse_error";
        case Status::Range: return "range_error";
        case Status::Io: return "io_error";
        case Status::Decode: return "decode_error";
    }
    return "unknown";
}

Status ShapedToFlat(const ShapedGrid& grid, FlatBuffer& out) {
    if (grid.size() != static_cast<size_t>(TOTAL_ROWS)) return Status::ShapeMismatch;
    for (int row = 0; row < TOTAL_ROWS; ++row) {
        if (grid[row].size() != static_cast<size_t>(GLYPH_SHAPE[row])) {
            return Status::ShapeMismatch;
        }
    }

    FlatBuffer flat(FLAT_ARRAY_SIZE, 0);
    for (int row = 0; row < TOTAL_ROWS; ++row) {
        int start = RowOffset(row);
        std::copy(grid[row].begin(), grid[row].end(),
                  flat.begin() + row * MAX_COLUMNS + start);
    }
    out = std::move(flat);
    return Status::Ok;
}

Status FlatToShaped(const FlatBuffer& flat, ShapedGrid& out) {
    if (flat.size() != static_cast<size_t>(FLAT_ARRAY_SIZE)) return Status::SizeMismatch;

    ShapedGrid grid(TOTAL_ROWS);
    for (int row = 0; row < TOTAL_ROWS; ++row) {
        auto first = flat.begin() + row * MAX_COLUMNS + RowOffset(row);
        grid[row].assign(first, first + GLYPH_SHAPE[row]);
    }
    out = std::move(grid);
    return Status::Ok;
}

ShapedGrid CreateEmptyShaped() {
    ShapedGrid grid(TOTAL_ROWS);
    for (int row = 0; row < TOTAL_ROWS; ++row) {
        grid[row].assign(GLYPH_SHAPE[row], 0);
    }
    return grid;
}

FlatBuffer CreateEmptyFlat() {
    return FlatBuffer(FLAT_ARRAY_SIZE, 0);
}

Status GetRowWidth(int row, int& width) {
    if (row < 0 || row >= TOTAL_ROWS) return Status::Range;
    width = GLYPH_SHAPE[row];
    return Status::Ok;
}

Status GetRowOffset(int row, int& offset) {
    if (row < 0 || row >= TOTAL_ROWS) return Status::Range;
    offset = RowOffset(row);
    return Status::Ok;
}

int ClampBrightness(int value) {
    return std::clamp(value, 0, 255);
}

Status ParsePixelString(const std::string& text, FlatBuffer& out) {
    FlatBuffer values;
    values.reserve(FLAT_ARRAY_SIZE);

    // Split keeps empty tokens, so "1,,2" and a trailing comma are rejected
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        std::string token = trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        int value = 0;
        if (!parse_int(token, value)) return Status::Parse;
        values.push_back(value);
        if (values.size() > static_cast<size_t>(FLAT_ARRAY_SIZE)) return Status::Parse;
        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    if (values.size() != static_cast<size_t>(FLAT_ARRAY_SIZE)) return Status::Parse;
    out = std::move(values);
    return Status::Ok;
}

Status FlatArrayToPixelString(const FlatBuffer& flat, std::string& out) {
    if (flat.size() != static_cast<size_t>(FLAT_ARRAY_SIZE)) return Status::SizeMismatch;
    std::ostringstream ss;
    for (size_t i = 0; i < flat.size(); ++i) {
        if (i > 0) ss << ',';
        ss << flat[i];
    }
    out = ss.str();
    return Status::Ok;
}

bool IsPixelInShape(int x, int y) {
    if (y < 0 || y >= TOTAL_ROWS) return false;
    int start = RowOffset(y);
    return x >= start && x < start + GLYPH_SHAPE[y];
}

Status ApplyShapeMask(FlatBuffer& flat) {
    if (flat.size() != static_cast<size_t>(FLAT_ARRAY_SIZE)) return Status::SizeMismatch;
    for (int y = 0; y < TOTAL_ROWS; ++y) {
        for (int x = 0; x < MAX_COLUMNS; ++x) {
            if (!IsPixelInShape(x, y)) {
                flat[y * MAX_COLUMNS + x] = 0;
            }
        }
    }
    return Status::Ok;
}

} // namespace GlyphMatrix
