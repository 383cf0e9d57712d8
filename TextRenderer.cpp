#include "TextRenderer.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>

#include "stb_truetype.h"

namespace {
constexpr uint8_t COVERAGE_THRESHOLD = 128;
// sfnt offset table: version, numTables, searchRange, entrySelector, rangeShift
constexpr std::streamsize MIN_FONT_BYTES = 12;
constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}
}

TextRenderer::TextRenderer() = default;

TextRenderer::~TextRenderer() {
    if (font_info_) {
        delete static_cast<stbtt_fontinfo*>(font_info_);
    }
}

GlyphMatrix::Status TextRenderer::LoadFont(const std::string& font_path, float pixel_height) {
    std::ifstream file(font_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::cerr << "Failed to open font file: " << font_path << std::endl;
        return GlyphMatrix::Status::Io;
    }
    std::streamsize file_size = file.tellg();
    if (file_size < MIN_FONT_BYTES) {
        std::cerr << "Font file too small: " << font_path << std::endl;
        return GlyphMatrix::Status::Decode;
    }
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(static_cast<size_t>(std::max<std::streamsize>(file_size, 0)));
    if (!file.read(reinterpret_cast<char*>(data.data()), file_size)) {
        std::cerr << "Failed to read font file" << std::endl;
        return GlyphMatrix::Status::Io;
    }

    auto* info = new stbtt_fontinfo();
    int offset = stbtt_GetFontOffsetForIndex(data.data(), 0);
    if (offset < 0 || !stbtt_InitFont(info, data.data(), offset)) {
        std::cerr << "Failed to initialize font" << std::endl;
        delete info;
        return GlyphMatrix::Status::Decode;
    }

    // stbtt keeps pointers into the buffer, so swap both together
    if (font_info_) {
        delete static_cast<stbtt_fontinfo*>(font_info_);
    }
    font_buffer_ = std::move(data);
    info->data = font_buffer_.data();
    font_info_ = info;
    pixel_height_ = pixel_height > 1.0f ? pixel_height : 1.0f;
    return GlyphMatrix::Status::Ok;
}

int TextRenderer::MeasureTextWidth(const std::string& text, int spacing) const {
    if (!font_info_) return 0;
    auto* info = static_cast<stbtt_fontinfo*>(font_info_);
    float scale = stbtt_ScaleForPixelHeight(info, pixel_height_);
    int width = 0;
    for (uint32_t c : GlyphMatrix::DecodeUtf8(text)) {
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info, static_cast<int>(c), &advance, &lsb);
        width += static_cast<int>(advance * scale) + spacing;
    }
    return width;
}

ScrollStrip TextRenderer::RenderScrollStrip(const std::string& text, int spacing) const {
    ScrollStrip strip;
    strip.height = static_cast<int>(std::ceil(pixel_height_));
    if (!font_info_ || text.empty()) return strip;

    auto* info = static_cast<stbtt_fontinfo*>(font_info_);
    float scale = stbtt_ScaleForPixelHeight(info, pixel_height_);
    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(info, &ascent, &descent, &line_gap);
    int baseline = static_cast<int>(std::round(ascent * scale));

    strip.width = MeasureTextWidth(text, spacing) + MAX_COLUMNS;
    strip.pixels.assign(static_cast<size_t>(strip.width) * strip.height, 0);

    std::vector<uint8_t> bitmap;
    int x = 0;
    for (uint32_t cp : GlyphMatrix::DecodeUtf8(text)) {
        int c = static_cast<int>(cp);
        int advance, lsb;
        stbtt_GetCodepointHMetrics(info, c, &advance, &lsb);
        int c_x1, c_y1, c_x2, c_y2;
        stbtt_GetCodepointBitmapBox(info, c, scale, scale, &c_x1, &c_y1, &c_x2, &c_y2);

        int w = c_x2 - c_x1;
        int h = c_y2 - c_y1;
        if (w > 0 && h > 0) {
            bitmap.assign(static_cast<size_t>(w * h), 0);
            stbtt_MakeCodepointBitmap(info, bitmap.data(), w, h, w, scale, scale, c);
            for (int j = 0; j < h; ++j) {
                for (int i = 0; i < w; ++i) {
                    if (bitmap[j * w + i] < COVERAGE_THRESHOLD) continue;
                    int px = x + c_x1 + i;
                    int py = baseline + c_y1 + j;
                    if (px >= 0 && px < strip.width && py >= 0 && py < strip.height) {
                        strip.pixels[py * strip.width + px] = 255;
                    }
                }
            }
        }
        x += static_cast<int>(advance * scale) + spacing;
    }
    return strip;
}

FlatBuffer TextRenderer::RenderFrame(const std::string& text, int scroll_offset,
                                     double brightness, int vertical_offset, int spacing) const {
    return GlyphMatrix::ExtractTextWindow(RenderScrollStrip(text, spacing), scroll_offset,
                                          vertical_offset, brightness);
}

namespace GlyphMatrix {

FlatBuffer ExtractTextWindow(const ScrollStrip& strip, int scroll_offset,
                             int vertical_offset, double brightness) {
    FlatBuffer frame = CreateEmptyFlat();
    if (strip.width <= 0 || strip.height <= 0) return frame;
    if (strip.pixels.size() < static_cast<size_t>(strip.width) * strip.height) return frame;

    int lit = ClampBrightness(static_cast<int>(255 * std::clamp(brightness, 0.0, 1.0)));
    int wrapped = ((scroll_offset % strip.width) + strip.width) % strip.width;

    for (int y = 0; y < strip.height; ++y) {
        int row = vertical_offset + y;
        if (row < 0 || row >= TOTAL_ROWS) continue;
        int start = RowOffset(row);
        for (int col = start; col < start + GLYPH_SHAPE[row]; ++col) {
            int sx = (wrapped + col) % strip.width;
            if (strip.pixels[y * strip.width + sx]) {
                frame[row * MAX_COLUMNS + col] = lit;
            }
        }
    }
    return frame;
}

std::vector<uint32_t> DecodeUtf8(const std::string& text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[i]);
        int extra;
        uint32_t cp;
        uint32_t min_cp;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min_cp = 0x10000;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        bool valid = i + extra < text.size();
        for (int k = 1; valid && k <= extra; ++k) {
            uint8_t next = static_cast<uint8_t>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (next & 0x3F);
            }
        }
        if (valid && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            out.push_back(cp);
            i += extra + 1;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
        }
    }
    return out;
}

int ScrollSpeed(int base_speed) {
    static const int kSpeeds[10] = {1, 1, 2, 2, 2, 3, 3, 3, 4, 4};
    return kSpeeds[std::clamp(base_speed, 1, 10) - 1];
}

std::string FormatMediaText(const std::string& title,
                            const std::string& artist,
                            const std::string& album,
                            bool show_artist,
                            bool show_album,
                            const std::string& separator) {
    std::vector<std::string> parts;
    if (!is_blank(title)) parts.push_back(title);
    if (show_artist && !is_blank(artist) && artist != "Unknown") parts.push_back(artist);
    if (show_album && !is_blank(album) && album != "Unknown") parts.push_back(album);

    if (parts.empty()) return "No Media";

    std::string out = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        out += separator + parts[i];
    }
    return out;
}

} // namespace GlyphMatrix
