#ifndef TEXT_RENDERER_H
#define TEXT_RENDERER_H

#include "GlyphMatrix.h"
#include <cstdint>
#include <string>
#include <vector>

// Default strip height in rows
const int CHAR_HEIGHT = 7;

// Horizontal strip holding rendered text followed by a blank gap one grid
// wide, so windows taken modulo `width` scroll seamlessly.
struct ScrollStrip {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // 0 or 255, row-major
};

class TextRenderer {
public:
    TextRenderer();
    ~TextRenderer();

    TextRenderer(const TextRenderer&) = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    // pixel_height is the em size and the strip height; 7-8 px reads best on the matrix.
    // Io if the file cannot be read, Decode if it is not a usable font.
    GlyphMatrix::Status LoadFont(const std::string& font_path, float pixel_height = CHAR_HEIGHT);
    bool IsLoaded() const { return font_info_ != nullptr; }

    int MeasureTextWidth(const std::string& text, int spacing = 1) const;
    ScrollStrip RenderScrollStrip(const std::string& text, int spacing = 1) const;

    // Glyph coverage is thresholded at 50%; the matrix has no anti-aliasing.
    FlatBuffer RenderFrame(const std::string& text, int scroll_offset,
                           double brightness = 1.0, int vertical_offset = 9,
                           int spacing = 1) const;

private:
    std::vector<uint8_t> font_buffer_;
    void* font_info_ = nullptr; // stbtt_fontinfo
    float pixel_height_ = CHAR_HEIGHT;
};

namespace GlyphMatrix {

// Copies a wrapped window of the strip into the rows it covers, only into
// cells that exist on the matrix. Lit strip pixels get 255 * brightness.
FlatBuffer ExtractTextWindow(const ScrollStrip& strip, int scroll_offset,
                             int vertical_offset = 9, double brightness = 1.0);

// UTF-8 to codepoints. Malformed, overlong or surrogate sequences become
// U+FFFD one byte at a time.
std::vector<uint32_t> DecodeUtf8(const std::string& text);

// User speed 1-10 -> pixels advanced per frame
int ScrollSpeed(int base_speed);

// "title - artist - album", dropping blank or "Unknown" fields
std::string FormatMediaText(const std::string& title,
                            const std::string& artist,
                            const std::string& album,
                            bool show_artist = true,
                            bool show_album = true,
                            const std::string& separator = " - ");

} // namespace GlyphMatrix

#endif // TEXT_RENDERER_H
