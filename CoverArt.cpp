#include "CoverArt.h"
#include "BrightnessModel.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

#include "stb_image.h"

namespace {

constexpr double kPi = 3.141592653589793;
constexpr double MASK_RADIUS = 12.5;
constexpr double FADE_START = 11.5;
constexpr double OUTLIER_FRACTION = 0.01;

static double luminance(const unsigned char* px) {
    double lum = 0.299 * px[0] + 0.587 * px[1] + 0.114 * px[2];
    return lum * (px[3] / 255.0);
}

// Box-filter an RGBA image down to the 25x25 grid
static FlatBuffer downsample(const unsigned char* rgba, int w, int h) {
    FlatBuffer out(FLAT_ARRAY_SIZE, 0);
    for (int ty = 0; ty < TOTAL_ROWS; ++ty) {
        int y0 = ty * h / TOTAL_ROWS;
        int y1 = std::max(y0 + 1, (ty + 1) * h / TOTAL_ROWS);
        for (int tx = 0; tx < MAX_COLUMNS; ++tx) {
            int x0 = tx * w / MAX_COLUMNS;
            int x1 = std::max(x0 + 1, (tx + 1) * w / MAX_COLUMNS);
            double acc = 0.0;
            int n = 0;
            for (int y = y0; y < y1 && y < h; ++y) {
                for (int x = x0; x < x1 && x < w; ++x) {
                    acc += luminance(rgba + (static_cast<size_t>(y) * w + x) * 4);
                    ++n;
                }
            }
            out[ty * MAX_COLUMNS + tx] = n > 0 ? GlyphMatrix::ClampBrightness(static_cast<int>(std::round(acc / n))) : 0;
        }
    }
    return out;
}

} // namespace

namespace GlyphMatrix {

Status DecodeCoverArt(const std::vector<unsigned char>& encoded, FlatBuffer& out, bool enhance_contrast) {
    if (encoded.empty()) return Status::Decode;
    int w = 0, h = 0, ch = 0;
    unsigned char* img = stbi_load_from_memory(encoded.data(), static_cast<int>(encoded.size()), &w, &h, &ch, 4);
    if (!img) {
        std::cerr << "Failed to decode cover art: " << stbi_failure_reason() << std::endl;
        return Status::Decode;
    }
    if (w <= 0 || h <= 0) {
        stbi_image_free(img);
        return Status::Decode;
    }

    FlatBuffer lum = downsample(img, w, h);
    stbi_image_free(img);

    if (enhance_contrast) {
        EnhanceContrast(lum);
    }
    out = std::move(lum);
    return Status::Ok;
}

Status LoadCoverArt(const std::string& path, FlatBuffer& out, bool enhance_contrast) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::cerr << "Failed to open cover art file: " << path << std::endl;
        return Status::Io;
    }
    std::streamsize file_size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<unsigned char> data(static_cast<size_t>(std::max<std::streamsize>(file_size, 0)));
    if (!file.read(reinterpret_cast<char*>(data.data()), file_size)) {
        std::cerr << "Failed to read cover art file: " << path << std::endl;
        return Status::Io;
    }
    return DecodeCoverArt(data, out, enhance_contrast);
}

void EnhanceContrast(FlatBuffer& luminance) {
    if (luminance.empty()) return;
    int histogram[256] = {0};
    for (int v : luminance) {
        histogram[ClampBrightness(v)]++;
    }

    int outliers = static_cast<int>(luminance.size() * OUTLIER_FRACTION);
    int lo = 0;
    int hi = 255;
    int count = 0;
    for (int i = 0; i <= 255; ++i) {
        count += histogram[i];
        if (count > outliers) { lo = i; break; }
    }
    count = 0;
    for (int i = 255; i >= 0; --i) {
        count += histogram[i];
        if (count > outliers) { hi = i; break; }
    }

    double range = hi - lo;
    if (range <= 0) return;
    for (int& v : luminance) {
        v = ClampBrightness(static_cast<int>((v - lo) * 255.0 / range));
    }
}

FlatBuffer CoverArtFrame(const FlatBuffer& luminance, double rotation_degrees, double opacity) {
    FlatBuffer frame = CreateEmptyFlat();
    if (luminance.size() != static_cast<size_t>(FLAT_ARRAY_SIZE)) return frame;

    const double cx = MAX_COLUMNS / 2;
    const double cy = TOTAL_ROWS / 2;
    double rad = rotation_degrees * kPi / 180.0;
    double c = std::cos(rad);
    double s = std::sin(rad);

    for (int row = 0; row < TOTAL_ROWS; ++row) {
        for (int col = 0; col < MAX_COLUMNS; ++col) {
            double dx = col - cx;
            double dy = row - cy;
            double distance = std::sqrt(dx * dx + dy * dy);
            if (distance > MASK_RADIUS) continue;

            // Inverse rotation, nearest source cell
            int sx = static_cast<int>(std::round(cx + dx * c + dy * s));
            int sy = static_cast<int>(std::round(cy - dx * s + dy * c));
            if (sx < 0 || sx >= MAX_COLUMNS || sy < 0 || sy >= TOTAL_ROWS) continue;

            int value = luminance[sy * MAX_COLUMNS + sx];
            if (distance > FADE_START) {
                value = static_cast<int>(value * (MASK_RADIUS - distance));
            }
            frame[row * MAX_COLUMNS + col] = ClampBrightness(value);
        }
    }

    if (opacity < 1.0) {
        ApplyOpacity(frame, opacity);
    }
    return frame;
}

} // namespace GlyphMatrix
