#include "AudioSpectrum.h"
#include "BrightnessModel.h"
#include "CoverArt.h"
#include "FrameExport.h"
#include "FrameGenerator.h"
#include "GlyphMatrix.h"
#include "Rasterizer.h"
#include "RenderConfig.h"
#include "SpectrumAnalyzer.h"
#include "TextRenderer.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using GlyphMatrix::Status;

static bool read_fft_dump(const std::string& path, std::vector<int8_t>& dump) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open FFT capture: " << path << std::endl;
        return false;
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (raw.empty()) {
        std::cerr << "FFT capture is empty: " << path << std::endl;
        return false;
    }
    dump.assign(raw.begin(), raw.end());
    return true;
}

int main() {
    RenderConfig cfg = LoadRenderConfig();
    if (cfg.debug) {
        std::cerr << "  pattern=" << PatternName(cfg.pattern)
                  << " frames=" << cfg.frames
                  << " brightness=" << cfg.brightness
                  << " theme_brightness=" << cfg.theme_brightness
                  << " threads=" << cfg.threads
                  << " mask=" << (cfg.mask ? "on" : "off")
                  << std::endl;
    }

    std::function<FlatBuffer(int)> frame_fn;
    const int n = cfg.frames;

    FlatBuffer cover;
    ScrollStrip strip;
    TextRenderer text_renderer;
    std::vector<BandLevels> level_track;

    switch (cfg.pattern) {
        case Pattern::RotatingLine:
            frame_fn = [&](int f) { return GlyphMatrix::RotatingLineFrame(f, n, cfg.line_length, cfg.brightness); };
            break;
        case Pattern::Pulse:
            frame_fn = [&](int f) { return GlyphMatrix::PulseFrame(f, n, cfg.max_radius, cfg.brightness); };
            break;
        case Pattern::Wave:
            frame_fn = [&](int f) { return GlyphMatrix::WaveFrame(f, n, cfg.amplitude, cfg.brightness); };
            break;
        case Pattern::HorizontalWave:
            frame_fn = [&](int f) {
                FlatBuffer grid = GlyphMatrix::CreateEmptyFlat();
                GlyphMatrix::DrawHorizontalWave(grid, f, n, cfg.amplitude, cfg.brightness,
                                                cfg.wavelength, cfg.thickness);
                return grid;
            };
            break;
        case Pattern::Spectrum: {
            if (cfg.fft_path.empty()) {
                level_track.assign(static_cast<size_t>(n), BandLevels{cfg.bass, cfg.mid, cfg.treble});
            } else {
                std::vector<int8_t> dump;
                if (!read_fft_dump(cfg.fft_path, dump)) {
                    return 1;
                }
                auto captures = GlyphMatrix::SplitCaptures(dump, cfg.fft_capture_bytes);
                level_track = GlyphMatrix::SmoothedLevelTrack(captures, n, cfg.frame_delay_ms / 1000.0,
                                                              cfg.level_smoothing);
                if (cfg.debug) {
                    std::cerr << "  fft captures=" << captures.size() << std::endl;
                }
            }
            frame_fn = [&](int f) {
                const BandLevels& levels = level_track[f];
                FlatBuffer grid = GlyphMatrix::CreateEmptyFlat();
                GlyphMatrix::DrawAudioSpectrumWaves(grid, levels.bass, levels.mid, levels.treble,
                                                    f, n, cfg.brightness);
                return grid;
            };
            break;
        }
        case Pattern::Cover: {
            if (cfg.image_path.empty()) {
                std::cerr << "GLYPH_IMAGE is required for the cover pattern" << std::endl;
                return 1;
            }
            Status st = GlyphMatrix::LoadCoverArt(cfg.image_path, cover, cfg.enhance_contrast);
            if (st != Status::Ok) {
                std::cerr << "Cover art failed: " << GlyphMatrix::StatusName(st) << std::endl;
                return 1;
            }
            frame_fn = [&](int f) {
                return GlyphMatrix::CoverArtFrame(cover, f * 360.0 / n, cfg.paused_opacity);
            };
            break;
        }
        case Pattern::Text: {
            Status st = text_renderer.LoadFont(cfg.font_path, cfg.font_size);
            if (st != Status::Ok) {
                std::cerr << "Font failed: " << GlyphMatrix::StatusName(st) << std::endl;
                return 1;
            }
            strip = text_renderer.RenderScrollStrip(cfg.text);
            int step = GlyphMatrix::ScrollSpeed(cfg.scroll_speed);
            frame_fn = [&, step](int f) {
                return GlyphMatrix::ExtractTextWindow(strip, f * step, 9,
                                                      GlyphMatrix::BrightnessToMultiplier(cfg.brightness));
            };
            break;
        }
        case Pattern::Fill:
            frame_fn = [&](int) {
                FlatBuffer grid = GlyphMatrix::CreateEmptyFlat();
                GlyphMatrix::FillGrid(grid, cfg.brightness);
                return grid;
            };
            break;
    }

    auto render_start = std::chrono::steady_clock::now();
    FrameSequence frames = GlyphMatrix::GenerateFrames(n, [&](int f) {
        FlatBuffer grid = frame_fn(f);
        if (cfg.mask && GlyphMatrix::ApplyShapeMask(grid) != Status::Ok) {
            std::cerr << "Frame " << f << " has " << grid.size() << " cells, not masked" << std::endl;
        }
        if (cfg.theme_brightness != 255) {
            GlyphMatrix::ApplyThemeBrightness(grid, cfg.theme_brightness);
        }
        return grid;
    }, cfg.threads);
    auto render_end = std::chrono::steady_clock::now();
    double render_ms = std::chrono::duration_cast<std::chrono::duration<double>>(render_end - render_start).count() * 1000.0;

    if (cfg.output == OutputFormat::Json) {
        std::cout << GlyphMatrix::FramesToJson(frames, cfg.frame_delay_ms) << std::endl;
    } else {
        for (const auto& frame : frames) {
            std::string line;
            Status st = GlyphMatrix::FlatArrayToPixelString(frame, line);
            if (st != Status::Ok) {
                std::cerr << "Frame serialisation failed: " << GlyphMatrix::StatusName(st) << std::endl;
                return 1;
            }
            std::cout << line << '\n';
        }
        std::cout << std::flush;
    }

    std::cerr << "GLYPH PERF: pattern=" << PatternName(cfg.pattern)
              << " frames=" << frames.size()
              << " threads=" << cfg.threads
              << " render_ms=" << render_ms
              << std::endl;
    return 0;
}
