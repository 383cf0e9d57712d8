#include "SpectrumAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace {

constexpr double BASS_END_FRACTION = 0.08;
constexpr double MID_END_FRACTION = 0.4;

// Magnitudes of the (re, im) pairs at begin, begin + 2, ... below end
static double band_level(const std::vector<int8_t>& fft, int begin, int end) {
    int range = end - begin;
    if (range <= 0) return 0.0;
    double sum = 0.0;
    // i + 1 stays below fft.size(): end <= fft.size() / 2
    for (int i = begin; i < end; i += 2) {
        double re = fft[i];
        double im = fft[i + 1];
        sum += std::sqrt(re * re + im * im);
    }
    return std::clamp(sum / range * 2.0 / 128.0, 0.0, 1.0);
}

}

namespace GlyphMatrix {

BandLevels AnalyzeFft(const std::vector<int8_t>& fft) {
    BandLevels levels;
    int size = static_cast<int>(fft.size() / 2);
    if (size <= 0) return levels;

    int bass_end = static_cast<int>(size * BASS_END_FRACTION);
    int mid_end = static_cast<int>(size * MID_END_FRACTION);

    levels.bass = band_level(fft, 0, bass_end);
    levels.mid = band_level(fft, bass_end, mid_end);
    levels.treble = band_level(fft, mid_end, size);
    return levels;
}

double WaveformRms(const std::vector<int8_t>& waveform) {
    if (waveform.empty()) return 0.0;
    double sum = 0.0;
    for (int8_t s : waveform) {
        double v = s;
        sum += v * v;
    }
    double rms = std::sqrt(sum / waveform.size());
    return std::clamp(rms / 128.0, 0.0, 1.0);
}

} // namespace GlyphMatrix

BeatDetector::BeatDetector()
    : threshold_(0.3),
      min_interval_ms_(200),
      decay_(0.95),
      intensity_(0.0),
      last_beat_ms_(0),
      has_beat_(false) {}

void BeatDetector::update(const std::vector<int8_t>& waveform, int64_t now_ms) {
    double rms = GlyphMatrix::WaveformRms(waveform);
    bool spaced = !has_beat_ || (now_ms - last_beat_ms_ > min_interval_ms_);
    if (rms > threshold_ && spaced) {
        last_beat_ms_ = now_ms;
        has_beat_ = true;
        intensity_ = rms;
    } else {
        intensity_ = std::max(0.0, intensity_ * decay_);
    }
}

namespace {

static double ease(double current, double target, double factor) {
    return std::clamp(current + (target - current) * factor, 0.0, 1.0);
}

}

LevelSmoother::LevelSmoother(double speed)
    : speed_(speed > 0.0 ? speed : 0.0),
      primed_(false) {}

void LevelSmoother::set_target(const BandLevels& target) {
    target_ = target;
    if (!primed_) {
        current_.bass = std::clamp(target.bass, 0.0, 1.0);
        current_.mid = std::clamp(target.mid, 0.0, 1.0);
        current_.treble = std::clamp(target.treble, 0.0, 1.0);
        primed_ = true;
    }
}

void LevelSmoother::step(double dt) {
    if (!primed_ || dt <= 0.0) return;
    double factor = std::min(1.0, speed_ * dt * 10.0);
    current_.bass = ease(current_.bass, target_.bass, factor);
    current_.mid = ease(current_.mid, target_.mid, factor);
    current_.treble = ease(current_.treble, target_.treble, factor);
}

namespace GlyphMatrix {

std::vector<std::vector<int8_t>> SplitCaptures(const std::vector<int8_t>& dump, int capture_bytes) {
    std::vector<std::vector<int8_t>> captures;
    if (dump.empty()) return captures;
    size_t chunk = capture_bytes > 0 ? static_cast<size_t>(capture_bytes) : dump.size();
    if (chunk >= dump.size()) {
        captures.push_back(dump);
        return captures;
    }
    for (size_t pos = 0; pos + chunk <= dump.size(); pos += chunk) {
        captures.emplace_back(dump.begin() + pos, dump.begin() + pos + chunk);
    }
    return captures;
}

std::vector<BandLevels> SmoothedLevelTrack(const std::vector<std::vector<int8_t>>& captures,
                                           int frame_count, double frame_dt, double speed) {
    std::vector<BandLevels> track;
    if (captures.empty() || frame_count <= 0) return track;
    track.reserve(static_cast<size_t>(frame_count));

    LevelSmoother smoother(speed);
    for (int f = 0; f < frame_count; ++f) {
        smoother.set_target(AnalyzeFft(captures[f % captures.size()]));
        if (f > 0) smoother.step(frame_dt);
        track.push_back(smoother.levels());
    }
    return track;
}

} // namespace GlyphMatrix
