#ifndef SPECTRUM_ANALYZER_H
#define SPECTRUM_ANALYZER_H

#include <cstdint>
#include <vector>

struct BandLevels {
    double bass = 0.0;
    double mid = 0.0;
    double treble = 0.0;
};

namespace GlyphMatrix {

// FFT capture as interleaved signed 8-bit (real, imaginary) pairs.
// Bass covers the first 8% of the spectrum, mid up to 40%, treble the rest.
BandLevels AnalyzeFft(const std::vector<int8_t>& fft);

// RMS of a signed 8-bit waveform, normalised to [0, 1].
double WaveformRms(const std::vector<int8_t>& waveform);

} // namespace GlyphMatrix

// Energy beat detector fed with waveform captures.
class BeatDetector {
public:
    BeatDetector();

    // now_ms: monotonic capture timestamp
    void update(const std::vector<int8_t>& waveform, int64_t now_ms);
    double intensity() const { return intensity_; }

private:
    const double threshold_;
    const int64_t min_interval_ms_;
    const double decay_;
    double intensity_;
    int64_t last_beat_ms_;
    bool has_beat_;
};

// Eases band levels toward the latest capture so the spectrum bands do not
// jump frame to frame. The first target is taken as-is.
class LevelSmoother {
public:
    explicit LevelSmoother(double speed = 0.3);

    void set_target(const BandLevels& target);

    // dt - seconds since the previous step
    void step(double dt);

    const BandLevels& levels() const { return current_; }
    bool primed() const { return primed_; }

private:
    BandLevels current_;
    BandLevels target_;
    double speed_;
    bool primed_;
};

namespace GlyphMatrix {

// Splits a raw FFT dump into consecutive captures of capture_bytes each. A
// trailing partial capture is dropped unless it is the only one;
// capture_bytes <= 0 keeps the whole dump as a single capture.
std::vector<std::vector<int8_t>> SplitCaptures(const std::vector<int8_t>& dump, int capture_bytes);

// Band levels for frames [0, frame_count): frame f analyses capture
// f % captures.size() and is eased from the previous frame, frame_dt seconds
// apart. Empty when there are no captures or frames.
std::vector<BandLevels> SmoothedLevelTrack(const std::vector<std::vector<int8_t>>& captures,
                                           int frame_count, double frame_dt,
                                           double speed = 0.3);

} // namespace GlyphMatrix

#endif // SPECTRUM_ANALYZER_H
