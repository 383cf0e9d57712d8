#ifndef FRAME_GENERATOR_H
#define FRAME_GENERATOR_H

#include "GlyphMatrix.h"
#include <functional>
#include <vector>

using FrameSequence = std::vector<FlatBuffer>;

namespace GlyphMatrix {

const int CENTER_X = MAX_COLUMNS / 2;
const int CENTER_Y = TOTAL_ROWS / 2;

// Builds frames [0, frame_count) by calling frame_fn once per index. With
// threads > 1 the indices are striped across worker threads; every frame is
// written by exactly one worker, so the result matches the sequential run.
FrameSequence GenerateFrames(int frame_count,
                             const std::function<FlatBuffer(int)>& frame_fn,
                             int threads = 1);

// Single frames. A frame_count below 1 is treated as 1.
FlatBuffer RotatingLineFrame(int frame_index, int frame_count, int line_length = 8, int brightness = 255);
FlatBuffer PulseFrame(int frame_index, int frame_count, int max_radius = 10, int brightness = 255);
FlatBuffer WaveFrame(int frame_index, int frame_count, int amplitude = 5, int brightness = 255);
FlatBuffer HorizontalWaveFrame(int frame_index, int frame_count, int amplitude = 5,
                               int brightness = 255, double wavelength = 2.0);

// Whole sequences; frame_count <= 0 yields an empty sequence.
FrameSequence RotatingLineFrames(int frame_count, int line_length = 8, int brightness = 255);
FrameSequence PulseFrames(int frame_count, int max_radius = 10, int brightness = 255);
FrameSequence WaveFrames(int frame_count, int amplitude = 5, int brightness = 255);
FrameSequence HorizontalWaveFrames(int frame_count, int amplitude = 5, int brightness = 255,
                                   double wavelength = 2.0);

// Sine across all 25 columns, `wavelength` half-cycles per width.
// amplitude is clamped to [1, 8], thickness to [1, 3]; rows away from the
// crest are dimmed by up to 40%.
void DrawHorizontalWave(FlatBuffer& buf,
                        int frame_index = 0,
                        int frame_count = 1,
                        int amplitude = 5,
                        int brightness = 255,
                        double wavelength = 2.0,
                        int thickness = 1);

// Angular offset of frame_index within a cycle of frame_count frames; 0 for single-frame cycles.
double PhaseOffset(int frame_index, int frame_count);

} // namespace GlyphMatrix

#endif // FRAME_GENERATOR_H
