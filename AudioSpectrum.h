#ifndef AUDIO_SPECTRUM_H
#define AUDIO_SPECTRUM_H

#include "GlyphMatrix.h"

namespace GlyphMatrix {

// Baseline rows of the three bands
const int TREBLE_ROW = 6;
const int MID_ROW = 12;
const int BASS_ROW = 18;

// Bands below this level are not drawn
const double BAND_THRESHOLD = 0.05;

// Up to three sine bands sharing one phase, levels in [0, 1]. Drawn bass,
// mid, treble, so higher bands win where they cross.
void DrawAudioSpectrumWaves(FlatBuffer& buf,
                            double bass_level,
                            double mid_level,
                            double treble_level,
                            int frame_index = 0,
                            int frame_count = 1,
                            int max_brightness = 255);

} // namespace GlyphMatrix

#endif // AUDIO_SPECTRUM_H
