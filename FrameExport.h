#ifndef FRAME_EXPORT_H
#define FRAME_EXPORT_H

#include "FrameGenerator.h"
#include "GlyphMatrix.h"
#include <string>

namespace GlyphMatrix {

// {"width":25,"height":25,"frame_delay_ms":d,"frames":[[625 ints], ...]}
std::string FramesToJson(const FrameSequence& frames, int frame_delay_ms, int indent = -1);

// Parse on malformed JSON or a missing/ill-typed "frames" array,
// SizeMismatch if any frame is not FLAT_ARRAY_SIZE cells.
Status FramesFromJson(const std::string& text, FrameSequence& out, int* frame_delay_ms = nullptr);

} // namespace GlyphMatrix

#endif // FRAME_EXPORT_H
