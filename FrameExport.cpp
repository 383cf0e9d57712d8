#include "FrameExport.h"
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Integers only, and only those that fit an int
static bool to_int(const json& v, int& out) {
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(v.get<uint64_t>());
        return true;
    }
    if (!v.is_number_integer()) return false;
    int64_t wide = v.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(wide);
    return true;
}

}

namespace GlyphMatrix {

std::string FramesToJson(const FrameSequence& frames, int frame_delay_ms, int indent) {
    json j;
    j["width"] = MAX_COLUMNS;
    j["height"] = TOTAL_ROWS;
    j["frame_delay_ms"] = frame_delay_ms;
    j["frames"] = json::array();
    for (const auto& frame : frames) {
        j["frames"].push_back(frame);
    }
    return j.dump(indent);
}

Status FramesFromJson(const std::string& text, FrameSequence& out, int* frame_delay_ms) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return Status::Parse;

    auto it = j.find("frames");
    if (it == j.end() || !it->is_array()) return Status::Parse;

    FrameSequence frames;
    frames.reserve(it->size());
    for (const auto& jf : *it) {
        if (!jf.is_array()) return Status::Parse;
        if (jf.size() != static_cast<size_t>(FLAT_ARRAY_SIZE)) return Status::SizeMismatch;
        FlatBuffer frame;
        frame.reserve(FLAT_ARRAY_SIZE);
        for (const auto& v : jf) {
            int value = 0;
            if (!to_int(v, value)) return Status::Parse;
            frame.push_back(value);
        }
        frames.push_back(std::move(frame));
    }

    if (frame_delay_ms) {
        auto delay = j.find("frame_delay_ms");
        int value = 0;
        *frame_delay_ms = (delay != j.end() && to_int(*delay, value)) ? value : 0;
    }
    out = std::move(frames);
    return Status::Ok;
}

} // namespace GlyphMatrix
