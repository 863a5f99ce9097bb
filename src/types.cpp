#include "wavmerge/types.hpp"

#include <stdexcept>

namespace wavmerge {

const char* stage_name(ProgressStage stage) {
    switch (stage) {
        case ProgressStage::Decoding: return "decoding";
        case ProgressStage::Preprocessing: return "preprocessing";
        case ProgressStage::Resampling: return "resampling";
        case ProgressStage::Concatenating: return "concatenating";
        case ProgressStage::Normalizing: return "normalizing";
        case ProgressStage::Encoding: return "encoding";
    }
    return "unknown";
}

ResampleMode parse_resample_mode(const std::string& name) {
    if (name == "quality") return ResampleMode::Quality;
    if (name == "nearest") return ResampleMode::Nearest;
    throw std::invalid_argument("Unsupported resampler '" + name + "' (expected quality or nearest)");
}

const char* resample_mode_name(ResampleMode mode) {
    return mode == ResampleMode::Nearest ? "nearest" : "quality";
}

void MergeOptions::validate() const {
    if (target_sample_rate <= 0) {
        throw std::invalid_argument("Target sample rate must be positive, got " +
                                    std::to_string(target_sample_rate));
    }
    if (max_total_seconds < 0.0) {
        throw std::invalid_argument("Duration limit must not be negative");
    }
}

} // namespace wavmerge
