#ifndef WAVMERGE_TYPES_HPP
#define WAVMERGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "wavmerge/dsp_utils.hpp"

namespace wavmerge {

struct RawAudioFile {
    std::string name;
    std::string content_type;
    std::vector<std::uint8_t> bytes;
};

struct DecodedAudio {
    int sample_rate = 0;
    int channel_count = 0;
    long long frame_count = 0;
    DspUtils::MatrixF samples; // フレーム x チャンネル
};

struct MonoSignal {
    int sample_rate = 0;
    DspUtils::VectorF samples;

    long long frame_count() const { return samples.size(); }
};

enum class ProgressStage {
    Decoding,
    Preprocessing,
    Resampling,
    Concatenating,
    Normalizing,
    Encoding
};

const char* stage_name(ProgressStage stage);

// current/total はファイル単位の段階でのみ設定される
using ProgressCallback = std::function<void(ProgressStage stage,
                                            std::optional<std::size_t> current,
                                            std::optional<std::size_t> total)>;

enum class ResampleMode {
    Quality,
    Nearest
};

ResampleMode parse_resample_mode(const std::string& name);
const char* resample_mode_name(ResampleMode mode);

struct MergeOptions {
    ProgressCallback on_progress;
    bool normalize_peak = true;
    bool preprocess = false;
    int target_sample_rate = 16000;
    ResampleMode resample_mode = ResampleMode::Quality;
    double max_total_seconds = 0.0; // 0 = 無制限
    bool verbose = false;

    void validate() const;
};

struct MergeResult {
    std::vector<std::uint8_t> encoded;
    std::string content_type = "audio/wav";
    double duration_seconds = 0.0;
    int sample_rate = 0;
    int channel_count = 1;
    long long total_frame_count = 0;
};

} // namespace wavmerge

#endif // WAVMERGE_TYPES_HPP
