#include "wavmerge/signal_ops.hpp"

#include <stdexcept>
#include <string>

namespace wavmerge {

MonoSignal reduce_to_mono(const DecodedAudio& audio) {
    MonoSignal mono;
    mono.sample_rate = audio.sample_rate;
    if (audio.samples.cols() == 1) {
        mono.samples = audio.samples.col(0);
    } else {
        mono.samples = audio.samples.rowwise().mean();
    }
    return mono;
}

MonoSignal concatenate(const std::vector<MonoSignal>& parts) {
    MonoSignal joined;
    if (parts.empty()) return joined;

    joined.sample_rate = parts.front().sample_rate;
    Eigen::Index total_frames = 0;
    for (const auto& part : parts) {
        if (part.sample_rate != joined.sample_rate) {
            throw std::invalid_argument("Cannot concatenate signals at " + std::to_string(part.sample_rate) +
                                        " Hz and " + std::to_string(joined.sample_rate) + " Hz");
        }
        total_frames += part.samples.size();
    }

    joined.samples.resize(total_frames);
    Eigen::Index cursor = 0;
    for (const auto& part : parts) {
        joined.samples.segment(cursor, part.samples.size()) = part.samples;
        cursor += part.samples.size();
    }
    return joined;
}

float peak_level(const MonoSignal& signal) {
    if (signal.samples.size() == 0) return 0.0f;
    return signal.samples.cwiseAbs().maxCoeff();
}

bool normalize_peak(MonoSignal& signal, float target_peak, float epsilon) {
    float peak = peak_level(signal);
    if (!(peak > epsilon)) return false;
    signal.samples *= target_peak / peak;
    return true;
}

} // namespace wavmerge
