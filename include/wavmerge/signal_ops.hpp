#ifndef WAVMERGE_SIGNAL_OPS_HPP
#define WAVMERGE_SIGNAL_OPS_HPP

#include <vector>

#include "wavmerge/types.hpp"

namespace wavmerge {

constexpr float kNormalizeTargetPeak = 0.95f;
constexpr float kSilenceEpsilon = 1e-6f;

// 全チャンネルの平均。モノラルはそのまま
MonoSignal reduce_to_mono(const DecodedAudio& audio);

// 順番どおり隙間なく連結する (レートは全て同じであること)
MonoSignal concatenate(const std::vector<MonoSignal>& parts);

float peak_level(const MonoSignal& signal);

// ピークを target_peak に合わせる。無音なら何もせず false
bool normalize_peak(MonoSignal& signal,
                    float target_peak = kNormalizeTargetPeak,
                    float epsilon = kSilenceEpsilon);

} // namespace wavmerge

#endif // WAVMERGE_SIGNAL_OPS_HPP
