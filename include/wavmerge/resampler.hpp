#ifndef WAVMERGE_RESAMPLER_HPP
#define WAVMERGE_RESAMPLER_HPP

#include <memory>

#include "wavmerge/types.hpp"

namespace wavmerge {

// 出力長 = ceil(frames * target_sr / original_sr)
long long resampled_length(long long frames, int original_sr, int target_sr);

// ===================================================================================
// スペクトル帯域制限リサンプラ (SpectralResampler)
//
// 周期Hann窓・50%オーバーラップのチャンクをFFTし、スペクトルを新しいナイキストで
// 切り詰める(ダウンサンプル)かゼロ拡張して(アップサンプル)逆FFTで重ね合わせる。
// 保持帯域の上位10%はレイズドコサインで落とす。チャンク長は gcd から決めるので、
// 入出力のホップが整数になりチャンク境界がずれない。
// ===================================================================================
class SpectralResampler {
public:
    SpectralResampler(int original_sr, int target_sr, int min_chunk_size = 4096);

    DspUtils::VectorF resample(const DspUtils::VectorF& channel_data);

    int input_chunk_size() const { return chunk_size; }
    int output_chunk_size() const { return target_chunk_size; }

private:
    int original_sr, target_sr;
    int chunk_size, hop_size;
    int target_chunk_size, target_hop_size;
    int kept_bins;
    float resample_ratio;
    DspUtils::VectorF window;
    DspUtils::ArrayF rolloff;
    std::unique_ptr<DspUtils::RealFft> analysis_fft;
    std::unique_ptr<DspUtils::RealFft> synthesis_fft;
};

// 低品質モード: 最近傍サンプル選択 (エイリアシングあり)
MonoSignal resample_nearest(const MonoSignal& signal, int target_sr);

// 同じレートならそのままコピー
MonoSignal resample(const MonoSignal& signal, int target_sr, ResampleMode mode = ResampleMode::Quality);

} // namespace wavmerge

#endif // WAVMERGE_RESAMPLER_HPP
