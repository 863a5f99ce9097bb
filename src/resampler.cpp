#include "wavmerge/resampler.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>

namespace wavmerge {

namespace {

constexpr long long kMaxChunkSize = 1 << 24;
constexpr int kMinTargetChunkSize = 64;
constexpr float kRolloffStart = 0.9f;

void check_rates(int original_sr, int target_sr) {
    if (original_sr <= 0 || target_sr <= 0) {
        throw std::invalid_argument("Sample rates must be positive (got " + std::to_string(original_sr) +
                                    " Hz -> " + std::to_string(target_sr) + " Hz)");
    }
}

} // namespace

long long resampled_length(long long frames, int original_sr, int target_sr) {
    check_rates(original_sr, target_sr);
    if (frames <= 0) return 0;
    return (frames * target_sr + original_sr - 1) / original_sr;
}

// ===================================================================================
// スペクトル帯域制限リサンプラ (SpectralResampler)
// ===================================================================================
SpectralResampler::SpectralResampler(int osr, int tsr, int min_chunk_size)
    : original_sr(osr), target_sr(tsr) {
    check_rates(original_sr, target_sr);

    long long g = DspUtils::gcd(original_sr, target_sr);
    long long l = original_sr / g;
    long long m = target_sr / g;

    // 入力 2*k*l, 出力 2*k*m サンプルのチャンクならホップ比がちょうど m/l になる
    long long k = std::max<long long>(1, (min_chunk_size + 2 * l - 1) / (2 * l));
    k = std::max(k, (kMinTargetChunkSize + 2 * m - 1) / (2 * m));
    if (2 * k * l > kMaxChunkSize || 2 * k * m > kMaxChunkSize) {
        throw std::invalid_argument("Sample rate ratio " + std::to_string(original_sr) + ":" +
                                    std::to_string(target_sr) + " needs an FFT chunk that is too large");
    }

    chunk_size = static_cast<int>(2 * k * l);
    hop_size = chunk_size / 2;
    target_chunk_size = static_cast<int>(2 * k * m);
    target_hop_size = target_chunk_size / 2;
    resample_ratio = static_cast<float>(target_chunk_size) / chunk_size;

    window = DspUtils::getWindow("hann", chunk_size, false);
    analysis_fft = std::make_unique<DspUtils::RealFft>(chunk_size);
    synthesis_fft = std::make_unique<DspUtils::RealFft>(target_chunk_size);

    kept_bins = std::min(analysis_fft->bins(), synthesis_fft->bins());
    rolloff = DspUtils::ArrayF::Ones(kept_bins);
    int rolloff_start = static_cast<int>(kRolloffStart * (kept_bins - 1));
    int rolloff_len = kept_bins - rolloff_start;
    for (int i = rolloff_start; i < kept_bins; ++i) {
        float t = static_cast<float>(i - rolloff_start + 1) / (rolloff_len + 1);
        rolloff[i] = static_cast<float>(0.5 * (1.0 + std::cos(M_PI * t)));
    }
}

DspUtils::VectorF SpectralResampler::resample(const DspUtils::VectorF& channel_data) {
    long long num_samples = channel_data.size();
    long long output_len = resampled_length(num_samples, original_sr, target_sr);
    if (num_samples == 0) return DspUtils::VectorF();

    // 先頭にホップ分のゼロを置き、全サンプルが2枚の窓で覆われるようにする
    long long num_chunks = (hop_size + num_samples - 1) / hop_size + 1;
    DspUtils::VectorF padded = DspUtils::VectorF::Zero((num_chunks + 1) * hop_size);
    padded.segment(hop_size, num_samples) = channel_data;

    DspUtils::VectorF output_signal = DspUtils::VectorF::Zero((num_chunks + 1) * target_hop_size);

    for (long long i = 0; i < num_chunks; ++i) {
        DspUtils::VectorF chunk_windowed = padded.segment(i * hop_size, chunk_size).cwiseProduct(window);
        DspUtils::VectorCF chunk_spectrum = analysis_fft->forward(chunk_windowed);

        DspUtils::VectorCF resampled_spectrum = DspUtils::VectorCF::Zero(synthesis_fft->bins());
        resampled_spectrum.head(kept_bins).array() = chunk_spectrum.head(kept_bins).array() * rolloff.cast<std::complex<float>>();

        DspUtils::VectorF processed_chunk = synthesis_fft->inverse(resampled_spectrum);
        output_signal.segment(i * target_hop_size, target_chunk_size) += processed_chunk * resample_ratio;
    }

    return output_signal.segment(target_hop_size, output_len);
}

// ===================================================================================
// 最近傍リサンプル
// ===================================================================================
MonoSignal resample_nearest(const MonoSignal& signal, int target_sr) {
    check_rates(signal.sample_rate, target_sr);
    long long num_samples = signal.frame_count();
    long long output_len = resampled_length(num_samples, signal.sample_rate, target_sr);

    MonoSignal output;
    output.sample_rate = target_sr;
    output.samples.resize(output_len);
    for (long long t = 0; t < output_len; ++t) {
        long long src_idx = std::min(num_samples - 1, t * signal.sample_rate / target_sr);
        output.samples[t] = signal.samples[src_idx];
    }
    return output;
}

MonoSignal resample(const MonoSignal& signal, int target_sr, ResampleMode mode) {
    check_rates(signal.sample_rate, target_sr);
    if (signal.sample_rate == target_sr) {
        return signal;
    }
    if (mode == ResampleMode::Nearest) {
        return resample_nearest(signal, target_sr);
    }

    SpectralResampler resampler(signal.sample_rate, target_sr);
    MonoSignal output;
    output.sample_rate = target_sr;
    output.samples = resampler.resample(signal.samples);
    return output;
}

} // namespace wavmerge
