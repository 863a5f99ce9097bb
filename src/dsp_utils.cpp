#include "wavmerge/dsp_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace wavmerge {
namespace DspUtils {

// --- 窓関数 ---
VectorF getWindow(const std::string& name, int size, bool sym) {
    VectorF window(size);
    if (size == 0) return window;
    int den = sym ? (size - 1) : size;
    if (den == 0) {
        if (size > 0) window.setOnes();
        return window;
    }
    if (name == "hann") {
        for (int i = 0; i < size; ++i) {
            window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * M_PI * i / den)));
        }
    } else {
        throw std::invalid_argument("Unsupported window type: " + name);
    }
    return window;
}

// --- 数学ヘルパー ---
long long gcd(long long a, long long b) {
    while (b != 0) {
        long long t = a % b;
        a = b;
        b = t;
    }
    return a < 0 ? -a : a;
}

float db_to_gain(float db) { return std::pow(10.0f, db / 20.0f); }
float gain_to_db(float gain) { return 20.0f * std::log10(gain); }

// --- FFT (FFTWラッパー) ---
RealFft::RealFft(int size) : n(size), real_buf(nullptr), complex_buf(nullptr),
                             forward_plan(nullptr), inverse_plan(nullptr) {
    if (n < 2) {
        throw std::invalid_argument("FFT size must be at least 2, got " + std::to_string(n));
    }

    // FFTWが推奨するアラインメントされたメモリを確保
    real_buf = static_cast<float*>(fftwf_malloc(sizeof(float) * n));
    complex_buf = reinterpret_cast<fftwf_complex*>(fftwf_malloc(sizeof(fftwf_complex) * bins()));
    if (!real_buf || !complex_buf) {
        fftwf_free(real_buf);
        fftwf_free(complex_buf);
        throw std::runtime_error("FFTW buffer allocation failed");
    }

    forward_plan = fftwf_plan_dft_r2c_1d(n, real_buf, complex_buf, FFTW_ESTIMATE);
    inverse_plan = fftwf_plan_dft_c2r_1d(n, complex_buf, real_buf, FFTW_ESTIMATE);
    if (!forward_plan || !inverse_plan) {
        if (forward_plan) fftwf_destroy_plan(forward_plan);
        if (inverse_plan) fftwf_destroy_plan(inverse_plan);
        fftwf_free(real_buf);
        fftwf_free(complex_buf);
        throw std::runtime_error("FFTW plan creation failed for size " + std::to_string(n));
    }
}

RealFft::~RealFft() {
    fftwf_destroy_plan(forward_plan);
    fftwf_destroy_plan(inverse_plan);
    fftwf_free(real_buf);
    fftwf_free(complex_buf);
}

VectorCF RealFft::forward(const VectorF& signal) {
    // 足りない分はゼロパディング
    Eigen::Map<VectorF> in(real_buf, n);
    in.setZero();
    Eigen::Index len = std::min<Eigen::Index>(signal.size(), n);
    in.head(len) = signal.head(len);

    fftwf_execute(forward_plan);

    // fftwf_complexはstd::complex<float>とメモリレイアウト互換
    VectorCF output(bins());
    std::memcpy(output.data(), complex_buf, sizeof(fftwf_complex) * bins());
    return output;
}

VectorF RealFft::inverse(const VectorCF& spectrum) {
    if (spectrum.size() != bins()) {
        throw std::invalid_argument("Spectrum has " + std::to_string(spectrum.size()) +
                                    " bins, expected " + std::to_string(bins()));
    }
    // c2rは入力を破壊するので毎回コピーする
    std::memcpy(complex_buf, spectrum.data(), sizeof(fftwf_complex) * bins());

    fftwf_execute(inverse_plan);

    // FFTWの逆変換は正規化されないため、手動で正規化
    VectorF output = Eigen::Map<VectorF>(real_buf, n) / static_cast<float>(n);
    return output;
}

} // namespace DspUtils
} // namespace wavmerge
