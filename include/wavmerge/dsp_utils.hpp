#ifndef WAVMERGE_DSP_UTILS_HPP
#define WAVMERGE_DSP_UTILS_HPP

#include <string>

#include <Eigen/Dense>
#include <fftw3.h>

namespace wavmerge {
namespace DspUtils {

using VectorF = Eigen::VectorXf;
using VectorCF = Eigen::VectorXcf;
using MatrixF = Eigen::MatrixXf;
using ArrayF = Eigen::ArrayXf;

// --- 窓関数 ---
// sym=false で周期窓 (50%オーバーラップで総和が1になる)
VectorF getWindow(const std::string& name, int size, bool sym = true);

// --- 数学ヘルパー ---
long long gcd(long long a, long long b);
float db_to_gain(float db);
float gain_to_db(float gain);

// --- FFT (FFTWラッパー) ---
// 固定長の実数FFT。プランとバッファを保持し、同じ長さで何度でも使い回す。
class RealFft {
public:
    explicit RealFft(int size);
    ~RealFft();

    RealFft(const RealFft&) = delete;
    RealFft& operator=(const RealFft&) = delete;

    int size() const { return n; }
    int bins() const { return n / 2 + 1; }

    VectorCF forward(const VectorF& signal);
    // 1/n で正規化済み
    VectorF inverse(const VectorCF& spectrum);

private:
    int n;
    float* real_buf;
    fftwf_complex* complex_buf;
    fftwf_plan forward_plan;
    fftwf_plan inverse_plan;
};

} // namespace DspUtils
} // namespace wavmerge

#endif // WAVMERGE_DSP_UTILS_HPP
