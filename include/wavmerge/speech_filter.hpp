#ifndef WAVMERGE_SPEECH_FILTER_HPP
#define WAVMERGE_SPEECH_FILTER_HPP

#include "wavmerge/types.hpp"

namespace wavmerge {

// ===================================================================================
// バイクアッドフィルタ (RBJ cookbook, Transposed Direct Form II)
// ===================================================================================
class Biquad {
public:
    enum class Type { LowPass, HighPass };

    Biquad(Type type, int sr, float corner_hz, float q);

    // コーナー周波数がナイキスト以上のときは素通し
    bool is_bypassed() const { return bypassed; }
    void process(DspUtils::VectorF& samples);

private:
    double b0 = 1.0, b1 = 0.0, b2 = 0.0, a1 = 0.0, a2 = 0.0;
    double z1 = 0.0, z2 = 0.0;
    bool bypassed = false;
};

// ===================================================================================
// ダイナミックレンジコンプレッサ
// ===================================================================================
struct CompressorSettings {
    float threshold_db = -24.0f;
    float knee_db = 12.0f;
    float ratio = 4.0f;
    float attack_sec = 0.003f;
    float release_sec = 0.25f;
};

class Compressor {
public:
    Compressor(int sr, const CompressorSettings& settings = CompressorSettings());

    // 静特性: 入力レベル(dB)に対するゲイン低減量(dB, <= 0)
    float gain_reduction_db(float level_db) const;
    void process(DspUtils::VectorF& samples);

private:
    CompressorSettings settings;
    float attack_coeff, release_coeff;
    float gain_db = 0.0f;
};

// ===================================================================================
// 音声前処理チェーン (HPF 80Hz -> LPF 7500Hz -> コンプレッサ)
// ファイルごとに新しく作り、使い終わったら捨てる。
// ===================================================================================
class SpeechPreprocessor {
public:
    static constexpr float kHighPassHz = 80.0f;
    static constexpr float kLowPassHz = 7500.0f;
    static constexpr float kFilterQ = 0.7f;

    explicit SpeechPreprocessor(int sr);

    MonoSignal process(const MonoSignal& input);

    const Biquad& high_pass() const { return hpf; }
    const Biquad& low_pass() const { return lpf; }

private:
    int sr;
    Biquad hpf;
    Biquad lpf;
    Compressor compressor;
};

} // namespace wavmerge

#endif // WAVMERGE_SPEECH_FILTER_HPP
