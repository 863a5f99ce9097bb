#include "wavmerge/speech_filter.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace wavmerge {

Biquad::Biquad(Type type, int sr, float corner_hz, float q) {
    if (sr <= 0 || q <= 0.0f) {
        throw std::invalid_argument("Biquad needs a positive sample rate and Q");
    }
    if (corner_hz <= 0.0f || corner_hz >= sr / 2.0f) {
        bypassed = true;
        return;
    }

    const double w0 = 2.0 * M_PI * corner_hz / sr;
    const double cosw0 = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);

    if (type == Type::LowPass) {
        b0 = (1.0 - cosw0) * 0.5;
        b1 = 1.0 - cosw0;
        b2 = (1.0 - cosw0) * 0.5;
    } else {
        b0 = (1.0 + cosw0) * 0.5;
        b1 = -(1.0 + cosw0);
        b2 = (1.0 + cosw0) * 0.5;
    }
    const double a0 = 1.0 + alpha;
    a1 = -2.0 * cosw0;
    a2 = 1.0 - alpha;

    // a0で正規化
    b0 /= a0;
    b1 /= a0;
    b2 /= a0;
    a1 /= a0;
    a2 /= a0;
}

void Biquad::process(DspUtils::VectorF& samples) {
    if (bypassed) return;
    for (Eigen::Index i = 0; i < samples.size(); ++i) {
        const double x = samples[i];
        const double y = b0 * x + z1;
        z1 = b1 * x - a1 * y + z2;
        z2 = b2 * x - a2 * y;
        samples[i] = static_cast<float>(y);
    }
}

Compressor::Compressor(int sr, const CompressorSettings& p_settings) : settings(p_settings) {
    if (sr <= 0 || settings.ratio < 1.0f || settings.knee_db < 0.0f) {
        throw std::invalid_argument("Invalid compressor settings");
    }
    attack_coeff = std::exp(-1.0f / (settings.attack_sec * sr));
    release_coeff = std::exp(-1.0f / (settings.release_sec * sr));
}

float Compressor::gain_reduction_db(float level_db) const {
    const float over = level_db - settings.threshold_db;
    const float slope = 1.0f / settings.ratio - 1.0f;
    const float knee = settings.knee_db;

    if (2.0f * over < -knee) return 0.0f;
    if (knee > 0.0f && 2.0f * std::abs(over) <= knee) {
        const float x = over + knee / 2.0f;
        return slope * x * x / (2.0f * knee);
    }
    return slope * over;
}

void Compressor::process(DspUtils::VectorF& samples) {
    for (Eigen::Index i = 0; i < samples.size(); ++i) {
        const float level = std::abs(samples[i]);
        const float level_db = level > 1e-6f ? DspUtils::gain_to_db(level) : -120.0f;
        const float target = gain_reduction_db(level_db);

        // 減衰が深くなる方向はアタック、戻る方向はリリース
        const float coeff = target < gain_db ? attack_coeff : release_coeff;
        gain_db = coeff * gain_db + (1.0f - coeff) * target;

        samples[i] *= DspUtils::db_to_gain(gain_db);
    }
}

SpeechPreprocessor::SpeechPreprocessor(int p_sr)
    : sr(p_sr),
      hpf(Biquad::Type::HighPass, p_sr, kHighPassHz, kFilterQ),
      lpf(Biquad::Type::LowPass, p_sr, kLowPassHz, kFilterQ),
      compressor(p_sr) {}

MonoSignal SpeechPreprocessor::process(const MonoSignal& input) {
    if (input.sample_rate != sr) {
        throw std::invalid_argument("Preprocessor built for " + std::to_string(sr) + " Hz got a " +
                                    std::to_string(input.sample_rate) + " Hz signal");
    }
    MonoSignal output = input;
    hpf.process(output.samples);
    lpf.process(output.samples);
    compressor.process(output.samples);
    return output;
}

} // namespace wavmerge
