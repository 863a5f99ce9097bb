#ifndef WAVMERGE_TEST_HELPERS_HPP
#define WAVMERGE_TEST_HELPERS_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <sndfile.h>

#include "wavmerge/audio_file.hpp"
#include "wavmerge/types.hpp"

namespace wavmerge {
namespace test {

inline DspUtils::VectorF tone(float freq_hz, int sr, double seconds, float amplitude = 0.5f) {
    Eigen::Index n = static_cast<Eigen::Index>(std::llround(seconds * sr));
    DspUtils::VectorF samples(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        samples[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * freq_hz * i / sr));
    }
    return samples;
}

inline MonoSignal mono_tone(float freq_hz, int sr, double seconds, float amplitude = 0.5f) {
    MonoSignal signal;
    signal.sample_rate = sr;
    signal.samples = tone(freq_hz, sr, seconds, amplitude);
    return signal;
}

inline MonoSignal mono_silence(int sr, double seconds) {
    MonoSignal signal;
    signal.sample_rate = sr;
    signal.samples = DspUtils::VectorF::Zero(static_cast<Eigen::Index>(std::llround(seconds * sr)));
    return signal;
}

// フレーム x チャンネル -> libsndfileでメモリ上に書き出したコンテナのバイト列
inline std::vector<std::uint8_t> encode_with_sndfile(const DspUtils::MatrixF& frames, int sr,
                                                     int format = SF_FORMAT_WAV | SF_FORMAT_PCM_16) {
    SndMemoryStream stream;
    SF_INFO sfinfo = {};
    sfinfo.samplerate = sr;
    sfinfo.channels = static_cast<int>(frames.cols());
    sfinfo.format = format;
    {
        SndFileHandle handle(sf_open_virtual(stream.io(), SFM_WRITE, &sfinfo, &stream));
        if (!handle) {
            throw std::runtime_error(std::string("sf_open_virtual failed: ") + sf_strerror(nullptr));
        }
        std::vector<float> interleaved(static_cast<std::size_t>(frames.size()));
        for (Eigen::Index i = 0; i < frames.rows(); ++i) {
            for (Eigen::Index j = 0; j < frames.cols(); ++j) {
                interleaved[static_cast<std::size_t>(i * frames.cols() + j)] = frames(i, j);
            }
        }
        if (sf_writef_float(handle.get(), interleaved.data(), frames.rows()) != frames.rows()) {
            throw std::runtime_error(std::string("sf_writef_float failed: ") + sf_strerror(handle.get()));
        }
    } // sf_close がヘッダを確定させる
    return stream.bytes();
}

inline RawAudioFile wav_file(const std::string& name, const MonoSignal& signal,
                             int format = SF_FORMAT_WAV | SF_FORMAT_PCM_16) {
    RawAudioFile file;
    file.name = name;
    file.content_type = "audio/wav";
    file.bytes = encode_with_sndfile(signal.samples, signal.sample_rate, format);
    return file;
}

inline RawAudioFile tone_wav(const std::string& name, float freq_hz, int sr, double seconds,
                             float amplitude = 0.5f) {
    return wav_file(name, mono_tone(freq_hz, sr, seconds, amplitude));
}

inline float rms(const DspUtils::VectorF& samples) {
    if (samples.size() == 0) return 0.0f;
    return std::sqrt(samples.squaredNorm() / samples.size());
}

} // namespace test
} // namespace wavmerge

#endif // WAVMERGE_TEST_HELPERS_HPP
