#include "wavmerge/wav_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

#include "wavmerge/errors.hpp"

namespace wavmerge {

namespace {

void put_tag(std::vector<std::uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
    }
}

std::uint16_t get_u16(const std::vector<std::uint8_t>& in, std::size_t offset) {
    return static_cast<std::uint16_t>(in[offset] | (in[offset + 1] << 8));
}

std::uint32_t get_u32(const std::vector<std::uint8_t>& in, std::size_t offset) {
    return static_cast<std::uint32_t>(in[offset]) |
           (static_cast<std::uint32_t>(in[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(in[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(in[offset + 3]) << 24);
}

bool tag_at(const std::vector<std::uint8_t>& in, std::size_t offset, const char* tag) {
    return in.size() >= offset + 4 && std::memcmp(in.data() + offset, tag, 4) == 0;
}

} // namespace

// ===================================================================================
// エンコーダ (16-bit PCM WAV, モノラル)
// ===================================================================================
std::int16_t float_to_pcm16(float sample) {
    if (std::isnan(sample)) return 0;
    double s = std::max(-1.0, std::min(1.0, static_cast<double>(sample)));
    // 負側は32768、正側は32767を掛けて0方向に切り捨てる
    double scaled = s < 0.0 ? s * 32768.0 : s * 32767.0;
    return static_cast<std::int16_t>(scaled);
}

std::vector<std::uint8_t> encode_wav16_mono(const MonoSignal& signal) {
    const std::uint16_t num_channels = 1;
    const std::uint16_t bits_per_sample = 16;
    const std::uint16_t block_align = num_channels * (bits_per_sample / 8);

    if (signal.sample_rate <= 0) {
        throw EncodeError("sample rate must be positive, got " + std::to_string(signal.sample_rate));
    }
    const std::uint64_t data_size = static_cast<std::uint64_t>(signal.frame_count()) * block_align;
    if (data_size > std::numeric_limits<std::uint32_t>::max() - 36u) {
        throw EncodeError(std::to_string(signal.frame_count()) + " frames exceed the 4 GiB RIFF size limit");
    }
    const std::uint32_t sample_rate = static_cast<std::uint32_t>(signal.sample_rate);
    const std::uint32_t byte_rate = sample_rate * block_align;

    std::vector<std::uint8_t> out;
    out.reserve(kWavHeaderSize + static_cast<std::size_t>(data_size));

    put_tag(out, "RIFF");
    put_u32(out, static_cast<std::uint32_t>(36 + data_size));
    put_tag(out, "WAVE");

    put_tag(out, "fmt ");
    put_u32(out, 16);              // fmtチャンク長
    put_u16(out, 1);               // PCM
    put_u16(out, num_channels);
    put_u32(out, sample_rate);
    put_u32(out, byte_rate);
    put_u16(out, block_align);
    put_u16(out, bits_per_sample);

    put_tag(out, "data");
    put_u32(out, static_cast<std::uint32_t>(data_size));

    if (out.size() != kWavHeaderSize) {
        throw EncodeError("header is " + std::to_string(out.size()) + " bytes, expected 44");
    }

    for (Eigen::Index i = 0; i < signal.samples.size(); ++i) {
        put_u16(out, static_cast<std::uint16_t>(float_to_pcm16(signal.samples[i])));
    }
    return out;
}

std::optional<WavHeaderInfo> read_wav_header(const std::vector<std::uint8_t>& bytes) {
    if (!tag_at(bytes, 0, "RIFF") || !tag_at(bytes, 8, "WAVE")) {
        return std::nullopt;
    }

    WavHeaderInfo info;
    bool has_fmt = false;
    std::size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const std::uint32_t chunk_size = get_u32(bytes, offset + 4);

        if (tag_at(bytes, offset, "fmt ")) {
            if (chunk_size < 16 || offset + 8 + 16 > bytes.size()) return std::nullopt;
            const std::size_t p = offset + 8;
            info.format_tag = get_u16(bytes, p);
            info.channels = get_u16(bytes, p + 2);
            info.sample_rate = get_u32(bytes, p + 4);
            info.byte_rate = get_u32(bytes, p + 8);
            info.block_align = get_u16(bytes, p + 12);
            info.bits_per_sample = get_u16(bytes, p + 14);
            has_fmt = true;
        } else if (tag_at(bytes, offset, "data")) {
            info.data_size = chunk_size;
            info.data_offset = offset + 8;
            info.has_data_chunk = true;
            if (has_fmt) break;
        }

        // チャンクは偶数境界に揃う
        offset += 8 + static_cast<std::size_t>(chunk_size) + (chunk_size & 1u);
    }

    if (!has_fmt) return std::nullopt;
    return info;
}

// ===================================================================================
// 文字起こし向けの品質判定
// ===================================================================================
const char* quality_level_name(QualityLevel level) {
    switch (level) {
        case QualityLevel::Excellent: return "excellent";
        case QualityLevel::Good: return "good";
        case QualityLevel::Fair: return "fair";
        case QualityLevel::Poor: return "poor";
    }
    return "unknown";
}

QualityAssessment assess_quality(int sample_rate, int bit_depth, int channels) {
    QualityAssessment result;

    // bit_depth == 0 は圧縮形式 (ビット深度なし)
    const bool depth_ok = bit_depth == 0 || bit_depth >= 16;

    if (sample_rate > 0 && sample_rate < 16000) {
        result.recommended_actions.push_back("Increase sample rate to at least 16kHz (current: " +
                                             std::to_string(sample_rate) + "Hz)");
        result.optimal_for_transcription = false;
    }
    if (!depth_ok) {
        result.recommended_actions.push_back("Increase bit depth to at least 16-bit (current: " +
                                             std::to_string(bit_depth) + "-bit)");
        result.optimal_for_transcription = false;
    }
    if (channels > 2) {
        result.recommended_actions.push_back("Consider reducing to mono or stereo (current: " +
                                             std::to_string(channels) + " channels)");
    }

    if (sample_rate <= 0) {
        result.level = QualityLevel::Fair;
        result.description = "Quality unknown - metadata not available";
    } else if (sample_rate >= 44100 && depth_ok) {
        result.level = QualityLevel::Excellent;
        result.description = "High quality audio, optimal for transcription";
    } else if (sample_rate >= 16000 && depth_ok) {
        result.level = QualityLevel::Good;
        result.description = "Good quality audio, suitable for transcription";
    } else if (sample_rate >= 8000) {
        result.level = QualityLevel::Fair;
        result.description = "Fair quality audio, conversion recommended";
    } else {
        result.level = QualityLevel::Poor;
        result.description = "Low quality audio, conversion highly recommended";
    }
    return result;
}

} // namespace wavmerge
