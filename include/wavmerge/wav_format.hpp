#ifndef WAVMERGE_WAV_FORMAT_HPP
#define WAVMERGE_WAV_FORMAT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "wavmerge/types.hpp"

namespace wavmerge {

constexpr std::size_t kWavHeaderSize = 44;

std::int16_t float_to_pcm16(float sample);

// 44バイトの標準ヘッダ + 16-bit リトルエンディアン モノラルPCM
std::vector<std::uint8_t> encode_wav16_mono(const MonoSignal& signal);

struct WavHeaderInfo {
    std::uint16_t format_tag = 0;
    std::uint16_t channels = 0;
    std::uint32_t sample_rate = 0;
    std::uint32_t byte_rate = 0;
    std::uint16_t block_align = 0;
    std::uint16_t bits_per_sample = 0;
    std::uint32_t data_size = 0;
    std::size_t data_offset = 0;
    bool has_data_chunk = false;

    std::uint64_t frame_count() const { return block_align ? data_size / block_align : 0; }
};

// RIFFチャンクを辿って fmt / data を読む。RIFF/WAVEでなければ空。
std::optional<WavHeaderInfo> read_wav_header(const std::vector<std::uint8_t>& bytes);

// ===================================================================================
// 文字起こし向けの品質判定
// ===================================================================================
enum class QualityLevel { Excellent, Good, Fair, Poor };

struct QualityAssessment {
    QualityLevel level = QualityLevel::Fair;
    std::string description;
    bool optimal_for_transcription = true;
    std::vector<std::string> recommended_actions;
};

const char* quality_level_name(QualityLevel level);

// sample_rate == 0 は「不明」として扱う
QualityAssessment assess_quality(int sample_rate, int bit_depth, int channels);

} // namespace wavmerge

#endif // WAVMERGE_WAV_FORMAT_HPP
