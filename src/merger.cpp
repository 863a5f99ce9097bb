#include "wavmerge/merger.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "wavmerge/audio_file.hpp"
#include "wavmerge/resampler.hpp"
#include "wavmerge/signal_ops.hpp"
#include "wavmerge/speech_filter.hpp"
#include "wavmerge/wav_format.hpp"

namespace wavmerge {

namespace {

void report(const MergeOptions& options, ProgressStage stage,
            std::optional<std::size_t> current = std::nullopt,
            std::optional<std::size_t> total = std::nullopt) {
    if (options.on_progress) {
        options.on_progress(stage, current, total);
    }
}

// 呼び出し側の std::cout の書式を変えないよう、ローカルのストリームで整形する
std::string format_seconds(double seconds) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << seconds;
    return ss.str();
}

// 1ファイル分: デコード -> モノラル化 -> (前処理) -> リサンプル
MonoSignal process_file(const RawAudioFile& file, std::size_t index, std::size_t total,
                        const MergeOptions& options) {
    report(options, ProgressStage::Decoding, index + 1, total);
    if (options.verbose) {
        std::cout << "Reading input file: " << file.name << " (" << file.bytes.size() << " bytes)" << std::endl;
    }

    MonoSignal mono;
    {
        DecodedAudio decoded;
        try {
            decoded = decode_audio(file);
        } catch (const DecodeError& e) {
            throw e.with_index(index, total);
        }
        if (options.verbose) {
            std::cout << "  - Original SR: " << decoded.sample_rate << " Hz, Channels: " << decoded.channel_count
                      << ", Duration: " << format_seconds(static_cast<double>(decoded.frame_count) / decoded.sample_rate)
                      << "s" << std::endl;
        }
        mono = reduce_to_mono(decoded);
    }

    if (options.preprocess) {
        report(options, ProgressStage::Preprocessing, index + 1, total);
        if (options.verbose) {
            std::cout << "  - Applying speech filter chain (HPF " << SpeechPreprocessor::kHighPassHz
                      << " Hz, LPF " << SpeechPreprocessor::kLowPassHz << " Hz, compressor)" << std::endl;
        }
        SpeechPreprocessor preprocessor(mono.sample_rate);
        mono = preprocessor.process(mono);
    }

    report(options, ProgressStage::Resampling, index + 1, total);
    if (options.verbose) {
        if (mono.sample_rate == options.target_sample_rate) {
            std::cout << "  - Sample rate already " << mono.sample_rate << " Hz. Skipping resampling." << std::endl;
        } else {
            std::cout << "  - Resampling from " << mono.sample_rate << " Hz to " << options.target_sample_rate
                      << " Hz (" << resample_mode_name(options.resample_mode) << ")..." << std::endl;
        }
    }
    return resample(mono, options.target_sample_rate, options.resample_mode);
}

} // namespace

MergeResult merge(const std::vector<RawAudioFile>& files, const MergeOptions& options) {
    if (files.size() < 2) {
        throw InsufficientInputError(files.size());
    }
    options.validate();

    const int target_sr = options.target_sample_rate;
    const std::size_t total = files.size();

    std::vector<MonoSignal> parts;
    parts.reserve(total);
    long long accumulated_frames = 0;

    for (std::size_t i = 0; i < total; ++i) {
        MonoSignal resampled = process_file(files[i], i, total, options);
        accumulated_frames += resampled.frame_count();

        if (options.max_total_seconds > 0.0) {
            double reached = static_cast<double>(accumulated_frames) / target_sr;
            if (reached > options.max_total_seconds) {
                throw DurationLimitError(options.max_total_seconds, reached);
            }
        }
        parts.push_back(std::move(resampled));
    }

    report(options, ProgressStage::Concatenating);
    MonoSignal joined = concatenate(parts);
    parts.clear();
    parts.shrink_to_fit();
    if (joined.frame_count() != accumulated_frames) {
        throw EncodeError("concatenated " + std::to_string(joined.frame_count()) + " frames, expected " +
                          std::to_string(accumulated_frames));
    }
    joined.sample_rate = target_sr;

    if (options.normalize_peak) {
        report(options, ProgressStage::Normalizing);
        float peak = peak_level(joined);
        bool scaled = normalize_peak(joined);
        if (options.verbose) {
            if (scaled) {
                std::cout << "Normalized peak " << peak << " -> " << kNormalizeTargetPeak << std::endl;
            } else {
                std::cout << "Signal is silent. Normalization skipped." << std::endl;
            }
        }
    }

    report(options, ProgressStage::Encoding);
    MergeResult result;
    result.encoded = encode_wav16_mono(joined);
    result.sample_rate = target_sr;
    result.channel_count = 1;
    result.total_frame_count = joined.frame_count();
    result.duration_seconds = static_cast<double>(result.total_frame_count) / target_sr;

    if (options.verbose) {
        std::cout << "Merged " << total << " files: " << result.total_frame_count << " frames, "
                  << format_seconds(result.duration_seconds) << "s, "
                  << result.encoded.size() << " bytes" << std::endl;
    }
    return result;
}

} // namespace wavmerge
