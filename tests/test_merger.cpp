#include <cmath>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "wavmerge/audio_file.hpp"
#include "wavmerge/merger.hpp"
#include "wavmerge/resampler.hpp"
#include "wavmerge/wav_format.hpp"

using namespace wavmerge;

namespace {

using ProgressEvent = std::tuple<ProgressStage, std::optional<std::size_t>, std::optional<std::size_t>>;

MonoSignal decode_result(const MergeResult& result) {
    RawAudioFile file;
    file.name = "merged.wav";
    file.bytes = result.encoded;
    DecodedAudio decoded = decode_audio(file);
    MonoSignal mono;
    mono.sample_rate = decoded.sample_rate;
    mono.samples = decoded.samples.col(0);
    return mono;
}

class MergeTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.on_progress = [this](ProgressStage stage, std::optional<std::size_t> current,
                                     std::optional<std::size_t> total) {
            events.emplace_back(stage, current, total);
        };
    }

    bool saw_stage(ProgressStage stage) const {
        for (const auto& e : events) {
            if (std::get<0>(e) == stage) return true;
        }
        return false;
    }

    MergeOptions options;
    std::vector<ProgressEvent> events;
};

} // namespace

TEST_F(MergeTest, MixedRatesToSixteenKilohertz) {
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 8000, 1.0),
        test::tone_wav("b.wav", 440.0f, 44100, 1.0),
    };

    MergeResult result = merge(files, options);
    EXPECT_EQ(result.content_type, "audio/wav");
    EXPECT_EQ(result.sample_rate, 16000);
    EXPECT_EQ(result.channel_count, 1);
    EXPECT_NEAR(static_cast<double>(result.total_frame_count), 32000.0, 1.0);
    EXPECT_NEAR(result.duration_seconds, 2.0, 1e-3);
    EXPECT_DOUBLE_EQ(result.duration_seconds, static_cast<double>(result.total_frame_count) / 16000.0);
    EXPECT_EQ(result.encoded.size(), kWavHeaderSize + 2 * static_cast<std::size_t>(result.total_frame_count));

    auto header = read_wav_header(result.encoded);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->channels, 1);
    EXPECT_EQ(header->sample_rate, 16000u);
    EXPECT_EQ(header->bits_per_sample, 16);
    EXPECT_EQ(header->frame_count(), static_cast<std::uint64_t>(result.total_frame_count));
}

TEST_F(MergeTest, TotalLengthIsSumOfResampledLengths) {
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 300.0f, 22050, 0.3),
        test::tone_wav("b.wav", 500.0f, 48000, 0.25),
        test::tone_wav("c.wav", 700.0f, 11025, 0.1),
    };
    long long expected = resampled_length(6615, 22050, 16000) + resampled_length(12000, 48000, 16000) +
                         resampled_length(1103, 11025, 16000);

    MergeResult result = merge(files, options);
    EXPECT_EQ(result.total_frame_count, expected);
}

TEST_F(MergeTest, OutputPeakIsNormalized) {
    std::vector<RawAudioFile> files = {
        test::tone_wav("quiet.wav", 440.0f, 16000, 0.5, 0.1f),
        test::tone_wav("quieter.wav", 440.0f, 16000, 0.5, 0.05f),
    };

    MonoSignal merged = decode_result(merge(files, options));
    float peak = merged.samples.cwiseAbs().maxCoeff();
    EXPECT_NEAR(peak, 0.95f, 1e-3f);
    EXPECT_LE(peak, 0.95f + 1e-4f);
}

TEST_F(MergeTest, NormalizationCanBeDisabled) {
    options.normalize_peak = false;
    std::vector<RawAudioFile> files = {
        test::tone_wav("quiet.wav", 440.0f, 16000, 0.5, 0.1f),
        test::tone_wav("quieter.wav", 440.0f, 16000, 0.5, 0.05f),
    };

    MonoSignal merged = decode_result(merge(files, options));
    EXPECT_NEAR(merged.samples.cwiseAbs().maxCoeff(), 0.1f, 1e-3f);
    EXPECT_FALSE(saw_stage(ProgressStage::Normalizing));
}

TEST_F(MergeTest, EmptyFileAbortsWithItsName) {
    std::vector<RawAudioFile> files = {
        test::tone_wav("first.wav", 440.0f, 16000, 0.2),
        RawAudioFile{"broken.wav", "audio/wav", {}},
        test::tone_wav("third.wav", 440.0f, 16000, 0.2),
    };

    try {
        merge(files, options);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.file_name(), "broken.wav");
        ASSERT_TRUE(e.has_file_index());
        EXPECT_EQ(e.file_index(), 1u);
        EXPECT_NE(std::string(e.what()).find("broken.wav"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("file 2 of 3"), std::string::npos);
    }
    EXPECT_FALSE(saw_stage(ProgressStage::Concatenating));
    EXPECT_FALSE(saw_stage(ProgressStage::Encoding));
}

TEST_F(MergeTest, TruncatedWavAbortsWithItsIndex) {
    RawAudioFile cut = test::tone_wav("cut.wav", 440.0f, 16000, 0.5);
    cut.bytes.resize(cut.bytes.size() - 1000);
    std::vector<RawAudioFile> files = {
        test::tone_wav("first.wav", 440.0f, 16000, 0.2),
        cut,
    };

    try {
        merge(files, options);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.file_name(), "cut.wav");
        ASSERT_TRUE(e.has_file_index());
        EXPECT_EQ(e.file_index(), 1u);
        EXPECT_NE(e.reason().find("truncated"), std::string::npos);
    }
    EXPECT_FALSE(saw_stage(ProgressStage::Encoding));
}

TEST_F(MergeTest, VerboseLogLeavesCoutFormatAlone) {
    const std::ios_base::fmtflags flags_before = std::cout.flags();
    const std::streamsize precision_before = std::cout.precision();

    options.verbose = true;
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 8000, 0.3),
        test::tone_wav("b.wav", 440.0f, 16000, 0.3),
    };
    merge(files, options);

    EXPECT_EQ(std::cout.flags(), flags_before);
    EXPECT_EQ(std::cout.precision(), precision_before);
}

TEST_F(MergeTest, FewerThanTwoFilesRejectedBeforeWork) {
    EXPECT_THROW(merge({}, options), InsufficientInputError);
    EXPECT_THROW(merge({test::tone_wav("only.wav", 440.0f, 16000, 0.1)}, options), InsufficientInputError);
    EXPECT_TRUE(events.empty());

    try {
        merge({test::tone_wav("only.wav", 440.0f, 16000, 0.1)}, options);
    } catch (const InsufficientInputError& e) {
        EXPECT_EQ(e.file_count(), 1u);
    }
}

TEST_F(MergeTest, InvalidOptionsRejected) {
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 16000, 0.1),
        test::tone_wav("b.wav", 440.0f, 16000, 0.1),
    };
    options.target_sample_rate = 0;
    EXPECT_THROW(merge(files, options), std::invalid_argument);

    options.target_sample_rate = 16000;
    options.max_total_seconds = -1.0;
    EXPECT_THROW(merge(files, options), std::invalid_argument);
    EXPECT_TRUE(events.empty());
}

TEST_F(MergeTest, PreprocessedSilenceStaysSilent) {
    options.preprocess = true;
    std::vector<RawAudioFile> files = {
        test::wav_file("s1.wav", test::mono_silence(16000, 0.5)),
        test::wav_file("s2.wav", test::mono_silence(8000, 0.5)),
    };

    MergeResult result = merge(files, options);
    EXPECT_EQ(result.total_frame_count, 16000);
    for (std::size_t i = kWavHeaderSize; i < result.encoded.size(); ++i) {
        ASSERT_EQ(result.encoded[i], 0) << "byte " << i;
    }
}

TEST_F(MergeTest, ProgressSequence) {
    options.preprocess = true;
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 16000, 0.1),
        test::tone_wav("b.wav", 440.0f, 8000, 0.1),
    };
    merge(files, options);

    const std::vector<ProgressEvent> expected = {
        {ProgressStage::Decoding, 1, 2},
        {ProgressStage::Preprocessing, 1, 2},
        {ProgressStage::Resampling, 1, 2},
        {ProgressStage::Decoding, 2, 2},
        {ProgressStage::Preprocessing, 2, 2},
        {ProgressStage::Resampling, 2, 2},
        {ProgressStage::Concatenating, std::nullopt, std::nullopt},
        {ProgressStage::Normalizing, std::nullopt, std::nullopt},
        {ProgressStage::Encoding, std::nullopt, std::nullopt},
    };
    EXPECT_EQ(events, expected);
}

TEST_F(MergeTest, NoPreprocessingStageByDefault) {
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 16000, 0.1),
        test::tone_wav("b.wav", 440.0f, 16000, 0.1),
    };
    merge(files, options);
    EXPECT_FALSE(saw_stage(ProgressStage::Preprocessing));
    EXPECT_TRUE(saw_stage(ProgressStage::Encoding));
}

TEST_F(MergeTest, MissingCallbackIsFine) {
    MergeOptions quiet;
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 16000, 0.1),
        test::tone_wav("b.wav", 440.0f, 16000, 0.1),
    };
    EXPECT_EQ(merge(files, quiet).total_frame_count, 3200);
}

TEST_F(MergeTest, DurationCeiling) {
    options.max_total_seconds = 1.5;
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 16000, 1.0),
        test::tone_wav("b.wav", 440.0f, 16000, 1.0),
    };

    try {
        merge(files, options);
        FAIL() << "expected DurationLimitError";
    } catch (const DurationLimitError& e) {
        EXPECT_DOUBLE_EQ(e.limit_seconds(), 1.5);
    }
    EXPECT_FALSE(saw_stage(ProgressStage::Encoding));

    options.max_total_seconds = 2.0;
    EXPECT_EQ(merge(files, options).total_frame_count, 32000);
}

TEST_F(MergeTest, NearestModeKeepsLengthContract) {
    options.resample_mode = ResampleMode::Nearest;
    std::vector<RawAudioFile> files = {
        test::tone_wav("a.wav", 440.0f, 8000, 1.0),
        test::tone_wav("b.wav", 440.0f, 44100, 1.0),
    };
    EXPECT_EQ(merge(files, options).total_frame_count, 32000);
}

TEST_F(MergeTest, StereoInputAndCustomTargetRate) {
    options.target_sample_rate = 8000;
    DspUtils::MatrixF stereo(4410, 2);
    stereo.col(0) = test::tone(440.0f, 44100, 0.1, 0.4f);
    stereo.col(1) = stereo.col(0);

    std::vector<RawAudioFile> files = {
        RawAudioFile{"stereo.wav", "audio/wav", test::encode_with_sndfile(stereo, 44100)},
        test::tone_wav("mono.wav", 440.0f, 16000, 0.1),
    };

    MergeResult result = merge(files, options);
    EXPECT_EQ(result.sample_rate, 8000);
    EXPECT_EQ(result.total_frame_count, 800 + 800);

    MonoSignal merged = decode_result(result);
    EXPECT_EQ(merged.sample_rate, 8000);
    EXPECT_EQ(merged.frame_count(), 1600);
}
