#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "wavmerge/audio_file.hpp"
#include "wavmerge/errors.hpp"
#include "wavmerge/file_io.hpp"
#include "wavmerge/merger.hpp"
#include "wavmerge/wav_format.hpp"

using namespace wavmerge;

namespace {

void print_info(const RawAudioFile& file) {
    std::cout << file.name << " (" << (file.content_type.empty() ? "unknown type" : file.content_type) << ", "
              << file.bytes.size() << " bytes)" << std::endl;

    AudioInfo info = probe_audio(file);
    std::cout << "  - Container: " << container_name(info.container) << ", Subtype: " << info.subtype << std::endl;
    std::cout << "  - SR: " << info.sample_rate << " Hz, Channels: " << info.channels
              << ", Duration: " << info.duration_seconds << "s" << std::endl;

    if (auto header = read_wav_header(file.bytes)) {
        std::cout << "  - WAV header: format " << header->format_tag << ", " << header->bits_per_sample
                  << "-bit, block align " << header->block_align << ", data " << header->data_size << " bytes"
                  << std::endl;
    }

    QualityAssessment quality = assess_quality(info.sample_rate, info.bit_depth, info.channels);
    std::cout << "  - Quality: " << quality_level_name(quality.level) << " (" << quality.description << ")"
              << std::endl;
    for (const auto& action : quality.recommended_actions) {
        std::cout << "    * " << action << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("wavmerge", "Merge audio recordings into one 16-bit mono WAV for transcription");

    options.add_options()
        ("o,output", "Output WAV file path", cxxopts::value<std::string>())
        ("target_sr", "Target sample rate in Hz", cxxopts::value<int>()->default_value("16000"))
        ("resampler", "Resampling mode (quality, nearest)", cxxopts::value<std::string>()->default_value("quality"))
        ("preprocess", "Apply the speech filter chain before resampling", cxxopts::value<bool>()->default_value("false"))
        ("no_normalize", "Disable peak normalization", cxxopts::value<bool>()->default_value("false"))
        ("max_seconds", "Maximum total duration in seconds (0 = unlimited)", cxxopts::value<double>()->default_value("0"))
        ("info", "Print metadata and quality assessment for each input, then exit", cxxopts::value<bool>()->default_value("false"))
        ("verbose", "Enable diagnostic logging", cxxopts::value<bool>()->default_value("false"))
        ("inputs", "Input audio files", cxxopts::value<std::vector<std::string>>())
        ("h,help", "Print usage");
    options.parse_positional({"inputs"});
    options.positional_help("INPUT...");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        std::cout << options.help() << std::endl;
        return 1;
    }

    std::vector<std::string> inputs;
    if (result.count("inputs")) {
        inputs = result["inputs"].as<std::vector<std::string>>();
    }
    const bool info_only = result["info"].as<bool>();

    if (result.count("help") || inputs.empty() || (!info_only && !result.count("output"))) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    try {
        std::vector<RawAudioFile> files;
        files.reserve(inputs.size());
        for (const auto& path : inputs) {
            files.push_back(read_audio_file(path));
        }

        if (info_only) {
            for (const auto& file : files) {
                print_info(file);
            }
            return 0;
        }

        const std::string output_path = result["output"].as<std::string>();

        if (copy_single_input(files, output_path)) {
            std::cout << "Only one input file. No merge needed, copied " << files[0].name << " to "
                      << output_path << std::endl;
            std::cout << "Done." << std::endl;
            return 0;
        }

        MergeOptions merge_options;
        merge_options.target_sample_rate = result["target_sr"].as<int>();
        merge_options.resample_mode = parse_resample_mode(result["resampler"].as<std::string>());
        merge_options.preprocess = result["preprocess"].as<bool>();
        merge_options.normalize_peak = !result["no_normalize"].as<bool>();
        merge_options.max_total_seconds = result["max_seconds"].as<double>();
        merge_options.verbose = result["verbose"].as<bool>();
        merge_options.on_progress = [](ProgressStage stage, std::optional<std::size_t> current,
                                       std::optional<std::size_t> total) {
            std::cout << "[" << stage_name(stage) << "]";
            if (current && total) {
                std::cout << " file " << *current << " of " << *total;
            }
            std::cout << std::endl;
        };

        std::cout << "Merging " << files.size() << " files at " << merge_options.target_sample_rate << " Hz..."
                  << std::endl;
        MergeResult merged = merge(files, merge_options);

        std::cout << "\nWriting output file: " << output_path << " (SR: " << merged.sample_rate
                  << ", Duration: " << merged.duration_seconds << "s)" << std::endl;
        write_bytes(output_path, merged.encoded);
        std::cout << "Done." << std::endl;

    } catch (const DecodeError& e) {
        std::cerr << "Could not decode " << e.file_name();
        if (e.has_file_index()) {
            std::cerr << " (file " << e.file_index() + 1 << ")";
        }
        std::cerr << ": " << e.reason() << std::endl;
        std::cerr << "Remove or replace this file and try again." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "An unhandled error occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
