#include "wavmerge/file_io.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "wavmerge/audio_file.hpp"

namespace wavmerge {

RawAudioFile read_audio_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    RawAudioFile file;
    file.name = std::filesystem::path(path).filename().string();
    file.content_type = content_type_for(path);
    file.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Error while reading input file: " + path);
    }
    return file;
}

void write_bytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("Error while writing output file: " + path);
    }
}

bool copy_single_input(const std::vector<RawAudioFile>& files, const std::string& output_path) {
    if (files.size() != 1) return false;
    write_bytes(output_path, files.front().bytes);
    return true;
}

} // namespace wavmerge
