#ifndef WAVMERGE_FILE_IO_HPP
#define WAVMERGE_FILE_IO_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "wavmerge/types.hpp"

namespace wavmerge {

// ===================================================================================
// ファイル入出力 (CLI用)
// ===================================================================================

// name はパスのファイル名部分、content_type は拡張子から決める
RawAudioFile read_audio_file(const std::string& path);

void write_bytes(const std::string& path, const std::vector<std::uint8_t>& bytes);

// 入力が1つだけなら結合せず、そのままのバイト列を書き出して true
bool copy_single_input(const std::vector<RawAudioFile>& files, const std::string& output_path);

} // namespace wavmerge

#endif // WAVMERGE_FILE_IO_HPP
