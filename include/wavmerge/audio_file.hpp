#ifndef WAVMERGE_AUDIO_FILE_HPP
#define WAVMERGE_AUDIO_FILE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <sndfile.h>

#include "wavmerge/types.hpp"

namespace wavmerge {

enum class ContainerFormat {
    Unknown,
    Wav,
    Aiff,
    Flac,
    Ogg,
    Mpeg,
    Mp4,
    Adts,
    Amr,
    Matroska,
    Asf
};

ContainerFormat sniff_container(const std::vector<std::uint8_t>& bytes);
const char* container_name(ContainerFormat format);
// libsndfileで読めないコンテナはfalse
bool is_container_supported(ContainerFormat format);

// 拡張子 -> MIMEタイプ。音声でない拡張子は空文字
std::string content_type_for(const std::string& file_name);

// libsndfileの仮想I/Oをメモリ上のバッファに向ける。
// 読み込み時は渡されたバイト列の複製を持つので、呼び出し側のバッファには触れない。
class SndMemoryStream {
public:
    SndMemoryStream();
    explicit SndMemoryStream(std::vector<std::uint8_t> bytes);

    SndMemoryStream(const SndMemoryStream&) = delete;
    SndMemoryStream& operator=(const SndMemoryStream&) = delete;

    SF_VIRTUAL_IO* io() { return &vio; }
    const std::vector<std::uint8_t>& bytes() const { return data; }

private:
    static sf_count_t get_filelen(void* user_data);
    static sf_count_t seek(sf_count_t offset, int whence, void* user_data);
    static sf_count_t read(void* ptr, sf_count_t count, void* user_data);
    static sf_count_t write(const void* ptr, sf_count_t count, void* user_data);
    static sf_count_t tell(void* user_data);

    std::vector<std::uint8_t> data;
    sf_count_t position = 0;
    SF_VIRTUAL_IO vio;
};

struct SndFileCloser {
    void operator()(SNDFILE* handle) const { sf_close(handle); }
};
using SndFileHandle = std::unique_ptr<SNDFILE, SndFileCloser>;

struct AudioInfo {
    ContainerFormat container = ContainerFormat::Unknown;
    std::string subtype;
    int sample_rate = 0;
    int channels = 0;
    long long frames = 0;
    int bit_depth = 0; // 0 = 不明・圧縮形式
    double duration_seconds = 0.0;
};

// サンプルは読まずにストリーム情報だけ取得する
AudioInfo probe_audio(const RawAudioFile& file);

// 全体をfloat PCMにデコードする。途中で失敗したら何も返さずDecodeError
DecodedAudio decode_audio(const RawAudioFile& file);

} // namespace wavmerge

#endif // WAVMERGE_AUDIO_FILE_HPP
