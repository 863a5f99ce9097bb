#include "wavmerge/audio_file.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <map>
#include <new>
#include <optional>
#include <stdexcept>
#include <utility>

#include "wavmerge/errors.hpp"
#include "wavmerge/wav_format.hpp"

namespace wavmerge {

namespace {

// 予約量の上限 (入力1バイトあたりのフレーム数)
constexpr sf_count_t kMaxReserveFramesPerByte = 8;

bool has_tag(const std::vector<std::uint8_t>& bytes, std::size_t offset, const char* tag) {
    std::size_t len = std::strlen(tag);
    if (bytes.size() < offset + len) return false;
    return std::memcmp(bytes.data() + offset, tag, len) == 0;
}

int bit_depth_of(int format) {
    switch (format & SF_FORMAT_SUBMASK) {
        case SF_FORMAT_PCM_S8:
        case SF_FORMAT_PCM_U8: return 8;
        case SF_FORMAT_PCM_16: return 16;
        case SF_FORMAT_PCM_24: return 24;
        case SF_FORMAT_PCM_32:
        case SF_FORMAT_FLOAT: return 32;
        case SF_FORMAT_DOUBLE: return 64;
        default: return 0;
    }
}

std::string subtype_name(int format) {
    SF_FORMAT_INFO format_info;
    std::memset(&format_info, 0, sizeof(format_info));
    format_info.format = format & SF_FORMAT_SUBMASK;
    if (sf_command(nullptr, SFC_GET_FORMAT_INFO, &format_info, sizeof(format_info)) == 0 && format_info.name) {
        return format_info.name;
    }
    return "unknown";
}

// 空入力・非対応コンテナを弾いてからlibsndfileで開く
SndFileHandle open_for_read(const RawAudioFile& file, SndMemoryStream& stream, SF_INFO& sfinfo) {
    if (file.bytes.empty()) {
        throw DecodeError(file.name, "file is empty");
    }

    ContainerFormat container = sniff_container(file.bytes);
    if (!is_container_supported(container)) {
        throw DecodeError(file.name, std::string("unsupported codec (") + container_name(container) + " container)");
    }

    std::memset(&sfinfo, 0, sizeof(sfinfo));
    sfinfo.format = 0;
    SndFileHandle handle(sf_open_virtual(stream.io(), SFM_READ, &sfinfo, &stream));
    if (!handle) {
        throw DecodeError(file.name, std::string("malformed or unrecognised audio: ") + sf_strerror(nullptr));
    }
    if (sfinfo.samplerate <= 0 || sfinfo.channels <= 0) {
        throw DecodeError(file.name, "invalid stream parameters (sample rate " + std::to_string(sfinfo.samplerate) +
                                     ", channels " + std::to_string(sfinfo.channels) + ")");
    }
    return handle;
}

// libsndfileはdataチャンクがファイル末尾を超えていても黙って切り詰めるので、先に自前で確認する
void check_wav_data_extent(const RawAudioFile& file) {
    if (sniff_container(file.bytes) != ContainerFormat::Wav) return;
    std::optional<WavHeaderInfo> header = read_wav_header(file.bytes);
    if (!header || !header->has_data_chunk) return;
    // 0xFFFFFFFF はストリーミング書き出しで長さ未確定
    if (header->data_size == 0xFFFFFFFFu) return;

    const std::uint64_t data_end = static_cast<std::uint64_t>(header->data_offset) + header->data_size;
    if (data_end > file.bytes.size()) {
        throw DecodeError(file.name, "truncated stream (data chunk declares " + std::to_string(header->data_size) +
                                     " bytes, " + std::to_string(file.bytes.size() - header->data_offset) +
                                     " present)");
    }
}

} // namespace

// --- コンテナ判定 ---
ContainerFormat sniff_container(const std::vector<std::uint8_t>& bytes) {
    if ((has_tag(bytes, 0, "RIFF") || has_tag(bytes, 0, "RF64")) && has_tag(bytes, 8, "WAVE")) {
        return ContainerFormat::Wav;
    }
    if (has_tag(bytes, 0, "FORM") && (has_tag(bytes, 8, "AIFF") || has_tag(bytes, 8, "AIFC"))) {
        return ContainerFormat::Aiff;
    }
    if (has_tag(bytes, 0, "fLaC")) return ContainerFormat::Flac;
    if (has_tag(bytes, 0, "OggS")) return ContainerFormat::Ogg;
    if (has_tag(bytes, 4, "ftyp")) return ContainerFormat::Mp4;
    if (has_tag(bytes, 0, "#!AMR")) return ContainerFormat::Amr;
    if (has_tag(bytes, 0, "\x1A\x45\xDF\xA3")) return ContainerFormat::Matroska;
    if (has_tag(bytes, 0, "\x30\x26\xB2\x75")) return ContainerFormat::Asf;
    if (has_tag(bytes, 0, "ID3")) return ContainerFormat::Mpeg;
    if (bytes.size() >= 2 && bytes[0] == 0xFF) {
        // ADTSはlayerビットが00
        if ((bytes[1] & 0xF6) == 0xF0) return ContainerFormat::Adts;
        if ((bytes[1] & 0xE0) == 0xE0) return ContainerFormat::Mpeg;
    }
    return ContainerFormat::Unknown;
}

const char* container_name(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::Wav: return "WAV";
        case ContainerFormat::Aiff: return "AIFF";
        case ContainerFormat::Flac: return "FLAC";
        case ContainerFormat::Ogg: return "OGG";
        case ContainerFormat::Mpeg: return "MPEG";
        case ContainerFormat::Mp4: return "MP4/AAC";
        case ContainerFormat::Adts: return "AAC";
        case ContainerFormat::Amr: return "AMR";
        case ContainerFormat::Matroska: return "WEBM";
        case ContainerFormat::Asf: return "WMA";
        case ContainerFormat::Unknown: break;
    }
    return "unknown";
}

bool is_container_supported(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::Mp4:
        case ContainerFormat::Adts:
        case ContainerFormat::Amr:
        case ContainerFormat::Matroska:
        case ContainerFormat::Asf:
            return false;
        default:
            return true;
    }
}

std::string content_type_for(const std::string& file_name) {
    static const std::map<std::string, std::string> kAudioMimeTypes = {
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".wave", "audio/wav"},
        {".m4a", "audio/mp4"},
        {".aac", "audio/aac"},
        {".flac", "audio/flac"},
        {".ogg", "audio/ogg"},
        {".oga", "audio/ogg"},
        {".webm", "audio/webm"},
        {".3gp", "audio/3gpp"},
        {".amr", "audio/amr"},
        {".wma", "audio/x-ms-wma"},
    };

    std::size_t dot = file_name.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = file_name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kAudioMimeTypes.find(ext);
    return it == kAudioMimeTypes.end() ? "" : it->second;
}

// ===================================================================================
// メモリ上の仮想I/O (SndMemoryStream)
// ===================================================================================
SndMemoryStream::SndMemoryStream() : SndMemoryStream(std::vector<std::uint8_t>()) {}

SndMemoryStream::SndMemoryStream(std::vector<std::uint8_t> bytes) : data(std::move(bytes)) {
    vio.get_filelen = &SndMemoryStream::get_filelen;
    vio.seek = &SndMemoryStream::seek;
    vio.read = &SndMemoryStream::read;
    vio.write = &SndMemoryStream::write;
    vio.tell = &SndMemoryStream::tell;
}

sf_count_t SndMemoryStream::get_filelen(void* user_data) {
    return static_cast<sf_count_t>(static_cast<SndMemoryStream*>(user_data)->data.size());
}

sf_count_t SndMemoryStream::seek(sf_count_t offset, int whence, void* user_data) {
    auto* self = static_cast<SndMemoryStream*>(user_data);
    sf_count_t base = 0;
    switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = self->position; break;
        case SEEK_END: base = static_cast<sf_count_t>(self->data.size()); break;
        default: return -1;
    }
    sf_count_t target = base + offset;
    if (target < 0) return -1;
    self->position = target;
    return self->position;
}

sf_count_t SndMemoryStream::read(void* ptr, sf_count_t count, void* user_data) {
    auto* self = static_cast<SndMemoryStream*>(user_data);
    sf_count_t size = static_cast<sf_count_t>(self->data.size());
    if (count <= 0 || self->position >= size) return 0;
    sf_count_t n = std::min(count, size - self->position);
    std::memcpy(ptr, self->data.data() + self->position, static_cast<std::size_t>(n));
    self->position += n;
    return n;
}

sf_count_t SndMemoryStream::write(const void* ptr, sf_count_t count, void* user_data) {
    auto* self = static_cast<SndMemoryStream*>(user_data);
    if (count <= 0) return 0;
    std::size_t end = static_cast<std::size_t>(self->position + count);
    if (end > self->data.size()) self->data.resize(end);
    std::memcpy(self->data.data() + self->position, ptr, static_cast<std::size_t>(count));
    self->position += count;
    return count;
}

sf_count_t SndMemoryStream::tell(void* user_data) {
    return static_cast<SndMemoryStream*>(user_data)->position;
}

// ===================================================================================
// デコーダ
// ===================================================================================
AudioInfo probe_audio(const RawAudioFile& file) {
    SndMemoryStream stream(file.bytes);
    SF_INFO sfinfo;
    SndFileHandle handle = open_for_read(file, stream, sfinfo);

    AudioInfo info;
    info.container = sniff_container(file.bytes);
    info.subtype = subtype_name(sfinfo.format);
    info.sample_rate = sfinfo.samplerate;
    info.channels = sfinfo.channels;
    info.frames = sfinfo.frames;
    info.bit_depth = bit_depth_of(sfinfo.format);
    info.duration_seconds = static_cast<double>(sfinfo.frames) / sfinfo.samplerate;
    return info;
}

DecodedAudio decode_audio(const RawAudioFile& file) {
    check_wav_data_extent(file);

    // 一部の実装はデコード時に入力を壊すので、必ず複製から読む
    SndMemoryStream stream(file.bytes);
    SF_INFO sfinfo;
    SndFileHandle handle = open_for_read(file, stream, sfinfo);

    const int channels = sfinfo.channels;
    const bool frames_known = sfinfo.frames >= 0 && sfinfo.frames != SF_COUNT_MAX;

    DecodedAudio decoded;
    try {
        // ヘッダのフレーム数は信用しない。予約は入力サイズから見積もった上限まで
        std::vector<float> buffer;
        if (frames_known) {
            sf_count_t reserve_frames = std::min<sf_count_t>(
                sfinfo.frames, static_cast<sf_count_t>(file.bytes.size()) * kMaxReserveFramesPerByte);
            buffer.reserve(static_cast<std::size_t>(reserve_frames) * channels);
        }

        const sf_count_t block_frames = 8192;
        std::vector<float> block(static_cast<std::size_t>(block_frames) * channels);
        long long frames_read = 0;
        for (;;) {
            sf_count_t got = sf_readf_float(handle.get(), block.data(), block_frames);
            if (got <= 0) break;
            buffer.insert(buffer.end(), block.begin(), block.begin() + got * channels);
            frames_read += got;
        }

        if (sf_error(handle.get()) != SF_ERR_NO_ERROR) {
            throw DecodeError(file.name, std::string("stream error: ") + sf_strerror(handle.get()));
        }
        if (frames_known && frames_read < sfinfo.frames) {
            throw DecodeError(file.name, "truncated stream (read " + std::to_string(frames_read) + " of " +
                                         std::to_string(sfinfo.frames) + " frames)");
        }

        decoded.sample_rate = sfinfo.samplerate;
        decoded.channel_count = channels;
        decoded.frame_count = frames_read;
        decoded.samples.resize(frames_read, channels);
        if (channels == 1) {
            decoded.samples.col(0) = Eigen::Map<DspUtils::VectorF>(buffer.data(), frames_read);
        } else {
            for (long long i = 0; i < frames_read; ++i) {
                for (int j = 0; j < channels; ++j) {
                    decoded.samples(i, j) = buffer[i * channels + j];
                }
            }
        }
    } catch (const std::bad_alloc&) {
        throw DecodeError(file.name, "stream too large to decode");
    } catch (const std::length_error&) {
        throw DecodeError(file.name, "stream too large to decode");
    }
    return decoded;
}

} // namespace wavmerge
