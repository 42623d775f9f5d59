#include "internal/audio/pcm_codec.hpp"

#include <cstdint>
#include <cstring>

#include <algorithm>
#include <string>
#include <vector>

#include "internal/audio/audio_processor.hpp"

namespace voice {
namespace audio {

namespace {

uint32_t readU32(const std::vector<uint8_t>& bytes, size_t pos) {
    return static_cast<uint32_t>(bytes[pos]) |
        (static_cast<uint32_t>(bytes[pos + 1]) << 8) |
        (static_cast<uint32_t>(bytes[pos + 2]) << 16) |
        (static_cast<uint32_t>(bytes[pos + 3]) << 24);
}

uint16_t readU16(const std::vector<uint8_t>& bytes, size_t pos) {
    return static_cast<uint16_t>(bytes[pos] | (bytes[pos + 1] << 8));
}

void writeU32(std::vector<uint8_t>& bytes, uint32_t value) {
    bytes.push_back(static_cast<uint8_t>(value & 0xFF));
    bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    bytes.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    bytes.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void writeU16(std::vector<uint8_t>& bytes, uint16_t value) {
    bytes.push_back(static_cast<uint8_t>(value & 0xFF));
    bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void writeTag(std::vector<uint8_t>& bytes, const char* tag) {
    bytes.insert(bytes.end(), tag, tag + 4);
}

std::vector<int16_t> bytesToInt16(const uint8_t* data, size_t size) {
    std::vector<int16_t> pcm(size / 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = static_cast<int16_t>(data[i * 2] | (data[i * 2 + 1] << 8));
    }
    return pcm;
}

}  // namespace

// =============================================================================
// WAV
// =============================================================================

ErrorInfo parseWavHeader(const std::vector<uint8_t>& bytes, WavInfo& info) {
    if (bytes.size() < 12 ||
        std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "Not a RIFF/WAVE stream");
    }

    WavInfo parsed;
    bool has_fmt = false;
    bool has_data = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = readU32(bytes, pos + 4);
        size_t body = pos + 8;

        if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "Truncated WAV fmt chunk");
            }
            uint16_t audio_format = readU16(bytes, body);
            if (audio_format != 1) {
                return ErrorInfo::error(ErrorCode::FORMAT_ERROR,
                    "Unsupported WAV encoding (only PCM)",
                    "audio_format=" + std::to_string(audio_format));
            }
            parsed.channels = readU16(bytes, body + 2);
            parsed.sample_rate = static_cast<int>(readU32(bytes, body + 4));
            parsed.bits_per_sample = readU16(bytes, body + 14);
            has_fmt = true;
        } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
            parsed.data_offset = body;
            parsed.data_size = std::min<size_t>(chunk_size, bytes.size() - body);
            has_data = true;
            break;
        }

        // 块按偶数字节对齐
        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!has_fmt || !has_data) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "WAV stream is missing fmt or data chunk");
    }
    if (parsed.sample_rate <= 0 || parsed.channels <= 0) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "WAV stream has invalid sample rate or channels");
    }

    info = parsed;
    return ErrorInfo::ok();
}

std::vector<uint8_t> buildWav(const std::vector<int16_t>& pcm, int sample_rate) {
    const uint16_t num_channels = 1;
    const uint16_t bits_per_sample = 16;
    uint32_t data_size = static_cast<uint32_t>(pcm.size() * sizeof(int16_t));
    uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * num_channels * (bits_per_sample / 8);
    uint16_t block_align = num_channels * (bits_per_sample / 8);

    std::vector<uint8_t> bytes;
    bytes.reserve(44 + data_size);

    writeTag(bytes, "RIFF");
    writeU32(bytes, 36 + data_size);
    writeTag(bytes, "WAVE");
    writeTag(bytes, "fmt ");
    writeU32(bytes, 16);
    writeU16(bytes, 1);  // PCM
    writeU16(bytes, num_channels);
    writeU32(bytes, static_cast<uint32_t>(sample_rate));
    writeU32(bytes, byte_rate);
    writeU16(bytes, block_align);
    writeU16(bytes, bits_per_sample);
    writeTag(bytes, "data");
    writeU32(bytes, data_size);

    for (int16_t sample : pcm) {
        writeU16(bytes, static_cast<uint16_t>(sample));
    }
    return bytes;
}

// =============================================================================
// 解码 / 编码
// =============================================================================

ErrorInfo decodeSamples(const AudioData& audio, std::vector<float>& samples) {
    if (audio.format == kFormatPcmS16le) {
        if (audio.bytes.size() % 2 != 0) {
            return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "PCM s16le buffer has odd length");
        }
        samples = int16ToFloat(bytesToInt16(audio.bytes.data(), audio.bytes.size()));
        return ErrorInfo::ok();
    }

    if (audio.format == kFormatWav) {
        WavInfo info;
        auto err = parseWavHeader(audio.bytes, info);
        if (!err.isOk()) {
            return err;
        }
        if (info.channels != 1 || info.bits_per_sample != 16) {
            return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
                "Only 16-bit mono WAV can be processed",
                "channels=" + std::to_string(info.channels) +
                " bits=" + std::to_string(info.bits_per_sample));
        }
        samples = int16ToFloat(bytesToInt16(audio.bytes.data() + info.data_offset, info.data_size));
        return ErrorInfo::ok();
    }

    return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
        "Cannot decode samples from format: " + audio.format);
}

ErrorInfo decodeAudio(const AudioData& audio, std::vector<float>& samples, int& sample_rate) {
    int rate = audio.sample_rate;
    if (audio.format == kFormatWav) {
        WavInfo info;
        auto err = parseWavHeader(audio.bytes, info);
        if (!err.isOk()) {
            return err;
        }
        rate = info.sample_rate;
    } else if (!isPcmFormat(audio.format)) {
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Cannot decode samples from format: " + audio.format);
    }

    if (rate <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
            "Audio has no valid sample rate",
            "sample_rate=" + std::to_string(audio.sample_rate));
    }

    auto err = decodeSamples(audio, samples);
    if (!err.isOk()) {
        return err;
    }
    sample_rate = rate;
    return ErrorInfo::ok();
}

ErrorInfo encodeSamples(const std::vector<float>& samples,
    int sample_rate,
    const std::string& format,
    AudioData& out) {
    if (sample_rate <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Invalid sample rate");
    }

    auto pcm = floatToInt16(samples);

    if (format == kFormatPcmS16le) {
        out.bytes.resize(pcm.size() * 2);
        for (size_t i = 0; i < pcm.size(); ++i) {
            out.bytes[i * 2] = static_cast<uint8_t>(pcm[i] & 0xFF);
            out.bytes[i * 2 + 1] = static_cast<uint8_t>((pcm[i] >> 8) & 0xFF);
        }
    } else if (format == kFormatWav) {
        out.bytes = buildWav(pcm, sample_rate);
    } else {
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_FORMAT,
            "Cannot encode samples to format: " + format);
    }

    out.format = format;
    out.sample_rate = sample_rate;
    out.duration = static_cast<double>(samples.size()) / sample_rate;
    return ErrorInfo::ok();
}

}  // namespace audio
}  // namespace voice
