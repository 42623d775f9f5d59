#include "internal/io/audio_file_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "internal/audio/pcm_codec.hpp"

namespace voice {

namespace fs = std::filesystem;

namespace {

// 非 WAV 文件无法解析头部时的估算参数 (44.1kHz, 16-bit 立体声)
constexpr int kDefaultSampleRate = 44100;
constexpr double kEstimatedBytesPerSecond = 44100.0 * 2 * 2;

std::string lowerExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool listed(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool isWithin(const fs::path& base, const fs::path& target) {
    fs::path rel = target.lexically_relative(base);
    if (rel.empty() || rel == ".") {
        return false;
    }
    return *rel.begin() != "..";
}

}  // namespace

// =============================================================================
// AudioFileLoader
// =============================================================================

const std::vector<std::string>& AudioFileLoader::supportedFormats() {
    static const std::vector<std::string> formats = {"wav", "mp3", "flac", "ogg", "m4a"};
    return formats;
}

ErrorInfo AudioFileLoader::load(const std::string& file_path,
    const std::string& expected_format,
    AudioData& out) const {
    std::error_code ec;
    fs::path path = fs::weakly_canonical(fs::absolute(file_path, ec), ec);

    if (!fs::is_regular_file(path, ec)) {
        std::cerr << "[AudioFileLoader] File not found: " << file_path << std::endl;
        return ErrorInfo::error(ErrorCode::NOT_FOUND, "File not found: " + file_path);
    }

    std::string format = lowerExtension(path);
    if (!listed(supportedFormats(), format)) {
        std::cerr << "[AudioFileLoader] Unsupported format: " << path.extension() << std::endl;
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR,
            "Unsupported format: " + path.extension().string());
    }

    if (!expected_format.empty()) {
        std::string expected = expected_format;
        if (expected[0] == '.') expected.erase(0, 1);
        std::transform(expected.begin(), expected.end(), expected.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (expected != format) {
            return ErrorInfo::error(ErrorCode::FORMAT_ERROR,
                "Format mismatch: expected " + expected + ", file is " + format);
        }
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ErrorInfo::error(ErrorCode::STORAGE_ERROR,
            "Failed to open file: " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());

    if (bytes.empty()) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR, "Audio file is empty: " + path.string());
    }

    AudioData loaded;
    loaded.format = format;

    if (format == kFormatWav) {
        audio::WavInfo info;
        auto err = audio::parseWavHeader(bytes, info);
        if (!err.isOk()) {
            std::cerr << "[AudioFileLoader] Malformed WAV: " << path << std::endl;
            return err;
        }
        int bytes_per_second = info.sample_rate * info.channels * std::max(1, info.bits_per_sample / 8);
        loaded.sample_rate = info.sample_rate;
        loaded.duration = static_cast<double>(info.data_size) / bytes_per_second;
    } else {
        loaded.sample_rate = kDefaultSampleRate;
        loaded.duration = static_cast<double>(bytes.size()) / kEstimatedBytesPerSecond;
    }
    loaded.bytes = std::move(bytes);

    std::cout << "[AudioFileLoader] Loaded " << path.filename() << " ("
              << loaded.bytes.size() << " bytes, " << loaded.format << ")" << std::endl;
    out = std::move(loaded);
    return ErrorInfo::ok();
}

// =============================================================================
// AudioFileWriter
// =============================================================================

AudioFileWriter::AudioFileWriter(const std::string& base_dir) {
    std::error_code ec;
    base_dir_ = fs::weakly_canonical(fs::absolute(base_dir, ec), ec).string();
}

const std::vector<std::string>& AudioFileWriter::allowedExtensions() {
    static const std::vector<std::string> extensions = {"wav", "mp3", "flac", "ogg"};
    return extensions;
}

ErrorInfo AudioFileWriter::write(const AudioData& input,
    const std::string& file_path,
    bool overwrite,
    WriteResult& result) const {
    std::error_code ec;
    fs::path base(base_dir_);
    fs::path target = fs::weakly_canonical(base / file_path, ec);
    if (ec || !isWithin(base, target)) {
        std::cerr << "[AudioFileWriter] Path traversal attempt detected: " << file_path << std::endl;
        return ErrorInfo::error(ErrorCode::SECURITY_VIOLATION,
            "Path traversal attempt detected", file_path);
    }

    std::string ext = lowerExtension(target);
    if (!listed(allowedExtensions(), ext)) {
        return ErrorInfo::error(ErrorCode::FORMAT_ERROR,
            "Invalid extension: " + target.extension().string());
    }

    if (fs::exists(target, ec) && !overwrite) {
        return ErrorInfo::error(ErrorCode::ALREADY_EXISTS,
            "File exists: " + target.string());
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to create directory", target.parent_path().string() + ": " + ec.message());
    }

    // 裸 PCM 写入 .wav 时补 RIFF 头
    std::vector<uint8_t> payload;
    const std::vector<uint8_t>* data = &input.bytes;
    if (ext == kFormatWav && input.format == kFormatPcmS16le) {
        if (input.sample_rate <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT,
                "PCM audio needs a sample rate to be written as WAV");
        }
        std::vector<int16_t> pcm(input.bytes.size() / 2);
        for (size_t i = 0; i < pcm.size(); ++i) {
            pcm[i] = static_cast<int16_t>(input.bytes[i * 2] | (input.bytes[i * 2 + 1] << 8));
        }
        payload = audio::buildWav(pcm, input.sample_rate);
        data = &payload;
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::cerr << "[AudioFileWriter] Failed to open file for writing: " << target << std::endl;
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to open file for writing: " + target.string());
    }
    file.write(reinterpret_cast<const char*>(data->data()),
        static_cast<std::streamsize>(data->size()));
    file.close();
    if (!file) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to write file: " + target.string());
    }

    result.file_path = target.string();
    result.file_size = fs::file_size(target, ec);
    std::cout << "[AudioFileWriter] Wrote " << result.file_path
              << " (" << result.file_size << " bytes)" << std::endl;
    return ErrorInfo::ok();
}

}  // namespace voice
