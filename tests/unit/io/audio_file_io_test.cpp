// =============================================================================
// Audio File I/O Tests
// =============================================================================
// 读取: 格式识别与 WAV 头解析; 写入: 目录约束与覆盖策略
// =============================================================================

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/audio/pcm_codec.hpp"
#include "internal/io/audio_file_io.hpp"
#include "test_helpers/test_audio.h"

using namespace voice;
namespace fs = std::filesystem;

TEST_CASE("AudioFileLoader reads WAV headers", "[io][loader]") {
    vox_test::TempDir dir("vox_io");
    auto wav = audio::buildWav(std::vector<int16_t>(8000, 100), 16000);
    vox_test::writeBytes(dir.path() / "clip.wav", wav);

    AudioFileLoader loader;
    AudioData audio;

    SECTION("format, rate and duration") {
        REQUIRE(loader.load((dir.path() / "clip.wav").string(), audio).isOk());
        REQUIRE(audio.format == "wav");
        REQUIRE(audio.sample_rate == 16000);
        REQUIRE(audio.duration == Approx(0.5));
        REQUIRE(audio.bytes == wav);
    }

    SECTION("expected format is case-insensitive") {
        REQUIRE(loader.load((dir.path() / "clip.wav").string(), ".WAV", audio).isOk());
    }

    SECTION("expected format mismatch") {
        auto err = loader.load((dir.path() / "clip.wav").string(), "mp3", audio);
        REQUIRE(err.code == ErrorCode::FORMAT_ERROR);
        REQUIRE(audio.isEmpty());
    }
}

TEST_CASE("AudioFileLoader estimates compressed formats", "[io][loader]") {
    vox_test::TempDir dir("vox_io");
    vox_test::writeBytes(dir.path() / "song.MP3", std::vector<uint8_t>(176400, 0xAB));

    AudioFileLoader loader;
    AudioData audio;
    REQUIRE(loader.load((dir.path() / "song.MP3").string(), audio).isOk());
    REQUIRE(audio.format == "mp3");
    REQUIRE(audio.sample_rate == 44100);
    REQUIRE(audio.duration == Approx(1.0));
}

TEST_CASE("AudioFileLoader error cases", "[io][loader]") {
    vox_test::TempDir dir("vox_io");
    AudioFileLoader loader;
    AudioData audio;

    SECTION("missing file") {
        auto err = loader.load((dir.path() / "nope.wav").string(), audio);
        REQUIRE(err.code == ErrorCode::NOT_FOUND);
    }

    SECTION("directory is not a file") {
        REQUIRE(loader.load(dir.str(), audio).code == ErrorCode::NOT_FOUND);
    }

    SECTION("unsupported extension") {
        vox_test::writeText(dir.path() / "notes.txt", "hello");
        REQUIRE(loader.load((dir.path() / "notes.txt").string(), audio).code == ErrorCode::FORMAT_ERROR);
    }

    SECTION("empty file") {
        vox_test::writeBytes(dir.path() / "empty.ogg", {});
        REQUIRE(loader.load((dir.path() / "empty.ogg").string(), audio).code == ErrorCode::FORMAT_ERROR);
    }

    SECTION("corrupt wav") {
        vox_test::writeText(dir.path() / "fake.wav", "this is not a riff file at all");
        REQUIRE(loader.load((dir.path() / "fake.wav").string(), audio).code == ErrorCode::FORMAT_ERROR);
    }
}

TEST_CASE("AudioFileWriter writes inside its base directory", "[io][writer]") {
    vox_test::TempDir dir("vox_io");
    AudioFileWriter writer(dir.str());
    auto audio = vox_test::sineAudio(440.0f, 0.25);
    WriteResult result;

    SECTION("pcm gets a WAV header") {
        REQUIRE(writer.write(audio, "out.wav", false, result).isOk());
        REQUIRE(fs::exists(result.file_path));
        REQUIRE(result.file_size == audio.bytes.size() + 44);

        AudioFileLoader loader;
        AudioData loaded;
        REQUIRE(loader.load(result.file_path, loaded).isOk());
        REQUIRE(loaded.sample_rate == audio.sample_rate);
        REQUIRE(loaded.duration == Approx(audio.duration));
    }

    SECTION("other containers are written verbatim") {
        REQUIRE(writer.write(audio, "raw.mp3", false, result).isOk());
        REQUIRE(result.file_size == audio.bytes.size());
    }

    SECTION("nested directories are created") {
        REQUIRE(writer.write(audio, "a/b/c.flac", false, result).isOk());
        REQUIRE(fs::exists(dir.path() / "a" / "b" / "c.flac"));
    }

    SECTION("existing files need overwrite") {
        REQUIRE(writer.write(audio, "dup.wav", false, result).isOk());
        auto err = writer.write(audio, "dup.wav", false, result);
        REQUIRE(err.code == ErrorCode::ALREADY_EXISTS);
        REQUIRE(writer.write(audio, "dup.wav", true, result).isOk());
    }

    SECTION("pcm without a rate cannot become WAV") {
        audio.sample_rate = 0;
        REQUIRE(writer.write(audio, "norate.wav", false, result).code == ErrorCode::INVALID_ARGUMENT);
    }
}

TEST_CASE("AudioFileWriter rejects unsafe targets", "[io][writer][security]") {
    vox_test::TempDir dir("vox_io");
    AudioFileWriter writer((dir.path() / "out").string());
    auto audio = vox_test::sineAudio(440.0f, 0.1);
    WriteResult result;

    SECTION("parent traversal") {
        auto err = writer.write(audio, "../escape.wav", false, result);
        REQUIRE(err.code == ErrorCode::SECURITY_VIOLATION);
        REQUIRE_FALSE(fs::exists(dir.path() / "escape.wav"));
    }

    SECTION("traversal hidden in the middle") {
        REQUIRE(writer.write(audio, "sub/../../escape.wav", false, result).code ==
            ErrorCode::SECURITY_VIOLATION);
    }

    SECTION("absolute path") {
        auto target = (dir.path() / "abs.wav").string();
        REQUIRE(writer.write(audio, target, false, result).code == ErrorCode::SECURITY_VIOLATION);
        REQUIRE_FALSE(fs::exists(target));
    }

    SECTION("base directory itself") {
        REQUIRE(writer.write(audio, "", false, result).code == ErrorCode::SECURITY_VIOLATION);
    }

    SECTION("disallowed extension") {
        REQUIRE(writer.write(audio, "clip.exe", false, result).code == ErrorCode::FORMAT_ERROR);
        REQUIRE(writer.write(audio, "clip", false, result).code == ErrorCode::FORMAT_ERROR);
    }
}
