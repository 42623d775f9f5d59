// =============================================================================
// Speech Backend Tests
// =============================================================================
// 工厂、本地音调合成后端、HTTP 后端的失败路径
// =============================================================================

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include "internal/backends/http/http_speech_backend.hpp"
#include "internal/backends/speech_backend.hpp"
#include "internal/backends/tone/tone_synth_backend.hpp"

using namespace voice;

TEST_CASE("SpeechBackendFactory creates known engines", "[backend][factory]") {
    REQUIRE(SpeechBackendFactory::getAvailableBackends() == std::vector<std::string>{"tone", "http"});
    REQUIRE(SpeechBackendFactory::isAvailable("tone"));
    REQUIRE_FALSE(SpeechBackendFactory::isAvailable("festival"));

    std::unique_ptr<ISpeechBackend> backend;
    REQUIRE(SpeechBackendFactory::create("tone", backend).isOk());
    REQUIRE(backend->getName() == "tone");
    REQUIRE_FALSE(backend->isInitialized());

    REQUIRE(SpeechBackendFactory::create("http", backend).isOk());
    REQUIRE(backend->getName() == "http");
    REQUIRE(backend->supportsRecognition());

    std::unique_ptr<ISpeechBackend> none;
    auto err = SpeechBackendFactory::create("festival", none);
    REQUIRE(err.code == ErrorCode::UNSUPPORTED_ENGINE);
    REQUIRE(err.field == "engine");
    REQUIRE(none == nullptr);
}

TEST_CASE("ToneSynthBackend lifecycle", "[backend][tone]") {
    ToneSynthBackend backend;
    AudioData audio;
    SynthesisRequest request;
    request.text = "hello";

    REQUIRE(backend.synthesize(request, audio).code == ErrorCode::NOT_INITIALIZED);

    auto config = EngineConfig::InMemory().withSampleRate(0);
    REQUIRE(backend.initialize(config).code == ErrorCode::INVALID_ARGUMENT);
    REQUIRE_FALSE(backend.isInitialized());

    REQUIRE(backend.initialize(EngineConfig::InMemory().withSampleRate(16000)).isOk());
    REQUIRE(backend.isInitialized());
    REQUIRE(backend.getSampleRate() == 16000);

    backend.shutdown();
    REQUIRE_FALSE(backend.isInitialized());
}

TEST_CASE("ToneSynthBackend synthesizes pcm audio", "[backend][tone]") {
    ToneSynthBackend backend;
    REQUIRE(backend.initialize(EngineConfig::InMemory().withSampleRate(16000)).isOk());

    SynthesisRequest request;
    request.voice = "narrator";
    AudioData audio;

    SECTION("duration follows characters and pauses") {
        request.text = "ab";
        REQUIRE(backend.synthesize(request, audio).isOk());
        REQUIRE(audio.format == kFormatPcmS16le);
        REQUIRE(audio.sample_rate == 16000);
        REQUIRE(audio.duration == Approx(0.16).margin(0.005));
        REQUIRE(audio.processing_history ==
            std::vector<std::string>{"synthesize(engine=tone,voice=narrator)"});

        request.text = "a b.";
        REQUIRE(backend.synthesize(request, audio).isOk());
        REQUIRE(audio.duration == Approx(0.28).margin(0.005));
    }

    SECTION("speed shortens output") {
        request.text = "abcd";
        request.speed = 2.0f;
        REQUIRE(backend.synthesize(request, audio).isOk());
        REQUIRE(audio.duration == Approx(0.16).margin(0.005));
    }

    SECTION("same text gives the same audio") {
        request.text = "你好 world";
        AudioData again;
        REQUIRE(backend.synthesize(request, audio).isOk());
        REQUIRE(backend.synthesize(request, again).isOk());
        REQUIRE(audio.bytes == again.bytes);
    }

    SECTION("text checks") {
        request.text = "   ";
        REQUIRE(backend.synthesize(request, audio).code == ErrorCode::INVALID_TEXT);

        request.text = "Caf\xe9";
        REQUIRE(backend.synthesize(request, audio).code == ErrorCode::INVALID_TEXT);

        request.text = std::string(kMaxSynthesisChars, 'a');
        request.speed = 50.0f;
        REQUIRE(backend.synthesize(request, audio).isOk());

        request.text = std::string(kMaxSynthesisChars + 1, 'a');
        REQUIRE(backend.synthesize(request, audio).code == ErrorCode::TEXT_TOO_LONG);
    }

    SECTION("non-positive speed") {
        request.text = "hi";
        request.speed = 0.0f;
        REQUIRE(backend.synthesize(request, audio).code == ErrorCode::INVALID_ARGUMENT);
    }

    SECTION("no recognition support") {
        RecognitionResult result;
        REQUIRE_FALSE(backend.supportsRecognition());
        REQUIRE(backend.recognize(audio, "en-US", result).code == ErrorCode::BACKEND_ERROR);
    }
}

TEST_CASE("HttpSpeechBackend failure paths", "[backend][http]") {
    HttpSpeechBackend backend;
    SynthesisRequest request;
    request.text = "hello";
    AudioData audio;

    SECTION("requires an endpoint") {
        REQUIRE(backend.initialize(EngineConfig::InMemory()).code == ErrorCode::INVALID_ARGUMENT);
        REQUIRE(backend.synthesize(request, audio).code == ErrorCode::NOT_INITIALIZED);
    }

    SECTION("unreachable service is a backend error") {
        auto config = EngineConfig::Http("http://127.0.0.1:1/");
        config.http_timeout_ms = 2000;
        REQUIRE(backend.initialize(config).isOk());

        auto err = backend.synthesize(request, audio);
        REQUIRE(err.code == ErrorCode::BACKEND_ERROR);
        REQUIRE(audio.isEmpty());

        RecognitionResult result;
        auto pcm = audio;
        pcm.bytes = {0, 0, 0, 0};
        pcm.sample_rate = 16000;
        REQUIRE(backend.recognize(pcm, "en-US", result).code == ErrorCode::BACKEND_ERROR);
    }

    SECTION("recognizing empty audio") {
        REQUIRE(backend.initialize(EngineConfig::Http("http://127.0.0.1:1")).isOk());
        RecognitionResult result;
        REQUIRE(backend.recognize(AudioData{}, "en-US", result).code == ErrorCode::INVALID_ARGUMENT);
    }

    SECTION("blank text is rejected before any request") {
        REQUIRE(backend.initialize(EngineConfig::Http("http://127.0.0.1:1")).isOk());
        request.text = "";
        REQUIRE(backend.synthesize(request, audio).code == ErrorCode::INVALID_TEXT);
    }
}

TEST_CASE("HttpSpeechBackend::parseRecognition reads service responses", "[backend][http]") {
    auto bytes = [](const std::string& text) { return std::vector<uint8_t>(text.begin(), text.end()); };
    RecognitionResult result;

    SECTION("well-formed response") {
        auto err = HttpSpeechBackend::parseRecognition(
            bytes(R"({"text":"hello","confidence":0.8,"language":"en-GB"})"), "en-US", result);
        REQUIRE(err.isOk());
        REQUIRE(result.text == "hello");
        REQUIRE(result.confidence == Approx(0.8f));
        REQUIRE(result.language == "en-GB");
    }

    SECTION("confidence is clamped to [0, 1]") {
        REQUIRE(HttpSpeechBackend::parseRecognition(
            bytes(R"({"text":"a","confidence":1.7})"), "en-US", result).isOk());
        REQUIRE(result.confidence == 1.0f);

        REQUIRE(HttpSpeechBackend::parseRecognition(
            bytes(R"({"text":"a","confidence":-0.5})"), "en-US", result).isOk());
        REQUIRE(result.confidence == 0.0f);
    }

    SECTION("missing language falls back to the request") {
        REQUIRE(HttpSpeechBackend::parseRecognition(bytes(R"({"text":"hola"})"), "es-ES", result).isOk());
        REQUIRE(result.language == "es-ES");
        REQUIRE(result.confidence == 0.0f);
    }

    SECTION("malformed responses leave the result untouched") {
        result.text = "previous";
        REQUIRE(HttpSpeechBackend::parseRecognition(bytes("not json"), "en-US", result).code ==
                ErrorCode::BACKEND_ERROR);
        REQUIRE(HttpSpeechBackend::parseRecognition(bytes(R"({"confidence":0.9})"), "en-US", result).code ==
                ErrorCode::BACKEND_ERROR);
        REQUIRE(HttpSpeechBackend::parseRecognition(bytes(R"({"text":5})"), "en-US", result).code ==
                ErrorCode::BACKEND_ERROR);
        REQUIRE(result.text == "previous");
    }
}
