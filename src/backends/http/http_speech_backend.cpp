#include "internal/backends/http/http_speech_backend.hpp"

#include <curl/curl.h>

#include <cstdint>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "internal/audio/audio_processor.hpp"
#include "internal/audio/pcm_codec.hpp"

namespace voice {

namespace {

std::once_flag g_curl_init;

// CURL write callback
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::vector<uint8_t>*>(userp);
    size_t total_size = size * nmemb;
    const auto* bytes = static_cast<const uint8_t*>(contents);
    body->insert(body->end(), bytes, bytes + total_size);
    return total_size;
}

std::string trimSlash(const std::string& url) {
    std::string result = url;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

}  // namespace

HttpSpeechBackend::~HttpSpeechBackend() {
    shutdown();
}

ErrorInfo HttpSpeechBackend::initialize(const EngineConfig& config) {
    if (config.http_endpoint.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "HTTP engine requires an endpoint");
    }

    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    endpoint_ = trimSlash(config.http_endpoint);
    api_key_ = config.api_key;
    timeout_ms_ = config.http_timeout_ms;
    sample_rate_ = config.sample_rate;
    initialized_ = true;

    std::cout << "[HttpSpeechBackend] Initialized (endpoint=" << endpoint_ << ")" << std::endl;
    return ErrorInfo::ok();
}

void HttpSpeechBackend::shutdown() {
    initialized_ = false;
}

ErrorInfo HttpSpeechBackend::post(const std::string& url,
    const std::string& content_type,
    const uint8_t* data,
    size_t size,
    HttpResponse& response) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return ErrorInfo::error(ErrorCode::BACKEND_ERROR, "Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
    if (!api_key_.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + api_key_).c_str());
    }

    response = HttpResponse();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(data));
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        char* type = nullptr;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &type);
        if (type) {
            response.content_type = type;
        }
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "[HttpSpeechBackend] Request failed: " << curl_easy_strerror(res) << std::endl;
        return ErrorInfo::error(ErrorCode::BACKEND_ERROR,
            "Speech service request failed", std::string(curl_easy_strerror(res)) + " (" + url + ")");
    }
    if (response.status < 200 || response.status >= 300) {
        std::cerr << "[HttpSpeechBackend] HTTP " << response.status << " from " << url << std::endl;
        return ErrorInfo::error(ErrorCode::BACKEND_ERROR,
            "Speech service returned HTTP " + std::to_string(response.status),
            std::string(response.body.begin(), response.body.end()));
    }
    return ErrorInfo::ok();
}

ErrorInfo HttpSpeechBackend::synthesize(const SynthesisRequest& request, AudioData& out) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Backend not initialized");
    }
    auto err = checkText(request.text);
    if (!err.isOk()) {
        std::cerr << "[HttpSpeechBackend] " << err.message << std::endl;
        return err;
    }

    nlohmann::json payload = {
        {"text", request.text},
        {"voice", request.voice},
        {"language", request.language},
        {"speed", request.speed},
    };
    std::string body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    HttpResponse response;
    err = post(endpoint_ + "/synthesize", "application/json",
        reinterpret_cast<const uint8_t*>(body.data()), body.size(), response);
    if (!err.isOk()) {
        return err;
    }
    if (response.body.empty()) {
        return ErrorInfo::error(ErrorCode::BACKEND_ERROR, "Speech service returned no audio");
    }

    AudioData result;
    result.bytes = response.body;
    if (response.content_type.find("wav") != std::string::npos) {
        audio::WavInfo info;
        err = audio::parseWavHeader(result.bytes, info);
        if (!err.isOk()) {
            return ErrorInfo::error(ErrorCode::BACKEND_ERROR,
                "Speech service returned malformed WAV", err.message);
        }
        result.format = kFormatWav;
        result.sample_rate = info.sample_rate;
        result.duration = static_cast<double>(info.data_size) /
            (info.sample_rate * info.channels * (info.bits_per_sample / 8 > 0 ? info.bits_per_sample / 8 : 1));

        // 服务端采样率与配置不一致时重采样到配置采样率
        if (info.sample_rate != sample_rate_ && info.channels == 1 && info.bits_per_sample == 16) {
            std::vector<float> samples;
            err = audio::decodeSamples(result, samples);
            if (!err.isOk()) {
                return ErrorInfo::error(ErrorCode::BACKEND_ERROR,
                    "Speech service returned undecodable WAV", err.message);
            }
            std::cout << "[HttpSpeechBackend] Resampling " << info.sample_rate
                      << " Hz -> " << sample_rate_ << " Hz" << std::endl;
            err = audio::encodeSamples(audio::resampleAudio(samples, info.sample_rate, sample_rate_),
                sample_rate_, kFormatWav, result);
            if (!err.isOk()) {
                return err;
            }
        }
    } else {
        result.format = kFormatPcmS16le;
        result.sample_rate = sample_rate_;
        result.duration = static_cast<double>(result.bytes.size() / 2) / sample_rate_;
    }
    result.processing_history.push_back("synthesize(engine=http,voice=" + request.voice + ")");

    out = result;
    return ErrorInfo::ok();
}

ErrorInfo HttpSpeechBackend::recognize(const AudioData& input,
    const std::string& language,
    RecognitionResult& result) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Backend not initialized");
    }
    if (input.isEmpty()) {
        return ErrorInfo::error(ErrorCode::INVALID_ARGUMENT, "Audio is empty");
    }

    std::string content_type = input.format == kFormatWav ? "audio/wav" : "application/octet-stream";
    CURL* curl = curl_easy_init();
    std::string lang = language;
    if (curl) {
        char* escaped = curl_easy_escape(curl, language.c_str(), static_cast<int>(language.size()));
        if (escaped) {
            lang = escaped;
            curl_free(escaped);
        }
        curl_easy_cleanup(curl);
    }

    HttpResponse response;
    auto err = post(endpoint_ + "/recognize?language=" + lang, content_type,
        input.bytes.data(), input.bytes.size(), response);
    if (!err.isOk()) {
        return err;
    }

    err = parseRecognition(response.body, language, result);
    if (!err.isOk()) {
        std::cerr << "[HttpSpeechBackend] " << err.message << std::endl;
    }
    return err;
}

ErrorInfo HttpSpeechBackend::parseRecognition(const std::vector<uint8_t>& body,
    const std::string& language,
    RecognitionResult& result) {
    nlohmann::json json = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("text") || !json["text"].is_string()) {
        return ErrorInfo::error(ErrorCode::BACKEND_ERROR, "Speech service returned an invalid recognition result");
    }

    RecognitionResult parsed;
    parsed.text = json["text"].get<std::string>();
    if (json.contains("confidence") && json["confidence"].is_number()) {
        double confidence = json["confidence"].get<double>();
        parsed.confidence = static_cast<float>(std::min(std::max(confidence, 0.0), 1.0));
    }
    parsed.language = language;
    if (json.contains("language") && json["language"].is_string()) {
        parsed.language = json["language"].get<std::string>();
    }
    result = parsed;
    return ErrorInfo::ok();
}

}  // namespace voice
