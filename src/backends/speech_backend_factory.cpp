#include "internal/backends/speech_backend.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/backends/http/http_speech_backend.hpp"
#include "internal/backends/tone/tone_synth_backend.hpp"

namespace voice {

// =============================================================================
// SpeechBackendFactory 实现
// =============================================================================

ErrorInfo SpeechBackendFactory::create(const std::string& engine,
    std::unique_ptr<ISpeechBackend>& backend) {
    if (engine == "tone") {
        backend = std::make_unique<ToneSynthBackend>();
        return ErrorInfo::ok();
    }
    if (engine == "http") {
        backend = std::make_unique<HttpSpeechBackend>();
        return ErrorInfo::ok();
    }

    std::cerr << "[SpeechBackendFactory] Unsupported engine: " << engine << std::endl;
    return ErrorInfo::fieldError(ErrorCode::UNSUPPORTED_ENGINE, "engine",
        "Unsupported engine: " + engine);
}

bool SpeechBackendFactory::isAvailable(const std::string& engine) {
    return engine == "tone" || engine == "http";
}

std::vector<std::string> SpeechBackendFactory::getAvailableBackends() {
    return {"tone", "http"};
}

}  // namespace voice
