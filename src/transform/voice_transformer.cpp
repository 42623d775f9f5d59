#include "internal/transform/voice_transformer.hpp"

#include <cmath>
#include <cstdint>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/audio/audio_processor.hpp"
#include "internal/audio/pcm_codec.hpp"

namespace voice {

namespace {

constexpr uint32_t kBreathSeed = 0x5eed1234u;
constexpr float kRoughnessRateHz = 35.0f;

std::string fmt(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

bool inRange(float value, float lo, float hi) {
    return value >= lo && value <= hi;
}

ErrorInfo rangeError(const ValidationReport& report, const std::string& what) {
    std::cerr << "[VoiceTransformer] Invalid " << what << ": " << report.errors.front() << std::endl;
    return ErrorInfo::invalid(ErrorCode::PARAMETER_RANGE, "Invalid " + what, report.errors);
}

ErrorInfo finish(const AudioData& input,
    const std::vector<float>& samples,
    int sample_rate,
    const std::string& step,
    AudioData& out) {
    AudioData result;
    auto err = audio::encodeSamples(samples, sample_rate, input.format, result);
    if (!err.isOk()) {
        return err;
    }
    result.processing_history = input.processing_history;
    result.processing_history.push_back(step);
    out = std::move(result);
    return ErrorInfo::ok();
}

}  // namespace

// =============================================================================
// VoiceTransform
// =============================================================================

ValidationReport VoiceTransform::validate() const {
    ValidationReport report;

    if (!std::isfinite(pitch_shift) || std::abs(pitch_shift) > 24.0f) {
        report.add("pitch_shift: must be between -24.0 and +24.0 semitones (got " + fmt(pitch_shift) + ")");
    }
    if (!inRange(formant_shift, 0.5f, 2.0f)) {
        report.add("formant_shift: must be between 0.5 and 2.0 (got " + fmt(formant_shift) + ")");
    }
    if (!inRange(timbre_morph, -1.0f, 1.0f)) {
        report.add("timbre_morph: must be between -1.0 and +1.0 (got " + fmt(timbre_morph) + ")");
    }
    if (!inRange(breathiness, 0.0f, 1.0f)) {
        report.add("breathiness: must be between 0.0 and 1.0 (got " + fmt(breathiness) + ")");
    }
    if (!inRange(roughness, 0.0f, 1.0f)) {
        report.add("roughness: must be between 0.0 and 1.0 (got " + fmt(roughness) + ")");
    }

    return report;
}

bool VoiceTransform::fromPreset(const std::string& name, VoiceTransform& out) {
    if (name == "male_to_female") {
        out = MaleToFemale();
    } else if (name == "female_to_male") {
        out = FemaleToMale();
    } else if (name == "robot") {
        out = Robot();
    } else {
        return false;
    }
    return true;
}

std::vector<std::string> VoiceTransform::presetNames() {
    return {"male_to_female", "female_to_male", "robot"};
}

// =============================================================================
// VoiceTransformer
// =============================================================================

ErrorInfo VoiceTransformer::transformVoice(const AudioData& input,
    const VoiceTransform& transform,
    AudioData& out) const {
    auto report = transform.validate();
    if (!report.valid) {
        return rangeError(report, "voice transform");
    }

    std::vector<float> samples;
    int sample_rate = 0;
    auto err = audio::decodeAudio(input, samples, sample_rate);
    if (!err.isOk()) {
        std::cerr << "[VoiceTransformer] " << err.message << std::endl;
        return err;
    }

    if (transform.pitch_shift != 0.0f) {
        samples = audio::pitchShift(samples, transform.pitch_shift, sample_rate);
    }
    if (transform.formant_shift != 1.0f) {
        // 共振峰上移近似为频谱整体变亮, 下移为变暗
        float tilt = std::log2(transform.formant_shift);
        samples = audio::spectralTilt(samples, tilt, sample_rate);
    }
    if (transform.timbre_morph != 0.0f) {
        samples = audio::spectralTilt(samples, transform.timbre_morph * 0.8f, sample_rate);
    }
    if (transform.breathiness > 0.0f) {
        samples = audio::addEnvelopeNoise(samples, transform.breathiness * 0.6f, kBreathSeed);
    }
    if (transform.roughness > 0.0f) {
        samples = audio::amplitudeModulate(samples, transform.roughness * 0.5f,
            kRoughnessRateHz, sample_rate);
    }

    std::string step = "voice_transform(pitch_shift=" + fmt(transform.pitch_shift) +
        ",formant_shift=" + fmt(transform.formant_shift) +
        ",timbre_morph=" + fmt(transform.timbre_morph) +
        ",breathiness=" + fmt(transform.breathiness) +
        ",roughness=" + fmt(transform.roughness) + ")";
    return finish(input, samples, sample_rate, step, out);
}

ErrorInfo VoiceTransformer::applyProsody(const AudioData& input,
    float pitch,
    float speed,
    float volume,
    AudioData& out) const {
    ValidationReport report;
    if (!std::isfinite(pitch) || std::abs(pitch) > 24.0f) {
        report.add("pitch: must be between -24.0 and +24.0 semitones (got " + fmt(pitch) + ")");
    }
    if (!(speed >= audio::kMinStretchRate && speed <= audio::kMaxStretchRate)) {
        report.add("speed: must be between 0.01 and 100.0 (got " + fmt(speed) + ")");
    }
    if (!(volume >= 0.0f) || !std::isfinite(volume)) {
        report.add("volume: must be at least 0 (got " + fmt(volume) + ")");
    }
    if (!report.valid) {
        return rangeError(report, "prosody");
    }

    if (pitch == 0.0f && speed == 1.0f && volume == 1.0f) {
        out = input;
        return ErrorInfo::ok();
    }

    std::vector<float> samples;
    int sample_rate = 0;
    auto err = audio::decodeAudio(input, samples, sample_rate);
    if (!err.isOk()) {
        std::cerr << "[VoiceTransformer] " << err.message << std::endl;
        return err;
    }

    if (pitch != 0.0f) {
        samples = audio::pitchShift(samples, pitch, sample_rate);
    }
    if (speed != 1.0f) {
        samples = audio::timeStretch(samples, speed, sample_rate);
    }
    if (volume != 1.0f) {
        samples = audio::applyGain(samples, volume);
    }

    std::string step = "prosody(pitch=" + fmt(pitch) + ",speed=" + fmt(speed) +
        ",volume=" + fmt(volume) + ")";
    return finish(input, samples, sample_rate, step, out);
}

}  // namespace voice
