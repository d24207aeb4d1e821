#pragma once

#include <string>
#include <vector>
#include "transcription_client.hpp"

// Forward declare whisper types
struct whisper_context;
struct whisper_state;

namespace voxpipe {

// Quality modes for accuracy/speed tradeoff
enum class ModelQuality {
    Fast,       // tiny
    Balanced,   // base
    Accurate,   // small
    Best        // medium
};

// Transcription parameter profiles
struct TranscriptionProfile {
    int best_of;
    int beam_size;
    float entropy_thold;
    float no_speech_thold;
    float temperature;
    const char* name;
};

// best_of: number of candidates, beam_size: beam search width
// entropy_thold: skip if entropy > threshold, no_speech_thold: skip if no_speech prob > threshold
inline const TranscriptionProfile PROFILE_FAST = {1, 1, 2.4f, 0.6f, 0.0f, "Fast"};
inline const TranscriptionProfile PROFILE_BALANCED = {5, 5, 2.8f, 0.5f, 0.0f, "Balanced"};
inline const TranscriptionProfile PROFILE_ACCURATE = {5, 8, 3.0f, 0.4f, 0.0f, "Accurate"};
inline const TranscriptionProfile PROFILE_BEST = {5, 10, 3.0f, 0.35f, 0.0f, "Best"};

inline const TranscriptionProfile& get_profile(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return PROFILE_FAST;
        case ModelQuality::Balanced: return PROFILE_BALANCED;
        case ModelQuality::Accurate: return PROFILE_ACCURATE;
        case ModelQuality::Best: return PROFILE_BEST;
        default: return PROFILE_BALANCED;
    }
}

// Multilingual models: the dispatcher's language hint is not English-only
inline std::string get_model_filename(ModelQuality quality) {
    switch (quality) {
        case ModelQuality::Fast: return "ggml-tiny.bin";
        case ModelQuality::Balanced: return "ggml-base.bin";
        case ModelQuality::Accurate: return "ggml-small.bin";
        case ModelQuality::Best: return "ggml-medium.bin";
        default: return "ggml-base.bin";
    }
}

// whisper.cpp behind the TranscriptionClient capability.
// One model is shared; every call gets its own whisper_state so calls may
// run concurrently.
class Transcriber : public TranscriptionClient {
public:
    Transcriber();
    ~Transcriber() override;

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    // Initialize with model path
    bool initialize(const std::string& model_path, int n_threads = 4, bool use_gpu = false);
    void shutdown();
    bool is_initialized() const { return ctx_ != nullptr; }

    TranscriptionResult transcribe(const EncodedAudio& audio,
                                   const std::string& language_hint) override;

    // Transcribe audio samples (16kHz mono float)
    TranscriptionResult transcribe_samples(const std::vector<float>& audio,
                                           const std::string& language);

    // Settings
    void set_profile(const TranscriptionProfile& profile) { profile_ = profile; }
    void set_initial_prompt(const std::string& prompt) { initial_prompt_ = prompt; }

    // Decode an encoded payload into what whisper expects
    static bool to_whisper_input(const EncodedAudio& audio, std::vector<float>& out, std::string& error);

private:
    whisper_context* ctx_ = nullptr;
    int n_threads_ = 4;
    TranscriptionProfile profile_ = PROFILE_BALANCED;
    std::string initial_prompt_;

    // Calculate confidence from token probabilities
    static float calculate_confidence(whisper_state* state);
};

} // namespace voxpipe
