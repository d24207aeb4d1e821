#include "transcriber.hpp"
#include "audio_decoder.hpp"
#include "signal_processor.hpp"
#include "whisper.h"
#include <algorithm>
#include <iostream>
#include <chrono>

namespace voxpipe {

namespace {

constexpr int WHISPER_SAMPLE_RATE = 16000;

// whisper skips inputs shorter than one second; pad with silence past that
constexpr size_t MIN_WHISPER_SAMPLES = WHISPER_SAMPLE_RATE + WHISPER_SAMPLE_RATE / 10;

} // namespace

Transcriber::Transcriber() = default;

Transcriber::~Transcriber() {
    shutdown();
}

bool Transcriber::initialize(const std::string& model_path, int n_threads, bool use_gpu) {
    if (ctx_) return true;

    n_threads_ = n_threads;

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu;

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        std::cerr << "Failed to load whisper model: " << model_path << std::endl;
        return false;
    }

    std::cout << "Loaded whisper model: " << model_path << std::endl;
    return true;
}

void Transcriber::shutdown() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool Transcriber::to_whisper_input(const EncodedAudio& audio, std::vector<float>& out,
                                   std::string& error) {
    DecodedAudio decoded = decode_audio(audio);
    if (!decoded.status.success) {
        error = decoded.status.error;
        return false;
    }

    // Already trimmed at capture time; only the format needs to match
    SignalProcessorConfig config;
    config.trim_silence = false;
    config.target_sample_rate = WHISPER_SAMPLE_RATE;
    config.min_resample_frames = 1;
    SignalProcessor processor(config);

    ProcessResult processed = processor.process(decoded.samples.data(), decoded.samples.size(),
                                                decoded.sample_rate, decoded.channels);
    if (!processed.status.success) {
        error = processed.status.error;
        return false;
    }

    const PcmBuffer& pcm = processed.audio.samples;
    out.clear();
    out.reserve(std::max(pcm.size(), MIN_WHISPER_SAMPLES));
    for (int16_t s : pcm) {
        out.push_back(static_cast<float>(s) / 32768.0f);
    }
    if (out.size() < MIN_WHISPER_SAMPLES) {
        out.resize(MIN_WHISPER_SAMPLES, 0.0f);
    }
    return true;
}

TranscriptionResult Transcriber::transcribe(const EncodedAudio& audio,
                                            const std::string& language_hint) {
    std::vector<float> samples;
    std::string error;
    if (!to_whisper_input(audio, samples, error)) {
        TranscriptionResult result;
        result.status = Status::failure(ErrorKind::Dispatch, "Cannot decode " + audio.mime_type + ": " + error);
        return result;
    }
    return transcribe_samples(samples, language_hint);
}

TranscriptionResult Transcriber::transcribe_samples(const std::vector<float>& audio,
                                                    const std::string& language) {
    TranscriptionResult result;

    if (!ctx_) {
        result.status = Status::failure(ErrorKind::Dispatch, "Transcriber not initialized");
        return result;
    }

    if (audio.empty()) {
        result.status = Status::failure(ErrorKind::Dispatch, "No audio data");
        return result;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    // Configure whisper parameters based on profile
    whisper_full_params wparams = whisper_full_default_params(
        profile_.beam_size > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY
    );

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.single_segment   = true;   // Faster for short audio
    wparams.no_context       = initial_prompt_.empty();
    wparams.language         = language.empty() ? "auto" : language.c_str();
    wparams.n_threads        = n_threads_;

    wparams.greedy.best_of        = profile_.best_of;
    wparams.beam_search.beam_size = profile_.beam_size;
    wparams.entropy_thold         = profile_.entropy_thold;
    wparams.no_speech_thold       = profile_.no_speech_thold;
    wparams.temperature           = profile_.temperature;
    wparams.logprob_thold         = -1.0f;

    if (!initial_prompt_.empty()) {
        wparams.initial_prompt = initial_prompt_.c_str();
    }

    // Per-call decoder state; the model itself is shared
    whisper_state* state = whisper_init_state(ctx_);
    if (!state) {
        result.status = Status::failure(ErrorKind::Dispatch, "Failed to allocate whisper state");
        return result;
    }

    int ret = whisper_full_with_state(ctx_, state, wparams, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        whisper_free_state(state);
        result.status = Status::failure(ErrorKind::Dispatch, "Whisper inference failed");
        return result;
    }

    const int n_segments = whisper_full_n_segments_from_state(state);
    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text_from_state(state, i);
        if (segment_text) {
            text += segment_text;
        }
    }
    result.confidence = calculate_confidence(state);
    whisper_free_state(state);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    // Trim whitespace
    size_t start = text.find_first_not_of(" \t\n\r");
    size_t end = text.find_last_not_of(" \t\n\r");
    if (start != std::string::npos && end != std::string::npos) {
        text = text.substr(start, end - start + 1);
    } else {
        text.clear();
    }

    result.text = text;
    result.duration_ms = duration.count();
    result.status = Status::ok();

    std::cout << "Transcription [" << profile_.name << ", " << wparams.language << "] took "
              << result.duration_ms << "ms (conf: "
              << static_cast<int>(result.confidence * 100) << "%)" << std::endl;

    return result;
}

float Transcriber::calculate_confidence(whisper_state* state) {
    const int n_segments = whisper_full_n_segments_from_state(state);
    if (n_segments == 0) return 0.0f;

    float total_prob = 0.0f;
    int total_tokens = 0;

    for (int seg = 0; seg < n_segments; ++seg) {
        const int n_tokens = whisper_full_n_tokens_from_state(state, seg);
        for (int tok = 0; tok < n_tokens; ++tok) {
            whisper_token_data token_data = whisper_full_get_token_data_from_state(state, seg, tok);
            // Skip special tokens (negative IDs or very low probability)
            if (token_data.id >= 0 && token_data.p > 0.0f) {
                total_prob += token_data.p;
                total_tokens++;
            }
        }
    }

    return total_tokens > 0 ? total_prob / static_cast<float>(total_tokens) : 0.0f;
}

} // namespace voxpipe
