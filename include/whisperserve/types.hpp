// Configuration and transcript types.
#pragma once

// stl includes
#include <cstddef>
#include <string>
#include <vector>

// lib includes
#include <boost/optional.hpp>

#include "config.hpp"


namespace whisperserve {

// compute device the engine runs on
enum class Device {
    CPU,
    CUDA
};

std::string to_string(Device device);

// Service (transport facing) settings.
struct ServiceConfig {
    std::string socket_path;
    std::string log_level;
    int max_audio_size_mb;

    // maximum accepted audio payload in bytes
    std::size_t max_audio_bytes() const {
        return static_cast<std::size_t>(max_audio_size_mb) * 1024 * 1024;
    }
};

// Model selection, with device and compute type already resolved.
struct ModelConfig {
    std::string size;
    std::string download_dir;
    Device device;
    std::string compute_type;
};

// Decoding parameters handed to the engine on every call.
struct InferenceConfig {
    int beam_size;
    bool vad_filter;
    int vad_min_silence_ms;
    float no_speech_threshold;
    float log_prob_threshold;
    float compression_ratio_threshold;
    bool word_timestamps;
    std::string initial_prompt;
};

struct ConcurrencyConfig {
    int max_workers;
    int cpu_threads;
    int num_workers;
};

// Fully resolved runtime configuration. Built once at startup,
// never mutated afterwards and shared read-only by all handlers.
struct ResolvedConfig {
    ServiceConfig service;
    ModelConfig model;
    InferenceConfig inference;
    ConcurrencyConfig concurrency;
};

struct Word {
    float start_time, end_time, confidence;
    std::string word;
};

// One contiguous span of recognized speech as produced by the engine.
struct Segment {
    float start_time, end_time;
    std::string text;
    // engine's average log probability, not a calibrated probability
    float avg_logprob;
    std::vector<Word> words;
};

// One-shot metadata returned alongside the segment sequence.
struct TranscriptionInfo {
    std::string language;
    float language_probability = 0.0;
};

// Per call engine options
struct TranscribeOptions {
    boost::optional<std::string> language;
    boost::optional<std::string> initial_prompt;
    int beam_size = 5;
    bool vad_filter = true;
    int vad_min_silence_ms = 500;
    bool word_timestamps = true;
    float no_speech_threshold = 0.6;
    float log_prob_threshold = -1.0;
    float compression_ratio_threshold = 2.4;
};

} // namespace whisperserve
