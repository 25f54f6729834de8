// settings-resolve.cpp - Hardware Dependent Configuration Resolution

// stl includes
#include <algorithm>
#include <limits>
#include <string>

// lib includes
#include <spdlog/spdlog.h>

// local includes
#include "whisperserve/settings.hpp"
#include "whisperserve/utils.hpp"


namespace whisperserve {

namespace {

template<typename T>
const T &field(const raw_settings_t &raw, const std::string &id) {
    return boost::get<T>(raw.at(id));
}

int int_field(const raw_settings_t &raw, const std::string &id) {
    const std::int64_t value = field<std::int64_t>(raw, id);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError("Invalid value for " + id + ": out of range");
    }
    return static_cast<int>(value);
}

void require(const bool &condition, const std::string &message) {
    if (!condition) throw ConfigError(message);
}

bool is_auto(const std::string &value) {
    return value == AUTO;
}

} // namespace


Device resolve_device(const std::string &requested, const HardwareProbe &probe) {
    if (!is_auto(requested)) {
        if (requested == "cpu") return Device::CPU;
        if (requested == "cuda") return Device::CUDA;
        throw ConfigError("Unsupported device '" + requested + "' (expected auto, cpu or cuda)");
    }

    if (probe.accelerator_available()) {
        return Device::CUDA;
    }

    // Apple Silicon has no accelerated backend path yet, cpu + int8 is still the right call
    if (probe.operating_system() == "darwin" && probe.architecture() == ARCH_ARM64) {
        spdlog::info("[config] Apple Silicon detected, using cpu (no accelerated backend available)");
    }

    return Device::CPU;
}

std::string resolve_compute_type(const std::string &requested, const Device &device,
                                 const HardwareProbe &probe) {
    if (!is_auto(requested)) {
        return requested;
    }

    if (device == Device::CUDA) {
        auto maybe_memory_mb = probe.accelerator_memory_mb();
        // assume enough memory when it cannot be queried
        if (!maybe_memory_mb) return COMPUTE_FLOAT16;

        if (*maybe_memory_mb >= FLOAT16_MIN_MEMORY_MB) {
            return COMPUTE_FLOAT16;
        }
        spdlog::info("[config] VRAM={}MB (<8GB), using {} to save memory", *maybe_memory_mb, COMPUTE_INT8_FLOAT16);
        return COMPUTE_INT8_FLOAT16;
    }

    // int8 is well optimized on both x86 (AVX2/AVX512) and ARM (NEON)
    return COMPUTE_INT8;
}

int resolve_cpu_threads(const int &requested, const HardwareProbe &probe) {
    if (requested != 0) {
        return requested;
    }
    const int cores = probe.physical_core_count();
    const int resolved = std::max(1, cores / 2);
    spdlog::info("[config] Detected {} physical cores, using {} cpu_threads", cores, resolved);
    return resolved;
}

int resolve_max_workers(const int &requested, const Device &device) {
    if (requested != 0) {
        return requested;
    }
    // the accelerator serializes requests anyway
    return device == Device::CUDA ? 1 : 2;
}


ResolvedConfig load_config(const std::string &toml_path,
                           const HardwareProbe &probe,
                           const EnvLookup &env) {
    const raw_settings_t raw = merge_settings(toml_path, env);

    ResolvedConfig config;

    config.service.socket_path = field<std::string>(raw, "service.socket_path");
    config.service.log_level = to_lower(field<std::string>(raw, "service.log_level"));
    config.service.max_audio_size_mb = int_field(raw, "service.max_audio_size_mb");

    config.inference.beam_size = int_field(raw, "inference.beam_size");
    config.inference.vad_filter = field<bool>(raw, "inference.vad_filter");
    config.inference.vad_min_silence_ms = int_field(raw, "inference.vad_min_silence_ms");
    config.inference.no_speech_threshold = static_cast<float>(field<double>(raw, "inference.no_speech_threshold"));
    config.inference.log_prob_threshold = static_cast<float>(field<double>(raw, "inference.log_prob_threshold"));
    config.inference.compression_ratio_threshold =
        static_cast<float>(field<double>(raw, "inference.compression_ratio_threshold"));
    config.inference.word_timestamps = field<bool>(raw, "inference.word_timestamps");
    config.inference.initial_prompt = field<std::string>(raw, "inference.initial_prompt");

    const int max_workers = int_field(raw, "concurrency.max_workers");
    const int cpu_threads = int_field(raw, "concurrency.cpu_threads");
    config.concurrency.num_workers = int_field(raw, "concurrency.num_workers");

    require(!config.service.socket_path.empty(), "service.socket_path must not be empty");
    require(spdlog::level::from_str(config.service.log_level) != spdlog::level::off || config.service.log_level == "off",
            "Invalid value for service.log_level: " + config.service.log_level);
    require(config.service.max_audio_size_mb > 0, "service.max_audio_size_mb must be positive");
    require(config.inference.beam_size >= 1, "inference.beam_size must be at least 1");
    require(config.inference.vad_min_silence_ms >= 0, "inference.vad_min_silence_ms must not be negative");
    require(max_workers >= 0, "concurrency.max_workers must not be negative (0 means auto)");
    require(cpu_threads >= 0, "concurrency.cpu_threads must not be negative (0 means auto)");
    require(config.concurrency.num_workers >= 1, "concurrency.num_workers must be at least 1");

    // device and compute resolution (hardware detection happens here)
    config.model.size = field<std::string>(raw, "model.size");
    config.model.download_dir = field<std::string>(raw, "model.download_dir");
    config.model.device = resolve_device(field<std::string>(raw, "model.device"), probe);
    config.model.compute_type =
        resolve_compute_type(field<std::string>(raw, "model.compute_type"), config.model.device, probe);

    config.concurrency.cpu_threads = resolve_cpu_threads(cpu_threads, probe);
    config.concurrency.max_workers = resolve_max_workers(max_workers, config.model.device);

    log_summary(config, probe);
    return config;
}

void log_summary(const ResolvedConfig &config, const HardwareProbe &probe) {
    const std::string rule(50, '-');
    spdlog::info(rule);
    spdlog::info("  OS/Arch        : {} / {}", probe.operating_system(), probe.architecture());
    spdlog::info("  Device         : {}", to_string(config.model.device));
    spdlog::info("  Compute type   : {}", config.model.compute_type);
    spdlog::info("  Model          : {}", config.model.size);
    spdlog::info("  CPU threads    : {}", config.concurrency.cpu_threads);
    spdlog::info("  Max workers    : {}", config.concurrency.max_workers);
    spdlog::info("  Socket         : {}", config.service.socket_path);
    spdlog::info("  Max audio size : {}MB", config.service.max_audio_size_mb);
    spdlog::info(rule);
}

} // namespace whisperserve
