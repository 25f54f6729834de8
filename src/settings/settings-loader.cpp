// settings-loader.cpp - Configuration File and Environment Merge Implementation

// stl includes
#include <cstdlib>
#include <string>
#include <vector>

// lib includes
#include <boost/lexical_cast.hpp>
#include <cpptoml.h>
#include <spdlog/spdlog.h>

// local includes
#include "whisperserve/settings.hpp"
#include "whisperserve/utils.hpp"


namespace whisperserve {

namespace {

std::string field_id(const FieldSpec &field) {
    return field.section + "." + field.key;
}

std::string type_name(const FieldType &type) {
    switch (type) {
        case FieldType::BOOL: return "a boolean";
        case FieldType::INT: return "an integer";
        case FieldType::FLOAT: return "a float";
        case FieldType::STRING:
        default: return "a string";
    }
}

// reads a field value from its toml section, none when the key is absent
boost::optional<field_value_t> read_file_value(const cpptoml::table &section, const FieldSpec &field) {
    if (!section.contains(field.key)) return boost::none;

    switch (field.type) {
        case FieldType::BOOL: {
            auto maybe_value = section.get_as<bool>(field.key);
            if (maybe_value) return field_value_t(*maybe_value);
            break;
        }
        case FieldType::INT: {
            auto maybe_value = section.get_as<std::int64_t>(field.key);
            if (maybe_value) return field_value_t(*maybe_value);
            break;
        }
        case FieldType::FLOAT: {
            auto maybe_value = section.get_as<double>(field.key);
            if (maybe_value) return field_value_t(*maybe_value);
            // integers are accepted where a float is expected
            auto maybe_int = section.get_as<std::int64_t>(field.key);
            if (maybe_int) return field_value_t(static_cast<double>(*maybe_int));
            break;
        }
        case FieldType::STRING: {
            auto maybe_value = section.get_as<std::string>(field.key);
            if (maybe_value) return field_value_t(*maybe_value);
            break;
        }
    }
    throw ConfigError("Invalid value for " + field_id(field) + ": expected " + type_name(field.type));
}

} // namespace


const std::vector<FieldSpec> &settings_schema() {
    static const std::vector<FieldSpec> schema = {
        {"service", "socket_path", FieldType::STRING, std::string("/tmp/whisper.sock")},
        {"service", "log_level", FieldType::STRING, std::string("info")},
        {"service", "max_audio_size_mb", FieldType::INT, std::int64_t(100)},

        {"model", "size", FieldType::STRING, std::string("large-v3")},
        {"model", "download_dir", FieldType::STRING, std::string("/var/lib/whisper/models")},
        {"model", "device", FieldType::STRING, std::string(AUTO)},
        {"model", "compute_type", FieldType::STRING, std::string(AUTO)},

        {"inference", "beam_size", FieldType::INT, std::int64_t(5)},
        {"inference", "vad_filter", FieldType::BOOL, true},
        {"inference", "vad_min_silence_ms", FieldType::INT, std::int64_t(500)},
        {"inference", "no_speech_threshold", FieldType::FLOAT, 0.6},
        {"inference", "log_prob_threshold", FieldType::FLOAT, -1.0},
        {"inference", "compression_ratio_threshold", FieldType::FLOAT, 2.4},
        {"inference", "word_timestamps", FieldType::BOOL, true},
        {"inference", "initial_prompt", FieldType::STRING, std::string("")},

        // 0 means auto for max_workers and cpu_threads
        {"concurrency", "max_workers", FieldType::INT, std::int64_t(0)},
        {"concurrency", "cpu_threads", FieldType::INT, std::int64_t(0)},
        {"concurrency", "num_workers", FieldType::INT, std::int64_t(1)},
    };
    return schema;
}

boost::optional<std::string> process_env(const std::string &name) {
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) return boost::none;
    return std::string(value);
}

std::string env_override_name(const std::string &section, const std::string &key) {
    return to_upper(std::string(WHISPERSERVE_ENV_PREFIX) + "_" + section + "_" + key);
}

field_value_t coerce_override(const FieldSpec &field, const std::string &value) {
    const std::string name = env_override_name(field.section, field.key);

    try {
        switch (field.type) {
            case FieldType::BOOL: {
                const std::string flag = to_lower(trim(value));
                if (flag == "1" || flag == "true" || flag == "yes" || flag == "on") return true;
                if (flag == "0" || flag == "false" || flag == "no" || flag == "off") return false;
                break;
            }
            case FieldType::INT:
                return boost::lexical_cast<std::int64_t>(trim(value));
            case FieldType::FLOAT:
                return boost::lexical_cast<double>(trim(value));
            case FieldType::STRING:
                return value;
        }
    } catch (const boost::bad_lexical_cast &) {
        // reported below
    }
    throw ConfigError("Invalid value '" + value + "' for " + name + ": expected " + type_name(field.type));
}

raw_settings_t merge_settings(const std::string &toml_path, const EnvLookup &env) {
    if (!exists(toml_path)) {
        throw ConfigNotFoundError("Config file not found: " + absolute_path(toml_path));
    }

    std::shared_ptr<cpptoml::table> config;
    try {
        config = cpptoml::parse_file(toml_path);
    } catch (const cpptoml::parse_exception &e) {
        throw ConfigError("Malformed config file " + toml_path + ": " + e.what());
    }

    const auto &schema = settings_schema();
    raw_settings_t raw;

    for (auto const &field : schema) {
        field_value_t value = field.default_value;

        // absent sections behave as empty ones
        if (config->contains(field.section)) {
            auto section = config->get_table(field.section);
            if (!section) {
                throw ConfigError("Invalid config section [" + field.section + "]: expected a table");
            }
            auto maybe_value = read_file_value(*section, field);
            if (maybe_value) value = *maybe_value;
        }

        auto maybe_override = env(env_override_name(field.section, field.key));
        if (maybe_override) {
            value = coerce_override(field, *maybe_override);
            spdlog::debug("[config] {}.{} overridden from environment", field.section, field.key);
        }

        raw[field_id(field)] = value;
    }

    // keys outside the schema are ignored
    for (auto const &section : *config) {
        if (!section.second->is_table()) continue;
        for (auto const &entry : *section.second->as_table()) {
            bool known = false;
            for (auto const &field : schema) {
                if (field.section == section.first && field.key == entry.first) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                spdlog::warn("[config] ignoring unknown key {}.{}", section.first, entry.first);
            }
        }
    }

    return raw;
}

} // namespace whisperserve
