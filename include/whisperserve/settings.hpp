// settings.hpp - Configuration Resolver Interface
#pragma once

// stl includes
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// lib includes
#include <boost/optional.hpp>
#include <boost/variant.hpp>

// local includes
#include "config.hpp"
#include "types.hpp"
#include "hardware.hpp"


namespace whisperserve {

// sentinel meaning "resolve from hardware"
constexpr const char *AUTO = "auto";

// compute types chosen by auto resolution
constexpr const char *COMPUTE_FLOAT16 = "float16";
constexpr const char *COMPUTE_INT8_FLOAT16 = "int8_float16";
constexpr const char *COMPUTE_INT8 = "int8";

// accelerator memory needed for full float16 weights
constexpr long FLOAT16_MIN_MEMORY_MB = 8000;


// Fatal configuration problem (malformed file, bad override, invalid value).
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

// The configuration file does not exist.
class ConfigNotFoundError : public ConfigError {
  public:
    explicit ConfigNotFoundError(const std::string &message) : ConfigError(message) {}
};


// Looks up an environment variable, none when unset.
using EnvLookup = std::function<boost::optional<std::string>(const std::string &)>;

// `EnvLookup` reading the process environment
boost::optional<std::string> process_env(const std::string &name);


enum class FieldType {
    BOOL,
    INT,
    FLOAT,
    STRING
};

using field_value_t = boost::variant<bool, std::int64_t, double, std::string>;

// One configuration field: where it lives, its type and its hardcoded default.
struct FieldSpec {
    std::string section;
    std::string key;
    FieldType type;
    field_value_t default_value;
};

// fields merged from defaults, file and environment keyed by "section.key"
using raw_settings_t = std::map<std::string, field_value_t>;

// The fixed schema of every configuration field.
const std::vector<FieldSpec> &settings_schema();

// Name of the environment variable overriding a field,
// `WHISPER_<SECTION>_<KEY>` upper-cased.
std::string env_override_name(const std::string &section, const std::string &key);

// Coerces an override string to the field type, throws `ConfigError` on failure.
field_value_t coerce_override(const FieldSpec &field, const std::string &value);

// Parses the toml file and applies default < file < environment precedence
// for every schema field. Throws `ConfigNotFoundError` / `ConfigError`.
raw_settings_t merge_settings(const std::string &toml_path, const EnvLookup &env);


// DEVICE AND CONCURRENCY RESOLUTION

Device resolve_device(const std::string &requested, const HardwareProbe &probe);

std::string resolve_compute_type(const std::string &requested, const Device &device,
                                 const HardwareProbe &probe);

int resolve_cpu_threads(const int &requested, const HardwareProbe &probe);

int resolve_max_workers(const int &requested, const Device &device);


// Loads the toml config at `toml_path`, applies environment overrides and
// resolves every "auto" field against the probed hardware.
ResolvedConfig load_config(const std::string &toml_path,
                           const HardwareProbe &probe,
                           const EnvLookup &env = process_env);

// Logs a human-readable summary of the resolved values
void log_summary(const ResolvedConfig &config, const HardwareProbe &probe);

} // namespace whisperserve
