// hardware.hpp - Host Hardware Probe Interface
#pragma once

// stl includes
#include <functional>
#include <string>
#include <vector>

// lib includes
#include <boost/optional.hpp>

// local includes
#include "config.hpp"


namespace whisperserve {

// canonical architecture tokens
constexpr const char *ARCH_ARM64 = "arm64";
constexpr const char *ARCH_X86_64 = "x86_64";

// core count when no source answers
constexpr int DEFAULT_CORE_COUNT = 4;

// Queries the host for the facts configuration resolution depends on.
// Every query is best-effort: failures degrade to a fallback value
// (or `boost::none`), they never throw.
class HardwareProbe {

  public:
    virtual ~HardwareProbe() = default;

    // `ARCH_ARM64` for any ARM family machine, `ARCH_X86_64` otherwise
    virtual std::string architecture() const = 0;

    // lowercase OS family name ("linux", "darwin", ...)
    virtual std::string operating_system() const = 0;

    // whether the inference backend can use an accelerator
    virtual bool accelerator_available() const = 0;

    // physical cores, else logical cores, else 4
    virtual int physical_core_count() const = 0;

    // total memory of the first accelerator in MB, none when unknown
    virtual boost::optional<long> accelerator_memory_mb() const = 0;
};


// Asks the inference backend whether an accelerator device is usable.
using AcceleratorQuery = std::function<bool()>;

// Probe backed by the running host.
class SystemProbe final : public HardwareProbe {

  public:
    explicit SystemProbe(AcceleratorQuery accelerator_query = AcceleratorQuery());

    std::string architecture() const override;

    std::string operating_system() const override;

    bool accelerator_available() const override;

    int physical_core_count() const override;

    // runs `nvidia-smi --query-gpu=memory.total`
    boost::optional<long> accelerator_memory_mb() const override;

  private:
    AcceleratorQuery accelerator_query_;
};


// maps a raw machine name onto the canonical architecture tokens
std::string normalize_architecture(const std::string &machine);

// counts distinct (physical id, core id) pairs in a /proc/cpuinfo dump, 0 if none
int count_physical_cores(const std::string &cpuinfo);

// one way of counting cores, 0 or less when it has no answer
using CoreCountSource = std::function<int()>;

// first positive answer of `sources` in order, else `fallback`
int first_positive_count(const std::vector<CoreCountSource> &sources, const int &fallback);

// first line of `nvidia-smi` csv output as megabytes
boost::optional<long> parse_memory_mb(const std::string &output);

} // namespace whisperserve
