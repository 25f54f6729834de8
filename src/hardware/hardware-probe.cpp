// hardware-probe.cpp - Host Hardware Probe Implementation

// stl includes
#include <fstream>
#include <iterator>
#include <exception>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

// system includes
#include <sys/utsname.h>
#if defined(__APPLE__)
#include <sys/sysctl.h>
#endif

// lib includes
#include <boost/lexical_cast.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

// local includes
#include "whisperserve/hardware.hpp"
#include "whisperserve/utils.hpp"


namespace whisperserve {

namespace bp = boost::process;

namespace {

int physical_cores() {
#if defined(__APPLE__)
    int cores = 0;
    std::size_t size = sizeof(cores);
    if (sysctlbyname("hw.physicalcpu", &cores, &size, nullptr, 0) != 0) return 0;
    return cores;
#else
    std::ifstream cpuinfo("/proc/cpuinfo");
    if (!cpuinfo) return 0;
    std::string dump((std::istreambuf_iterator<char>(cpuinfo)), std::istreambuf_iterator<char>());
    return count_physical_cores(dump);
#endif
}

int logical_cores() {
    return static_cast<int>(std::thread::hardware_concurrency());
}

} // namespace


std::string normalize_architecture(const std::string &machine) {
    const std::string arch = to_lower(machine);
    if (arch.compare(0, 3, "arm") == 0 || arch.compare(0, 7, "aarch64") == 0) {
        return ARCH_ARM64;
    }
    return ARCH_X86_64;
}

int count_physical_cores(const std::string &cpuinfo) {
    std::set<std::pair<std::string, std::string>> cores;
    std::istringstream lines(cpuinfo);
    std::string line, physical_id, core_id;

    while (std::getline(lines, line)) {
        const std::size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        const std::string key = trim(line.substr(0, colon));
        const std::string value = trim(line.substr(colon + 1));

        if (key == "physical id") {
            physical_id = value;
        } else if (key == "core id") {
            core_id = value;
            cores.insert(std::make_pair(physical_id, core_id));
        }
    }
    return static_cast<int>(cores.size());
}

boost::optional<long> parse_memory_mb(const std::string &output) {
    std::istringstream lines(output);
    std::string first;
    if (!std::getline(lines, first)) return boost::none;

    try {
        const long memory_mb = boost::lexical_cast<long>(trim(first));
        if (memory_mb <= 0) return boost::none;
        return memory_mb;
    } catch (const boost::bad_lexical_cast &) {
        return boost::none;
    }
}


int first_positive_count(const std::vector<CoreCountSource> &sources, const int &fallback) {
    for (auto const &source : sources) {
        const int cores = source();
        if (cores > 0) return cores;
    }
    return fallback;
}


SystemProbe::SystemProbe(AcceleratorQuery accelerator_query)
    : accelerator_query_(std::move(accelerator_query)) {}

std::string SystemProbe::architecture() const {
    struct utsname info;
    if (uname(&info) != 0) return ARCH_X86_64;
    return normalize_architecture(info.machine);
}

std::string SystemProbe::operating_system() const {
    struct utsname info;
    if (uname(&info) != 0) return "unknown";
    return to_lower(info.sysname);
}

bool SystemProbe::accelerator_available() const {
    if (!accelerator_query_) return false;
    try {
        return accelerator_query_();
    } catch (const std::exception &e) {
        spdlog::debug("accelerator query failed: {}", e.what());
        return false;
    }
}

int SystemProbe::physical_core_count() const {
    return first_positive_count({physical_cores, logical_cores}, DEFAULT_CORE_COUNT);
}

boost::optional<long> SystemProbe::accelerator_memory_mb() const {
    try {
        const boost::filesystem::path smi = bp::search_path("nvidia-smi");
        if (smi.empty()) return boost::none;

        bp::ipstream out;
        bp::child query(smi, "--query-gpu=memory.total", "--format=csv,noheader,nounits",
                        bp::std_out > out, bp::std_err > bp::null);

        std::string output, line;
        while (std::getline(out, line)) {
            output += line + '\n';
        }
        query.wait();

        if (query.exit_code() != 0) return boost::none;
        return parse_memory_mb(output);
    } catch (const std::exception &e) {
        spdlog::debug("accelerator memory query failed: {}", e.what());
        return boost::none;
    }
}

} // namespace whisperserve
