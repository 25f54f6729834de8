// test-utils.hpp - Shared Test Fixtures
#pragma once

// stl includes
#include <fstream>
#include <map>
#include <string>

// lib includes
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <whisperserve/hardware.hpp>
#include <whisperserve/settings.hpp>


namespace whisperserve {
namespace test {

// Hardware probe answering from fixed values.
class FakeProbe final : public HardwareProbe {

  public:
    std::string arch = ARCH_X86_64;
    std::string os = "linux";
    bool accelerator = false;
    int cores = 8;
    boost::optional<long> memory_mb;

    std::string architecture() const override { return arch; }

    std::string operating_system() const override { return os; }

    bool accelerator_available() const override { return accelerator; }

    int physical_core_count() const override { return cores; }

    boost::optional<long> accelerator_memory_mb() const override { return memory_mb; }
};

// Writes `contents` to a fresh file under the temp directory, removed on destruction.
class TempFile final {

  public:
    explicit TempFile(const std::string &contents, const std::string &suffix = ".toml") {
        path_ = (boost::filesystem::temp_directory_path() /
                 boost::filesystem::unique_path("whisperserve-%%%%-%%%%-%%%%" + suffix)).string();
        std::ofstream file(path_, std::ios::binary);
        file << contents;
    }

    TempFile(const TempFile &) = delete;

    TempFile &operator=(const TempFile &) = delete;

    ~TempFile() {
        boost::system::error_code ec;
        boost::filesystem::remove(path_, ec);
    }

    inline const std::string &path() const noexcept {
        return path_;
    }

  private:
    std::string path_;
};

// Environment lookup over a fixed map.
inline EnvLookup map_env(const std::map<std::string, std::string> &vars) {
    return [vars](const std::string &name) -> boost::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return boost::none;
        return it->second;
    };
}

inline EnvLookup empty_env() {
    return map_env({});
}

} // namespace test
} // namespace whisperserve
