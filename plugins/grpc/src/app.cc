// app.cc - gRPC Application Entry

// stl includes
#include <exception>
#include <memory>
#include <string>

// lib includes
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <whisperserve/audio.hpp>
#include <whisperserve/hardware.hpp>
#include <whisperserve/settings.hpp>
#include <whisperserve/whisper-engine.hpp>

// local includes
#include "config.hpp"
#include "server.hpp"

using namespace whisperserve;


int main(int argc, char *argv[]) {
    CLI::App app{"Whisper speech-to-text gRPC server"};

    std::string config_toml = "config.toml";
    app.add_option("-c,--config", config_toml, "Path to the service configuration toml (default: config.toml)");

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Flag to enable debug mode");

    app.add_flag_callback("-v,--version", print_version, "Show program version and exit");

    CLI11_PARSE(app, argc, argv);

    try {
        SystemProbe probe(whisper_accelerator_available);
        const ResolvedConfig config = load_config(config_toml, probe);

        spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::from_str(config.service.log_level));

        auto engine = std::make_shared<WhisperEngine>(config);
        auto fetcher = std::make_shared<CurlFetcher>();

        run_server(config, engine, fetcher);
    } catch (const ConfigError &e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("Failed to start whisper-serve: {}", e.what());
        return 1;
    }

    return 0;
}
