// config.cpp - Configuration Implementation

// stl includes
#include <iostream>
#include <cstdlib>
#include <string>

// local includes
#include "whisperserve/config.hpp"
#include "whisperserve/types.hpp"


namespace whisperserve {

void print_version() {
    std::cout << WHISPERSERVE_VERSION << std::endl;
    exit(EXIT_SUCCESS);
}

std::string to_string(Device device) {
    switch (device) {
        case Device::CUDA:
            return "cuda";
        case Device::CPU:
        default:
            return "cpu";
    }
}

} // namespace whisperserve
