// Configuration options.
#pragma once

// stl includes
#include <string>
#include <memory>
#include <utility>

// definitions
#define WHISPERSERVE_VERSION "0.1.0"
#define WHISPERSERVE_ENV_PREFIX "WHISPER"


namespace whisperserve {

template<typename T, typename... Args>
std::unique_ptr<T> make_uniq(Args&&... args) {
    return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

// prints library version
void print_version();

} // namespace whisperserve
