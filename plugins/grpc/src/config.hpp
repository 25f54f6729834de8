#pragma once

// stl includes
#include <string>

// lib includes
#include <whisperserve/config.hpp>

using namespace whisperserve;


// seconds in-flight calls get to finish once shutdown starts
constexpr int SHUTDOWN_GRACE_SEC = 10;

// permissions of the listening socket (owner read/write)
constexpr unsigned int SOCKET_MODE = 0600;

// how often a call waiting on the engine checks for client cancellation
constexpr int CANCEL_CHECK_MS = 100;

// gRPC listening address for a unix domain socket path
inline std::string unix_address(const std::string &socket_path) {
    return "unix://" + socket_path;
}
