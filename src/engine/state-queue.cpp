// state-queue.cpp - Decoding State Queue Implementation

// stl includes
#include <stdexcept>

// lib includes
#include <spdlog/spdlog.h>

// local includes
#include "whisperserve/whisper-engine.hpp"


namespace whisperserve {

StateQueue::StateQueue(whisper_context *const context, const std::size_t &n_states) {
    spdlog::info("Allocating {} decoding states", n_states);

    for (std::size_t i = 0; i < n_states; i++) {
        whisper_state *state = whisper_init_state(context);
        if (state == nullptr) {
            free_all_();
            throw std::runtime_error("Failed to allocate whisper decoding state");
        }
        states_.release(state);
    }
}

StateQueue::~StateQueue() {
    free_all_();
}

void StateQueue::free_all_() {
    for (auto state : states_.drain()) {
        whisper_free_state(state);
    }
}

} // namespace whisperserve
