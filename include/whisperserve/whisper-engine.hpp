// whisper-engine.hpp - whisper.cpp Engine Backend
#pragma once

// stl includes
#include <memory>
#include <string>

// whisper includes
#include <whisper.h>

// local includes
#include "config.hpp"
#include "types.hpp"
#include "blocking-queue.hpp"
#include "engine.hpp"


namespace whisperserve {

// silero vad weights expected beside the whisper models
constexpr const char *VAD_MODEL_FILE = "ggml-silero-v5.1.2.bin";

// Resolves the model file for a configured size and compute type.
// `size` may be a path to a model file, otherwise `<download_dir>/ggml-<size>.bin`
// (the `-q8_0` quantized file for int8 compute types, when present).
std::string resolve_model_path(const ModelConfig &model);

// Accelerator capability query for the hardware probe (ggml device registry).
bool whisper_accelerator_available();


// StateQueue ::
// Thread-safe queue of decoding states sharing one model context.
// `acquire` blocks until a state is free.
class StateQueue final {

  public:
    StateQueue(whisper_context *const context, const std::size_t &n_states);

    StateQueue(const StateQueue &) = delete; // disable copying

    StateQueue &operator=(const StateQueue &) = delete; // disable assignment

    ~StateQueue();

    inline whisper_state *acquire() {
        return states_.acquire();
    }

    inline void release(whisper_state *const state) {
        states_.release(state);
    }

  private:
    void free_all_();

    BlockingQueue<whisper_state *> states_;
};


// WhisperEngine ::
// `Engine` over a whisper.cpp model. Every call borrows a decoding state from
// the queue for as long as its segment stream lives.
class WhisperEngine final : public Engine {

  public:
    explicit WhisperEngine(const ResolvedConfig &config);

    WhisperEngine(const WhisperEngine &) = delete;

    WhisperEngine &operator=(const WhisperEngine &) = delete;

    ~WhisperEngine();

    Transcription transcribe(AudioInput &audio, const TranscribeOptions &options) override;

  private:
    ResolvedConfig config_;

    std::string vad_model_path_;

    whisper_context *context_;

    std::unique_ptr<StateQueue> state_queue_;
};

} // namespace whisperserve
