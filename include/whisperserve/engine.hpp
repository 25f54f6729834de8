// engine.hpp - Inference Engine Contract
#pragma once

// stl includes
#include <chrono>
#include <memory>

// local includes
#include "config.hpp"
#include "types.hpp"
#include "audio.hpp"


namespace whisperserve {

// Lazy, pull based sequence of recognized segments for one call.
// Finite and not restartable.
class SegmentStream {

  public:
    enum class Poll { SEGMENT, PENDING, END };

    virtual ~SegmentStream() = default;

    // Waits at most `timeout` for the next segment in engine order.
    // SEGMENT fills `segment`, PENDING means nothing arrived in time and
    // END means the sequence is exhausted. May throw engine errors.
    virtual Poll poll(Segment &segment, const std::chrono::milliseconds &timeout) = 0;

    // Stops producing segments; later polls return END.
    virtual void cancel() noexcept = 0;
};


struct Transcription {
    std::unique_ptr<SegmentStream> segments;
    TranscriptionInfo info;
};


// External speech recognition engine. One handle is shared by all request
// handlers, implementations must allow concurrent `transcribe` calls.
class Engine {

  public:
    virtual ~Engine() = default;

    // Starts transcribing `audio`. The returned stream may keep reading from
    // `audio`, so the caller keeps it alive until the stream is done.
    virtual Transcription transcribe(AudioInput &audio, const TranscribeOptions &options) = 0;
};

} // namespace whisperserve
