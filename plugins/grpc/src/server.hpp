// server.hpp - Server Interface
#pragma once

// stl includes
#include <memory>
#include <string>

// lib includes
#include <boost/optional.hpp>
#include <whisperserve/audio.hpp>
#include <whisperserve/blocking-queue.hpp>
#include <whisperserve/engine.hpp>
#include <whisperserve/types.hpp>

// gRPC inludes
#include <grpc/grpc.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/server_context.h>

// local includes
#include "config.hpp"
#include "speech.grpc.pb.h"

using namespace whisperserve;


// WorkerPool ::
// Bounded set of worker slots. A call holds one slot for its whole life,
// callers beyond the pool width wait in `acquire` until a slot frees up.
class WorkerPool final {

  public:
    explicit WorkerPool(const std::size_t &n_slots);

    WorkerPool(const WorkerPool &) = delete; // disable copying

    WorkerPool &operator=(const WorkerPool &) = delete; // disable assignment

    inline std::size_t acquire() {
        return slots_.acquire();
    }

    inline void release(const std::size_t &slot) {
        slots_.release(slot);
    }

    inline std::size_t size() const noexcept {
        return n_slots_;
    }

  private:
    const std::size_t n_slots_;

    // ids of the free slots
    BlockingQueue<std::size_t> slots_;
};

// Holds a worker slot for the enclosing scope.
class WorkerSlot final {

  public:
    explicit WorkerSlot(WorkerPool &pool) : pool_(pool), slot_(pool.acquire()) {}

    WorkerSlot(const WorkerSlot &) = delete;

    WorkerSlot &operator=(const WorkerSlot &) = delete;

    ~WorkerSlot() {
        pool_.release(slot_);
    }

    inline std::size_t id() const noexcept {
        return slot_;
    }

  private:
    WorkerPool &pool_;
    const std::size_t slot_;
};


// Audio source carried by the request, none when the oneof is unset.
boost::optional<AudioSource> audio_source_of(const speech::TranscribeRequest &request);

// Engine options for a request: request language and prompt over the
// configured defaults, everything else from the configuration.
TranscribeOptions transcribe_options(const speech::TranscribeRequest &request, const ResolvedConfig &config);

// Fills an outbound chunk from an engine segment.
void segment_to_chunk(const Segment &segment, speech::TranscriptChunk *const chunk);


// WhisperServeImpl ::
// Defines the core server logic and request handlers. Every call holds a
// worker slot while its audio is loaded and its segments are streamed back.
class WhisperServeImpl final : public speech::SpeechToText::Service {

  public:
    WhisperServeImpl(const ResolvedConfig &config,
                     std::shared_ptr<Engine> engine,
                     std::shared_ptr<HttpFetcher> fetcher);

    // Server Streaming Request Handler RPC service
    // Accepts a single `TranscribeRequest` message
    // Returns a stream of `TranscriptChunk` messages, one per recognized segment
    grpc::Status Transcribe(grpc::ServerContext *const context,
                            const speech::TranscribeRequest *const request,
                            grpc::ServerWriter<speech::TranscriptChunk> *const writer) override;

  private:
    const ResolvedConfig config_;

    std::shared_ptr<Engine> engine_;

    AudioLoader loader_;

    std::unique_ptr<WorkerPool> worker_pool_;
};


// Limits the listening socket to its owner, throws when that fails.
void restrict_socket(const std::string &socket_path);

// Runs the server on the configured unix socket until SIGINT or SIGTERM.
// Throws when the socket cannot be bound or restricted.
void run_server(const ResolvedConfig &config,
                std::shared_ptr<Engine> engine,
                std::shared_ptr<HttpFetcher> fetcher);
