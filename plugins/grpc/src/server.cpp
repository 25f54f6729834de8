// server.cpp - Server Implementation

// stl includes
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

// system includes
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

// lib includes
#include <spdlog/spdlog.h>
#include <whisperserve/utils.hpp>

// local includes
#include "server.hpp"


namespace {

inline long elapsed_ms(const std::chrono::system_clock::time_point &start_time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - start_time).count();
}

} // namespace


WorkerPool::WorkerPool(const std::size_t &n_slots) : n_slots_(n_slots) {
    if (n_slots_ == 0) {
        throw std::invalid_argument("worker pool needs at least one slot");
    }
    for (std::size_t i = 0; i < n_slots_; i++) {
        slots_.release(i);
    }
}


boost::optional<AudioSource> audio_source_of(const speech::TranscribeRequest &request) {
    switch (request.audio_source_case()) {
        case speech::TranscribeRequest::kPath:
            return AudioSource(LocalReference{request.path()});
        case speech::TranscribeRequest::kData:
            // viewed in place, the request outlives the call
            return AudioSource(InlinePayload{request.data()});
        case speech::TranscribeRequest::kUri:
            return AudioSource(RemoteLocator{request.uri()});
        case speech::TranscribeRequest::AUDIO_SOURCE_NOT_SET:
        default:
            return boost::none;
    }
}

TranscribeOptions transcribe_options(const speech::TranscribeRequest &request, const ResolvedConfig &config) {
    const InferenceConfig &inference = config.inference;

    TranscribeOptions options;
    if (!request.language().empty()) {
        options.language = request.language();
    }
    if (!request.options().initial_prompt().empty()) {
        options.initial_prompt = request.options().initial_prompt();
    } else if (!inference.initial_prompt.empty()) {
        options.initial_prompt = inference.initial_prompt;
    }
    options.beam_size = inference.beam_size;
    options.vad_filter = inference.vad_filter;
    options.vad_min_silence_ms = inference.vad_min_silence_ms;
    options.word_timestamps = inference.word_timestamps;
    options.no_speech_threshold = inference.no_speech_threshold;
    options.log_prob_threshold = inference.log_prob_threshold;
    options.compression_ratio_threshold = inference.compression_ratio_threshold;
    return options;
}

void segment_to_chunk(const Segment &segment, speech::TranscriptChunk *const chunk) {
    chunk->set_start_time(segment.start_time);
    chunk->set_end_time(segment.end_time);
    chunk->set_text(trim(segment.text));
    chunk->set_speaker_id("");
    chunk->set_confidence(segment.avg_logprob);

    speech::Word *word;
    for (auto const &w : segment.words) {
        word = chunk->add_words();
        word->set_start_time(w.start_time);
        word->set_end_time(w.end_time);
        word->set_text(w.word);
        word->set_confidence(w.confidence);
    }
}


WhisperServeImpl::WhisperServeImpl(const ResolvedConfig &config,
                                   std::shared_ptr<Engine> engine,
                                   std::shared_ptr<HttpFetcher> fetcher)
    : config_(config),
      engine_(std::move(engine)),
      loader_(config.service.max_audio_bytes(), std::move(fetcher)),
      worker_pool_(make_uniq<WorkerPool>(static_cast<std::size_t>(config.concurrency.max_workers))) {}

grpc::Status WhisperServeImpl::Transcribe(grpc::ServerContext *const context,
                                          const speech::TranscribeRequest *const request,
                                          grpc::ServerWriter<speech::TranscriptChunk> *const writer) {
    std::chrono::system_clock::time_point start_time = std::chrono::system_clock::now();

    // Worker Acquisition ::
    // - Waits here until one of the `max_workers` slots is free.
    // - The slot is held until the handler returns.
    WorkerSlot slot(*worker_pool_);
    spdlog::debug("worker slot {} acquired in: {}ms", slot.id(), elapsed_ms(start_time));

    if (context->IsCancelled()) {
        return grpc::Status(grpc::StatusCode::CANCELLED, "Transcription cancelled by client");
    }

    const boost::optional<AudioSource> source = audio_source_of(*request);
    if (!source) {
        spdlog::warn("Rejected transcription request without audio source");
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "No valid audio_source provided");
    }

    if (request->options().diarization()) {
        spdlog::debug("diarization requested ({} speakers), not supported, ignoring", request->options().num_speakers());
    }

    start_time = std::chrono::system_clock::now();
    AudioInput audio;
    try {
        audio = loader_.load(*source);
    } catch (const AudioSourceError &e) {
        spdlog::warn("Rejected audio source ({}): {}", source_type(*source), e.what());
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    spdlog::debug("audio ({}) loaded in: {}ms", source_type(*source), elapsed_ms(start_time));

    const TranscribeOptions options = transcribe_options(*request, config_);

    start_time = std::chrono::system_clock::now();
    Transcription transcription;
    try {
        transcription = engine_->transcribe(audio, options);
    } catch (const std::exception &e) {
        spdlog::error("Transcription failed to start: {}", e.what());
        audio.release();
        return grpc::Status(grpc::StatusCode::UNKNOWN, e.what());
    }

    spdlog::info("Transcription started: source_type={} source={} language={} language_probability={:.2f}",
                 source_type(*source), source_label(*source),
                 transcription.info.language, transcription.info.language_probability);

    // segments are written one at a time as the engine yields them, a stalled
    // engine is polled so that client cancellation is noticed in between
    const std::chrono::milliseconds poll_timeout(CANCEL_CHECK_MS);
    Segment segment;
    std::size_t n_chunks = 0;
    bool write_failed = false;
    try {
        while (!context->IsCancelled()) {
            const SegmentStream::Poll result = transcription.segments->poll(segment, poll_timeout);
            if (result == SegmentStream::Poll::PENDING) continue;
            if (result == SegmentStream::Poll::END) break;

            speech::TranscriptChunk chunk;
            segment_to_chunk(segment, &chunk);
            if (!writer->Write(chunk)) {
                write_failed = true;
                break;
            }
            n_chunks++;
        }
    } catch (const std::exception &e) {
        spdlog::error("Transcription failed after {} chunks: {}", n_chunks, e.what());
        transcription.segments.reset();
        audio.release();
        return grpc::Status(grpc::StatusCode::UNKNOWN, e.what());
    }

    if (write_failed || context->IsCancelled()) {
        spdlog::info("Transcription cancelled by client after {} chunks", n_chunks);
        transcription.segments->cancel();
        transcription.segments.reset();
        audio.release();
        return grpc::Status(grpc::StatusCode::CANCELLED, "Transcription cancelled by client");
    }

    transcription.segments.reset();
    audio.release();

    spdlog::debug("request resolved in: {}ms ({} chunks)", elapsed_ms(start_time), n_chunks);
    return grpc::Status::OK;
}


void restrict_socket(const std::string &socket_path) {
    if (::chmod(socket_path.c_str(), SOCKET_MODE) != 0) {
        throw std::runtime_error("Failed to restrict permissions of " + socket_path + ": " + std::strerror(errno));
    }
}


// Runs the Server with the Speech-To-Text Service
void run_server(const ResolvedConfig &config,
                std::shared_ptr<Engine> engine,
                std::shared_ptr<HttpFetcher> fetcher) {
    // SIGINT and SIGTERM are taken by a dedicated thread, block them
    // before gRPC spawns its own threads
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    WhisperServeImpl service(config, std::move(engine), std::move(fetcher));

    const std::string &socket_path = config.service.socket_path;
    if (::unlink(socket_path.c_str()) != 0 && errno != ENOENT) {
        throw std::runtime_error("Failed to remove stale socket " + socket_path + ": " + std::strerror(errno));
    }

    const std::string server_address = unix_address(socket_path);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        throw std::runtime_error("Failed to start gRPC server on " + server_address);
    }

    try {
        restrict_socket(socket_path);
    } catch (const std::runtime_error &) {
        server->Shutdown();
        server->Wait();
        if (::unlink(socket_path.c_str()) != 0 && errno != ENOENT) {
            spdlog::warn("Failed to remove socket {}: {}", socket_path, std::strerror(errno));
        }
        throw;
    }

    spdlog::info("whisper-serve gRPC server listening on {} (max_workers={})",
                 server_address, config.concurrency.max_workers);

    std::thread signal_thread([&server, signals]() {
        int signal_number = 0;
        sigwait(&signals, &signal_number);
        spdlog::info("Received signal {}, shutting down (grace period {}s)", signal_number, SHUTDOWN_GRACE_SEC);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(SHUTDOWN_GRACE_SEC));
    });

    server->Wait();
    signal_thread.join();

    if (::unlink(socket_path.c_str()) != 0 && errno != ENOENT) {
        spdlog::warn("Failed to remove socket {}: {}", socket_path, std::strerror(errno));
    }
    spdlog::info("whisper-serve stopped");
}
