// whisper-engine.cpp - whisper.cpp Engine Backend Implementation

// stl includes
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// lib includes
#include <ggml-backend.h>
#include <spdlog/spdlog.h>

// local includes
#include "whisperserve/whisper-engine.hpp"
#include "whisperserve/settings.hpp"
#include "whisperserve/utils.hpp"
#include "whisperserve/wav.hpp"


namespace whisperserve {

namespace {

// whisper timestamps are in units of 10ms
constexpr float CENTISECONDS = 0.01f;

// segments decoded ahead of the consumer
constexpr std::size_t SEGMENT_BUFFER = 1;

void route_whisper_log(enum ggml_log_level level, const char *text, void *) {
    std::string message(text == nullptr ? "" : text);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) message.pop_back();
    if (message.empty()) return;

    switch (level) {
        case GGML_LOG_LEVEL_ERROR:
            spdlog::error("whisper: {}", message);
            break;
        case GGML_LOG_LEVEL_WARN:
            spdlog::warn("whisper: {}", message);
            break;
        case GGML_LOG_LEVEL_INFO:
        default:
            spdlog::debug("whisper: {}", message);
            break;
    }
}

std::vector<float> decode_audio(AudioInput &audio) {
    std::vector<float> pcm;
    if (audio.is_path()) {
        std::ifstream file(audio.path(), std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open audio file " + audio.path());
        }
        read_wav_mono(file, pcm);
    } else {
        read_wav_mono(audio.stream(), pcm);
    }
    return pcm;
}

// Copies segment `index` out of a decoding state. With `word_timestamps`
// tokens are grouped into words, a token starting with a space opens a new one.
Segment extract_segment(whisper_context *ctx, whisper_state *state, const int &index, const bool &word_timestamps) {
    Segment segment;
    segment.start_time = whisper_full_get_segment_t0_from_state(state, index) * CENTISECONDS;
    segment.end_time = whisper_full_get_segment_t1_from_state(state, index) * CENTISECONDS;
    segment.text = whisper_full_get_segment_text_from_state(state, index);

    const whisper_token eot = whisper_token_eot(ctx);
    const int n_tokens = whisper_full_n_tokens_from_state(state, index);

    float logprob_sum = 0.0f;
    int n_text_tokens = 0;

    Word word;
    float word_p_sum = 0.0f;
    int word_tokens = 0;

    auto flush_word = [&]() {
        if (word_tokens > 0 && !word.word.empty()) {
            word.confidence = word_p_sum / word_tokens;
            segment.words.push_back(word);
        }
        word = Word();
        word_p_sum = 0.0f;
        word_tokens = 0;
    };

    for (int j = 0; j < n_tokens; j++) {
        const whisper_token_data data = whisper_full_get_token_data_from_state(state, index, j);
        // timestamp and control tokens
        if (data.id >= eot) continue;

        logprob_sum += data.plog;
        n_text_tokens++;

        if (!word_timestamps) continue;

        const std::string piece = whisper_full_get_token_text_from_state(ctx, state, index, j);
        const bool opens_word = !piece.empty() && piece[0] == ' ';
        if (word_tokens == 0 || opens_word) {
            flush_word();
            word.start_time = data.t0 * CENTISECONDS;
        }
        word.word += piece;
        word.end_time = std::max(word.start_time, data.t1 * CENTISECONDS);
        word_p_sum += data.p;
        word_tokens++;
    }
    if (word_timestamps) flush_word();

    segment.avg_logprob = n_text_tokens > 0 ? logprob_sum / n_text_tokens : 0.0f;
    return segment;
}


// WhisperSegmentStream ::
// Runs `whisper_full_with_state` on its own thread. New segments arrive via
// the new-segment callback into a small buffer which `poll` drains; the
// callback waits while the buffer is full so decoding keeps pace with the reader.
class WhisperSegmentStream final : public SegmentStream {

  public:
    WhisperSegmentStream(whisper_context *const context,
                         StateQueue *const state_queue,
                         whisper_state *const state,
                         std::vector<float> pcm,
                         const whisper_full_params &params,
                         const std::string &language,
                         const boost::optional<std::string> &initial_prompt,
                         const std::string &vad_model_path)
        : context_(context), state_queue_(state_queue), state_(state), pcm_(std::move(pcm)),
          params_(params), language_(language), vad_model_path_(vad_model_path),
          word_timestamps_(params.token_timestamps), cancelled_(false) {

        params_.language = language_.c_str();
        params_.detect_language = false;
        if (initial_prompt) {
            initial_prompt_ = *initial_prompt;
            params_.initial_prompt = initial_prompt_.c_str();
        }
        if (params_.vad) params_.vad_model_path = vad_model_path_.c_str();

        params_.new_segment_callback = &WhisperSegmentStream::on_new_segment;
        params_.new_segment_callback_user_data = this;
        params_.abort_callback = &WhisperSegmentStream::on_abort;
        params_.abort_callback_user_data = this;

        decode_thread_ = std::thread(&WhisperSegmentStream::run_, this);
    }

    ~WhisperSegmentStream() {
        cancel();
        if (decode_thread_.joinable()) decode_thread_.join();
        state_queue_->release(state_);
    }

    Poll poll(Segment &segment, const std::chrono::milliseconds &timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool ready = cond_.wait_for(lock, timeout, [this]() {
            return !segments_.empty() || done_ || cancelled_;
        });
        if (!ready) return Poll::PENDING;
        if (cancelled_) return Poll::END;

        if (!segments_.empty()) {
            segment = std::move(segments_.front());
            segments_.pop_front();
            lock.unlock();
            cond_.notify_all();
            return Poll::SEGMENT;
        }
        if (!error_.empty()) {
            throw std::runtime_error(error_);
        }
        return Poll::END;
    }

    void cancel() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cond_.notify_all();
    }

  private:
    static void on_new_segment(whisper_context *ctx, whisper_state *state, int n_new, void *user_data) {
        auto *self = static_cast<WhisperSegmentStream *>(user_data);
        const int n_segments = whisper_full_n_segments_from_state(state);
        for (int i = n_segments - n_new; i < n_segments; i++) {
            self->push_(extract_segment(ctx, state, i, self->word_timestamps_));
        }
    }

    static bool on_abort(void *user_data) {
        return static_cast<WhisperSegmentStream *>(user_data)->cancelled_.load();
    }

    void push_(Segment segment) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (segments_.size() >= SEGMENT_BUFFER && !cancelled_) {
            cond_.wait(lock);
        }
        if (cancelled_) return;
        segments_.push_back(std::move(segment));
        lock.unlock();
        cond_.notify_all();
    }

    void run_() {
        const int code = whisper_full_with_state(context_, state_, params_, pcm_.data(), static_cast<int>(pcm_.size()));

        std::unique_lock<std::mutex> lock(mutex_);
        if (code != 0 && !cancelled_) {
            error_ = "whisper_full failed with code " + std::to_string(code);
            spdlog::error("Transcription failed: {}", error_);
        }
        done_ = true;
        lock.unlock();
        cond_.notify_all();
    }

    whisper_context *context_;
    StateQueue *state_queue_;
    whisper_state *state_;
    std::vector<float> pcm_;

    whisper_full_params params_;
    std::string language_;
    std::string initial_prompt_;
    std::string vad_model_path_;
    bool word_timestamps_;

    std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Segment> segments_;
    std::atomic<bool> cancelled_;
    bool done_ = false;
    std::string error_;

    std::thread decode_thread_;
};

} // namespace


std::string resolve_model_path(const ModelConfig &model) {
    if (exists(model.size)) {
        return model.size;
    }

    const std::string base = join_path(model.download_dir, "ggml-" + model.size);
    const bool int8 = model.compute_type.compare(0, 4, "int8") == 0;
    if (int8 && exists(base + "-q8_0.bin")) {
        return base + "-q8_0.bin";
    }
    return base + ".bin";
}

bool whisper_accelerator_available() {
    for (std::size_t i = 0; i < ggml_backend_dev_count(); i++) {
        if (ggml_backend_dev_type(ggml_backend_dev_get(i)) == GGML_BACKEND_DEVICE_TYPE_GPU) {
            return true;
        }
    }
    return false;
}


WhisperEngine::WhisperEngine(const ResolvedConfig &config) : config_(config), context_(nullptr) {
    whisper_log_set(route_whisper_log, nullptr);

    const std::string model_path = resolve_model_path(config_.model);
    if (!exists(model_path)) {
        throw std::runtime_error("Model file not found: " + absolute_path(model_path));
    }

    if (config_.inference.vad_filter) {
        const std::string vad_path = join_path(config_.model.download_dir, VAD_MODEL_FILE);
        if (exists(vad_path)) {
            vad_model_path_ = vad_path;
        } else {
            spdlog::warn("VAD model not found at {}, transcribing without voice activity filtering",
                         absolute_path(vad_path));
        }
    }

    spdlog::info("Loading model from {} on {}", model_path, to_string(config_.model.device));

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.model.device == Device::CUDA;

    context_ = whisper_init_from_file_with_params_no_state(model_path.c_str(), cparams);
    if (context_ == nullptr) {
        throw std::runtime_error("Failed to load model " + model_path);
    }

    try {
        state_queue_ = make_uniq<StateQueue>(context_, static_cast<std::size_t>(config_.concurrency.num_workers));
    } catch (const std::exception &) {
        whisper_free(context_);
        throw;
    }
}

WhisperEngine::~WhisperEngine() {
    state_queue_.reset();
    if (context_ != nullptr) whisper_free(context_);
}

Transcription WhisperEngine::transcribe(AudioInput &audio, const TranscribeOptions &options) {
    std::vector<float> pcm = decode_audio(audio);
    const int n_threads = config_.concurrency.cpu_threads;

    if (options.language && whisper_lang_id(options.language->c_str()) < 0) {
        throw std::runtime_error("Unsupported language: " + *options.language);
    }

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    params.n_threads = n_threads;
    params.beam_search.beam_size = options.beam_size;
    params.no_speech_thold = options.no_speech_threshold;
    params.logprob_thold = options.log_prob_threshold;
    params.entropy_thold = options.compression_ratio_threshold;
    params.token_timestamps = options.word_timestamps;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_special = false;
    params.print_timestamps = false;

    params.vad = options.vad_filter && !vad_model_path_.empty();
    if (params.vad) {
        params.vad_params = whisper_vad_default_params();
        params.vad_params.min_silence_duration_ms = options.vad_min_silence_ms;
    }

    whisper_state *state = state_queue_->acquire();

    Transcription transcription;
    try {
        TranscriptionInfo &info = transcription.info;
        if (options.language) {
            info.language = *options.language;
            info.language_probability = 1.0f;
        } else if (!whisper_is_multilingual(context_)) {
            info.language = "en";
            info.language_probability = 1.0f;
        } else {
            if (whisper_pcm_to_mel_with_state(context_, state, pcm.data(), static_cast<int>(pcm.size()), n_threads) != 0) {
                throw std::runtime_error("Failed to compute log mel spectrogram");
            }
            std::vector<float> probs(whisper_lang_max_id() + 1, 0.0f);
            const int lang_id = whisper_lang_auto_detect_with_state(context_, state, 0, n_threads, probs.data());
            if (lang_id < 0) {
                throw std::runtime_error("Failed to detect language");
            }
            info.language = whisper_lang_str(lang_id);
            info.language_probability = probs[lang_id];
        }

        // the stream owns `state` from here and hands it back on destruction
        transcription.segments = make_uniq<WhisperSegmentStream>(context_, state_queue_.get(), state, std::move(pcm),
                                                                 params, info.language,
                                                                 options.initial_prompt, vad_model_path_);
    } catch (const std::exception &) {
        state_queue_->release(state);
        throw;
    }

    return transcription;
}

} // namespace whisperserve
