// wav.hpp - WAV Decoding for the Engine Backends
#pragma once

// stl includes
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

// local includes
#include "config.hpp"


namespace whisperserve {

// sample rate the recognition models consume
constexpr int ENGINE_SAMPLE_RATE = 16000;

class WavFormatError : public std::runtime_error {
  public:
    explicit WavFormatError(const std::string &message) : std::runtime_error(message) {}
};

struct WavInfo {
    int sample_rate = 0;
    int num_channels = 0;
    int bits_per_sample = 0;
    bool is_float = false;
    std::size_t num_frames = 0;
};

// Decodes a RIFF/WAVE stream (integer PCM 8/16/24/32 bit or 32 bit float) into
// mono samples in [-1, 1], averaging channels and linearly resampling to
// `sample_rate`. Throws `WavFormatError` on unsupported or truncated input.
WavInfo read_wav_mono(std::istream &wav_stream,
                      std::vector<float> &samples,
                      const int &sample_rate = ENGINE_SAMPLE_RATE);

// Linear interpolation resampler
void resample_linear(const std::vector<float> &input, const int &input_rate,
                     std::vector<float> &output, const int &output_rate);

} // namespace whisperserve
