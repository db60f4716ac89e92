#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace call_bridge::audio {

// G.711 mu-law. Input and output bytes are carried in std::string.
std::vector<int16_t> decode_mulaw(const std::string& bytes);
std::string encode_mulaw(const std::vector<int16_t>& samples);
int16_t mulaw_to_linear(uint8_t value);
uint8_t linear_to_mulaw(int16_t sample);

// Catmull-Rom interpolation; downsampling is low-passed first.
std::vector<int16_t> resample(const std::vector<int16_t>& samples, int from_rate, int to_rate);

// Brings the peak to ~85% of full scale, at most doubling the level.
std::vector<int16_t> normalize(const std::vector<int16_t>& samples);

double rms_energy(const std::vector<int16_t>& samples);
int16_t peak_amplitude(const std::vector<int16_t>& samples);

// Little-endian PCM16. A trailing odd byte is dropped.
std::vector<int16_t> pcm_from_bytes(const std::string& bytes);
std::string pcm_to_bytes(const std::vector<int16_t>& samples);

}
