#include "call_bridge/audio/g711.hpp"

#include <cmath>

namespace call_bridge {
namespace audio {

namespace {

constexpr int kBias = 0x84;
constexpr int kClip = 32635;

}

int16_t decode_ulaw(uint8_t value) {
    value = static_cast<uint8_t>(~value);
    const int sign = value & 0x80;
    const int exponent = (value >> 4) & 0x07;
    const int mantissa = value & 0x0F;
    const int magnitude = (((mantissa << 3) + kBias) << exponent) - kBias;
    return static_cast<int16_t>(sign ? -magnitude : magnitude);
}

uint8_t encode_ulaw(int16_t sample) {
    int pcm = sample;
    const int sign = pcm < 0 ? 0x80 : 0x00;
    if (sign) {
        pcm = -pcm;
    }
    if (pcm > kClip) {
        pcm = kClip;
    }
    pcm += kBias;

    int exponent = 7;
    for (int mask = 0x4000; (pcm & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (pcm >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

std::vector<int16_t> decode_ulaw_frame(const std::string& payload) {
    std::vector<int16_t> samples;
    samples.reserve(payload.size());
    for (unsigned char byte : payload) {
        samples.push_back(decode_ulaw(byte));
    }
    return samples;
}

std::string encode_ulaw_frame(const std::vector<int16_t>& samples) {
    std::string payload;
    payload.reserve(samples.size());
    for (auto sample : samples) {
        payload.push_back(static_cast<char>(encode_ulaw(sample)));
    }
    return payload;
}

double frame_energy(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (auto sample : samples) {
        const double normalized = static_cast<double>(sample) / 32768.0;
        sum += normalized * normalized;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

}
}
