#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace call_bridge {
namespace audio {

// G.711 mu-law, the encoding carriers use on media-stream sockets.
int16_t decode_ulaw(uint8_t value);
uint8_t encode_ulaw(int16_t sample);

std::vector<int16_t> decode_ulaw_frame(const std::string& payload);
std::string encode_ulaw_frame(const std::vector<int16_t>& samples);

// RMS of the frame normalized to [0, 1]. Empty frames have zero energy.
double frame_energy(const std::vector<int16_t>& samples);

}
}
