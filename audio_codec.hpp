//
//  audio_codec.hpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#ifndef _AUDIO_CODEC_HPP_
#define _AUDIO_CODEC_HPP_

#include <cstdint>
#include <string>
#include <vector>

struct PcmBuffer {
  std::vector<int16_t> samples;
  uint32_t sample_rate{0};
};

/* all decoders throw std::runtime_error on malformed input */
std::vector<uint8_t> base64_decode(const std::string &in);
std::string base64_encode(const std::vector<uint8_t> &in);

/* RIFF/WAVE with integer or float pcm, down-mixed to mono */
PcmBuffer decode_wav(const std::vector<uint8_t> &blob);
std::vector<uint8_t> encode_wav(const std::vector<int16_t> &samples,
                                uint32_t sample_rate);

std::vector<int16_t> resample_linear(const std::vector<int16_t> &in,
                                     uint32_t rate_in, uint32_t rate_out);
std::vector<float> pcm_to_float(const std::vector<int16_t> &in);

#endif
