//
//  audio_codec.cpp
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

#include <boost/algorithm/string.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

#include "audio_codec.hpp"

namespace iterators = boost::archive::iterators;

namespace {

constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t read_u16(const uint8_t *p) { return p[0] | (p[1] << 8); }

uint32_t read_u32(const uint8_t *p) {
  return p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void write_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back(v & 0xff);
  out.push_back((v >> 8) & 0xff);
}

void write_u32(std::vector<uint8_t> &out, uint32_t v) {
  for (int i = 0; i < 4; i++)
    out.push_back((v >> (8 * i)) & 0xff);
}

void write_tag(std::vector<uint8_t> &out, const char *tag) {
  out.insert(out.end(), tag, tag + 4);
}

/* one sample of any supported layout converted to [-1, 1] */
float read_sample(const uint8_t *in, uint16_t format, uint16_t bits) {
  if (format == WAVE_FORMAT_IEEE_FLOAT) {
    float f;
    uint32_t raw = read_u32(in);
    std::memcpy(&f, &raw, sizeof(f));
    return f;
  }
  switch (bits) {
  case 8:
    return (static_cast<int>(*in) - 128) / 128.0f;
  case 16:
    return static_cast<int16_t>(read_u16(in)) / 32768.0f;
  case 24: {
    int32_t pcm = *in | (*(in + 1) << 8) | (*(in + 2) << 16);
    if (*(in + 2) & 0x80) {
      pcm |= static_cast<int32_t>(0xFF000000u);
    }
    return static_cast<float>(pcm) / 8388608.0f;
  }
  case 32:
    return static_cast<int32_t>(read_u32(in)) / 2147483648.0f;
  }
  return 0;
}

int16_t to_s16(float v) {
  v = std::clamp(v, -1.0f, 1.0f);
  return static_cast<int16_t>(std::lround(v * 32767.0f));
}

} // namespace

std::vector<uint8_t> base64_decode(const std::string &in) {
  using base64_dec =
      iterators::transform_width<iterators::binary_from_base64<
                                     std::string::const_iterator>,
                                 8, 6>;

  std::string s = in;
  /* accept data urls as produced by FileReader.readAsDataURL */
  if (boost::starts_with(s, "data:")) {
    auto comma = s.find(',');
    if (comma == std::string::npos) {
      throw std::runtime_error("malformed data url");
    }
    s.erase(0, comma + 1);
  }
  boost::erase_all(s, "\n");
  boost::erase_all(s, "\r");
  boost::trim(s);

  if (s.empty()) {
    throw std::runtime_error("empty base64 payload");
  }
  if (s.size() % 4 != 0) {
    throw std::runtime_error("base64 payload length is not a multiple of 4");
  }

  size_t pad = 0;
  while (pad < s.size() && s[s.size() - 1 - pad] == '=')
    pad++;
  if (pad > 2) {
    throw std::runtime_error("invalid base64 padding");
  }
  std::replace(s.end() - pad, s.end(), '=', 'A');

  std::vector<uint8_t> out;
  try {
    out.assign(base64_dec(s.cbegin()), base64_dec(s.cend()));
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("invalid base64 payload: ") +
                             e.what());
  }
  out.resize(out.size() - pad);
  return out;
}

std::string base64_encode(const std::vector<uint8_t> &in) {
  using base64_enc = iterators::base64_from_binary<
      iterators::transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;

  std::string out(base64_enc(in.cbegin()), base64_enc(in.cend()));
  out.append((3 - in.size() % 3) % 3, '=');
  return out;
}

PcmBuffer decode_wav(const std::vector<uint8_t> &blob) {
  if (blob.size() < 12 || std::memcmp(blob.data(), "RIFF", 4) != 0 ||
      std::memcmp(blob.data() + 8, "WAVE", 4) != 0) {
    throw std::runtime_error("not a RIFF/WAVE blob");
  }

  uint16_t format{0};
  uint16_t channels{0};
  uint32_t sample_rate{0};
  uint16_t bits{0};
  const uint8_t *data{nullptr};
  size_t data_size{0};

  size_t offset = 12;
  while (offset + 8 <= blob.size()) {
    const uint8_t *chunk = blob.data() + offset;
    size_t size = read_u32(chunk + 4);
    size_t available = blob.size() - offset - 8;

    if (std::memcmp(chunk, "fmt ", 4) == 0) {
      if (size < 16 || size > available) {
        throw std::runtime_error("truncated fmt chunk");
      }
      format = read_u16(chunk + 8);
      channels = read_u16(chunk + 10);
      sample_rate = read_u32(chunk + 12);
      bits = read_u16(chunk + 22);
      if (format == WAVE_FORMAT_EXTENSIBLE && size >= 26) {
        /* first two bytes of the sub-format GUID */
        format = read_u16(chunk + 32);
      }
    } else if (std::memcmp(chunk, "data", 4) == 0) {
      /* streaming writers leave the size unset */
      data = chunk + 8;
      data_size = std::min(size, available);
      break;
    }
    offset += 8 + size + (size & 1);
  }

  if (channels == 0 || sample_rate == 0) {
    throw std::runtime_error("missing or invalid fmt chunk");
  }
  if (data == nullptr) {
    throw std::runtime_error("missing data chunk");
  }
  bool supported =
      (format == WAVE_FORMAT_PCM &&
       (bits == 8 || bits == 16 || bits == 24 || bits == 32)) ||
      (format == WAVE_FORMAT_IEEE_FLOAT && bits == 32);
  if (!supported) {
    throw std::runtime_error("unsupported wav format " +
                             std::to_string(format) + " with " +
                             std::to_string(bits) + " bits");
  }

  size_t sample_size = bits / 8;
  size_t frame_size = sample_size * channels;
  size_t frames = data_size / frame_size;

  PcmBuffer pcm;
  pcm.sample_rate = sample_rate;
  pcm.samples.reserve(frames);
  if (format == WAVE_FORMAT_PCM && bits == 16) {
    /* exact path for the common case */
    for (size_t frame = 0; frame < frames; frame++) {
      int32_t sum{0};
      for (uint16_t ch = 0; ch < channels; ch++) {
        sum += static_cast<int16_t>(
            read_u16(data + frame * frame_size + ch * sample_size));
      }
      pcm.samples.push_back(static_cast<int16_t>(sum / channels));
    }
    return pcm;
  }

  for (size_t frame = 0; frame < frames; frame++) {
    float mixed{0};
    for (uint16_t ch = 0; ch < channels; ch++) {
      mixed += read_sample(data + frame * frame_size + ch * sample_size, format,
                           bits);
    }
    pcm.samples.push_back(to_s16(mixed / channels));
  }
  return pcm;
}

std::vector<uint8_t> encode_wav(const std::vector<int16_t> &samples,
                                uint32_t sample_rate) {
  uint32_t data_size = samples.size() * sizeof(int16_t);
  std::vector<uint8_t> out;
  out.reserve(44 + data_size);

  write_tag(out, "RIFF");
  write_u32(out, 36 + data_size);
  write_tag(out, "WAVE");
  write_tag(out, "fmt ");
  write_u32(out, 16);
  write_u16(out, WAVE_FORMAT_PCM);
  write_u16(out, 1);
  write_u32(out, sample_rate);
  write_u32(out, sample_rate * sizeof(int16_t));
  write_u16(out, sizeof(int16_t));
  write_u16(out, 16);
  write_tag(out, "data");
  write_u32(out, data_size);
  for (int16_t s : samples) {
    write_u16(out, static_cast<uint16_t>(s));
  }
  return out;
}

std::vector<int16_t> resample_linear(const std::vector<int16_t> &in,
                                     uint32_t rate_in, uint32_t rate_out) {
  if (rate_in == 0 || rate_out == 0 || in.empty() || rate_in == rate_out)
    return in;

  const double ratio = static_cast<double>(rate_out) / rate_in;
  const size_t n_out = std::max<size_t>(1, std::llround(in.size() * ratio));
  std::vector<int16_t> out(n_out);
  for (size_t i = 0; i < n_out; ++i) {
    const double pos = i / ratio;
    const size_t i0 = std::min(static_cast<size_t>(pos), in.size() - 1);
    const size_t i1 = std::min(i0 + 1, in.size() - 1);
    const double t = pos - i0;
    out[i] = static_cast<int16_t>(std::lround((1.0 - t) * in[i0] + t * in[i1]));
  }
  return out;
}

std::vector<float> pcm_to_float(const std::vector<int16_t> &in) {
  std::vector<float> out;
  out.reserve(in.size());
  for (int16_t s : in) {
    out.push_back(static_cast<float>(s) / 32768.0f);
  }
  return out;
}
