//
//  capture.hpp
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

#ifndef _CAPTURE_HPP_
#define _CAPTURE_HPP_

#include <alsa/asoundlib.h>
#include <cstdint>
#include <string>

/* mono S16_LE ALSA capture */
class Capture {
public:
  Capture() = default;
  Capture(const Capture &) = delete;
  ~Capture() { close(); }

  bool open(const std::string &device_name, uint32_t rate);
  void close();

  /* reads chunk_samples frames, returns frames read or a negative error */
  snd_pcm_sframes_t read(int16_t *out);

  void set_chunk_samples(snd_pcm_uframes_t chunk_samples) {
    chunk_samples_ = chunk_samples;
  }
  snd_pcm_uframes_t get_chunk_samples() const { return chunk_samples_; }
  size_t get_bytes_per_frame() const { return sizeof(int16_t); }
  uint32_t get_rate() const { return rate_; }
  bool is_open() const { return pcm_ != nullptr; }

private:
  snd_pcm_t *pcm_{nullptr};
  snd_pcm_uframes_t chunk_samples_{8000};
  uint32_t rate_{16000};
};

#endif
