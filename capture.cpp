//
//  capture.cpp
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

#include <cerrno>

#include "capture.hpp"
#include "log.hpp"

bool Capture::open(const std::string &device_name, uint32_t rate) {
  if (pcm_ != nullptr)
    close();

  int err = snd_pcm_open(&pcm_, device_name.c_str(), SND_PCM_STREAM_CAPTURE, 0);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot open device " << device_name
                             << ": " << snd_strerror(err);
    pcm_ = nullptr;
    return false;
  }

  /* let the plug layer resample and down-mix, buffer one second */
  err = snd_pcm_set_params(pcm_, SND_PCM_FORMAT_S16_LE,
                           SND_PCM_ACCESS_RW_INTERLEAVED, 1, rate, 1, 1000000);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot set parameters: "
                             << snd_strerror(err);
    close();
    return false;
  }

  rate_ = rate;
  BOOST_LOG_TRIVIAL(info) << "capture:: opened " << device_name << " at "
                          << rate << " Hz";
  return true;
}

void Capture::close() {
  if (pcm_ == nullptr)
    return;
  snd_pcm_drop(pcm_);
  snd_pcm_close(pcm_);
  pcm_ = nullptr;
  BOOST_LOG_TRIVIAL(debug) << "capture:: closed";
}

snd_pcm_sframes_t Capture::read(int16_t *out) {
  if (pcm_ == nullptr)
    return -EBADF;

  snd_pcm_uframes_t done = 0;
  while (done < chunk_samples_) {
    snd_pcm_sframes_t got =
        snd_pcm_readi(pcm_, out + done, chunk_samples_ - done);
    if (got < 0) {
      BOOST_LOG_TRIVIAL(warning) << "capture:: read error "
                                 << snd_strerror(static_cast<int>(got))
                                 << ", recovering";
      got = snd_pcm_recover(pcm_, static_cast<int>(got), 1);
      if (got < 0) {
        BOOST_LOG_TRIVIAL(error) << "capture:: cannot recover: "
                                 << snd_strerror(static_cast<int>(got));
        return got;
      }
      continue;
    }
    done += got;
  }
  return done;
}
