//
//  vad.cpp
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

#include <algorithm>
#include <stdexcept>

#include "audio_codec.hpp"
#include "log.hpp"
#include "vad.hpp"

namespace {
/* Silero works on 512 sample frames at 16 kHz */
constexpr size_t vad_frame_samples = 512;
/* shortest speech run worth a transcription */
constexpr size_t min_speech_ms = 250;
} // namespace

bool SileroVad::init() {
  if (loaded_)
    return true;

  BOOST_LOG_TRIVIAL(info) << "vad:: loading model " << config_.get_vad_model();
  std::lock_guard<std::mutex> lock(vad_mutex_);
  whisper_vad_context_params ctx_params = whisper_vad_default_context_params();
  ctx_params.n_threads = std::max(1, config_.get_threads());

  context_.reset(whisper_vad_init_from_file_with_params(
      config_.get_vad_model().c_str(), ctx_params));
  if (!context_) {
    BOOST_LOG_TRIVIAL(fatal) << "vad:: cannot load model "
                             << config_.get_vad_model();
    return false;
  }
  loaded_ = true;
  return true;
}

void SileroVad::terminate() {
  std::lock_guard<std::mutex> lock(vad_mutex_);
  loaded_ = false;
  context_.reset();
}

float SileroVad::infer(const std::vector<int16_t> &pcm) {
  std::lock_guard<std::mutex> lock(vad_mutex_);
  if (!context_) {
    throw std::runtime_error("Silero VAD model is not loaded");
  }

  auto samples = pcm_to_float(pcm);
  if (samples.size() < vad_frame_samples)
    samples.resize(vad_frame_samples, 0.0f);

  if (!whisper_vad_detect_speech(context_.get(), samples.data(),
                                 static_cast<int>(samples.size()))) {
    throw std::runtime_error("Silero VAD failed to process audio chunk");
  }

  int n_probs = whisper_vad_n_probs(context_.get());
  const float *probs = whisper_vad_probs(context_.get());
  if (n_probs <= 0 || probs == nullptr) {
    throw std::runtime_error("Silero VAD returned no probabilities");
  }

  size_t window = (min_speech_ms * config_.get_sample_rate() / 1000 +
                   vad_frame_samples - 1) /
                  vad_frame_samples;
  window = std::clamp<size_t>(window, 1, n_probs);

  float sum{0};
  for (size_t i = 0; i < window; i++)
    sum += probs[i];
  float best = sum;
  for (size_t i = window; i < static_cast<size_t>(n_probs); i++) {
    sum += probs[i] - probs[i - window];
    best = std::max(best, sum);
  }
  return best / window;
}
