//
//  voice_activity.cpp
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

#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"
#include "voice_activity.hpp"

VoiceActivityGate::VoiceActivityGate(
    const Config &config, std::shared_ptr<VoiceActivityDetector> detector)
    : detector_(std::move(detector)), threshold_(config.get_vad_threshold()),
      rate_(config.get_sample_rate()) {
  if (!detector_) {
    throw std::invalid_argument("voice activity gate needs a detector");
  }
}

ActivityVerdict VoiceActivityGate::classify(const AudioChunk &chunk) {
  ActivityVerdict verdict;
  verdict.probability = detector_->infer(chunk.samples);
  verdict.has_speech = verdict.probability >= threshold_;

  if (verdict.has_speech) {
    silence_seconds_ = 0;
  } else {
    silence_seconds_ += samples_to_seconds(chunk.samples.size(), rate_);
  }
  verdict.silence_seconds = silence_seconds_;

  BOOST_LOG_TRIVIAL(debug) << "vad:: probability " << verdict.probability
                           << " speech " << verdict.has_speech << " silence "
                           << verdict.silence_seconds << "s";
  return verdict;
}
