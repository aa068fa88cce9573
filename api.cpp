//
//  api.cpp
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

#include <cmath>
#include <stdexcept>

#include "api.hpp"
#include "audio_codec.hpp"
#include "log.hpp"

Api::Api(const Config &config, std::shared_ptr<Transcriber> transcriber)
    : config_(config), transcriber_(std::move(transcriber)) {
  if (!transcriber_) {
    throw std::invalid_argument("api needs a transcriber");
  }
}

ApiResponse Api::submit_audio(const std::string &audio_base64,
                              double captured_at) {
  BOOST_LOG_TRIVIAL(debug) << "api:: received chunk, size "
                           << audio_base64.size() << " chars, captured_at "
                           << std::fixed << captured_at;
  if (!std::isfinite(captured_at) || captured_at < 0) {
    return ApiResponse::failure("invalid capture timestamp");
  }

  PcmBuffer pcm;
  try {
    pcm = decode_wav(base64_decode(audio_base64));
    if (pcm.sample_rate != config_.get_sample_rate()) {
      BOOST_LOG_TRIVIAL(debug) << "api:: resampling from " << pcm.sample_rate
                               << " Hz";
      pcm.samples = resample_linear(pcm.samples, pcm.sample_rate,
                                    config_.get_sample_rate());
      pcm.sample_rate = config_.get_sample_rate();
    }
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "api:: cannot decode audio: " << e.what();
    return ApiResponse::failure(e.what());
  }

  if (pcm.samples.empty()) {
    return ApiResponse::failure("audio blob carries no samples");
  }
  if (!transcriber_->push_samples(pcm.samples.data(), pcm.samples.size(),
                                  captured_at)) {
    return ApiResponse::failure("transcriber is not running");
  }
  return ApiResponse{};
}

std::vector<TranscriptionResult> Api::drain_results() {
  auto results = transcriber_->drain_results();
  if (!results.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "api:: returning " << results.size()
                             << " results";
  }
  return results;
}

ApiStatus Api::get_status() const {
  return ApiStatus{transcriber_->is_model_loaded()};
}

ApiResponse Api::reset_buffer() {
  if (!transcriber_->stop_session()) {
    return ApiResponse::failure("transcriber is not running");
  }
  BOOST_LOG_TRIVIAL(info) << "api:: buffer reset";
  return ApiResponse{};
}
