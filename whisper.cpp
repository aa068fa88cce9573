//
//  whisper.cpp
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
#include <stdexcept>

#include "audio_codec.hpp"
#include "log.hpp"
#include "whisper.hpp"

namespace {

/* route whisper and ggml output into our log */
void whisper_log_callback(enum ggml_log_level level, const char *text,
                          void * /* user_data */) {
  std::string line(text ? text : "");
  boost::trim_right(line);
  if (line.empty())
    return;

  switch (level) {
  case GGML_LOG_LEVEL_ERROR:
    BOOST_LOG_TRIVIAL(error) << "whisper:: " << line;
    break;
  case GGML_LOG_LEVEL_WARN:
    BOOST_LOG_TRIVIAL(warning) << "whisper:: " << line;
    break;
  default:
    BOOST_LOG_TRIVIAL(trace) << "whisper:: " << line;
    break;
  }
}

} // namespace

bool Whisper::init() {
  if (loaded_)
    return true;

  BOOST_LOG_TRIVIAL(info) << "whisper:: loading model " << config_.get_model();
  whisper_log_set(whisper_log_callback, nullptr);

  std::lock_guard<std::mutex> lock(whisper_mutex_);
  struct whisper_context_params cparams = whisper_context_default_params();
  ctx_ = whisper_init_from_file_with_params(config_.get_model().c_str(),
                                            cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_TRIVIAL(fatal) << "whisper:: cannot load model "
                             << config_.get_model();
    return false;
  }

  // this has no effect on whisper.cpp builds without OpenVINO
  whisper_ctx_init_openvino_encoder(
      ctx_, nullptr, config_.get_openvino_device().c_str(), nullptr);

  language_ = config_.get_language();
  if (!whisper_is_multilingual(ctx_) && language_ != "en") {
    BOOST_LOG_TRIVIAL(warning) << "whisper:: model is English only, ignoring "
                               << "language " << language_;
    language_ = "en";
  }

  prompt_tokens_.clear();
  loaded_ = true;
  BOOST_LOG_TRIVIAL(info) << "whisper:: model loaded, language " << language_;
  return true;
}

void Whisper::terminate() {
  std::lock_guard<std::mutex> lock(whisper_mutex_);
  loaded_ = false;
  if (ctx_ != nullptr) {
    whisper_free(ctx_);
    ctx_ = nullptr;
    BOOST_LOG_TRIVIAL(debug) << "whisper:: context released";
  }
}

std::string Whisper::infer(const std::vector<int16_t> &pcm) {
  std::lock_guard<std::mutex> lock(whisper_mutex_);
  if (ctx_ == nullptr) {
    throw std::runtime_error("whisper model is not loaded");
  }
  if (pcm.empty())
    return "";

  auto samples = pcm_to_float(pcm);

  whisper_full_params wparams =
      whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  wparams.print_progress = false;
  wparams.print_special = false;
  wparams.print_realtime = false;
  wparams.print_timestamps = false;
  wparams.translate = false;
  wparams.single_segment = false;
  wparams.suppress_blank = true;
  wparams.language = language_.c_str();
  wparams.n_threads = config_.get_threads();
  wparams.no_context = !config_.get_use_context();
  if (config_.get_use_context()) {
    wparams.prompt_tokens = prompt_tokens_.data();
    wparams.prompt_n_tokens = static_cast<int>(prompt_tokens_.size());
  }

  int rc = whisper_full(ctx_, wparams, samples.data(),
                        static_cast<int>(samples.size()));
  if (rc != 0) {
    throw std::runtime_error("whisper_full failed with code " +
                             std::to_string(rc));
  }

  std::string text;
  const int n_segments = whisper_full_n_segments(ctx_);
  for (int i = 0; i < n_segments; ++i) {
    const char *segment = whisper_full_get_segment_text(ctx_, i);
    if (segment != nullptr)
      text += segment;
  }

  if (config_.get_use_context()) {
    /* keep the tokens of this segment as prompt for the next one */
    prompt_tokens_.clear();
    for (int i = 0; i < n_segments; ++i) {
      const int token_count = whisper_full_n_tokens(ctx_, i);
      for (int j = 0; j < token_count; ++j) {
        prompt_tokens_.push_back(whisper_full_get_token_id(ctx_, i, j));
      }
    }
  }

  boost::trim(text);
  if (is_blank_transcript(text)) {
    BOOST_LOG_TRIVIAL(debug) << "whisper:: blank output '" << text << "'";
    text.clear();
  }
  return text;
}
