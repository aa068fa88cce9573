//
//  vad.hpp
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

#ifndef _VAD_HPP_
#define _VAD_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include <whisper.h>

#include "config.hpp"
#include "voice_activity.hpp"

/* Silero VAD through whisper.cpp */
class SileroVad : public VoiceActivityDetector {
public:
  SileroVad(const Config &config) : config_(config){};
  SileroVad(const SileroVad &) = delete;

  bool init();
  void terminate();

  /* best 250 ms average of the per-frame speech probabilities */
  float infer(const std::vector<int16_t> &pcm) override;
  bool is_loaded() const override { return loaded_; }

private:
  struct VadContextDeleter {
    void operator()(whisper_vad_context *ctx) const {
      if (ctx)
        whisper_vad_free(ctx);
    }
  };

  const Config &config_;
  std::mutex vad_mutex_;
  std::atomic_bool loaded_{false};
  std::unique_ptr<whisper_vad_context, VadContextDeleter> context_;
};

#endif
