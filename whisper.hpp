//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <whisper.h>

#include "config.hpp"
#include "recognizer.hpp"

class Whisper : public SpeechRecognizer {
public:
  Whisper(const Config &config) : config_(config){};
  Whisper(const Whisper &) = delete;
  ~Whisper() override { terminate(); }

  bool init();
  void terminate();

  std::string infer(const std::vector<int16_t> &pcm) override;
  bool is_loaded() const override { return loaded_; }

private:
  const Config &config_;
  std::string language_;
  std::vector<whisper_token> prompt_tokens_;
  /* whisper_context is not thread-safe */
  std::mutex whisper_mutex_;
  std::atomic_bool loaded_{false};
  struct whisper_context *ctx_{nullptr};
};

#endif
