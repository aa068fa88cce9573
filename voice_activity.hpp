//
//  voice_activity.hpp
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

#ifndef _VOICE_ACTIVITY_HPP_
#define _VOICE_ACTIVITY_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "config.hpp"
#include "types.hpp"

class VoiceActivityDetector {
public:
  virtual ~VoiceActivityDetector() = default;

  /* speech probability in [0, 1] for 16 kHz mono pcm, throws on failure */
  virtual float infer(const std::vector<int16_t> &pcm) = 0;
  virtual bool is_loaded() const { return true; }
};

class VoiceActivityGate {
public:
  VoiceActivityGate(const Config &config,
                    std::shared_ptr<VoiceActivityDetector> detector);
  VoiceActivityGate(const VoiceActivityGate &) = delete;

  /* detector exceptions propagate, the silence counter is then unchanged */
  ActivityVerdict classify(const AudioChunk &chunk);
  void reset() { silence_seconds_ = 0; }

  float get_silence_seconds() const { return silence_seconds_; }

private:
  std::shared_ptr<VoiceActivityDetector> detector_;
  float threshold_;
  uint32_t rate_;
  float silence_seconds_{0};
};

#endif
