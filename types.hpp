//
//  types.hpp
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

#ifndef _TYPES_HPP_
#define _TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/* mono, 16 bit, pipeline sample rate */
struct AudioChunk {
  std::vector<int16_t> samples;
  /* wall-clock seconds of the first sample */
  double captured_at{0};
};

struct ActivityVerdict {
  bool has_speech{false};
  float probability{0};
  /* contiguous silence so far, in seconds of audio */
  float silence_seconds{0};
};

enum class SegmentationDecision { Continue, FlushSegment, FlushParagraph };

struct PendingSegment {
  std::vector<int16_t> samples;
  double captured_at{0};

  bool empty() const { return samples.empty(); }
  void clear() {
    samples.clear();
    captured_at = 0;
  }
};

struct TranscriptionJob {
  std::vector<int16_t> segment;
  double captured_at{0};
  double submitted_at{0};
  bool new_paragraph{false};
  /* set for jobs carrying an upstream failure */
  std::optional<std::string> error;
};

struct TranscriptionResult {
  std::string text;
  bool new_paragraph{false};
  bool has_speech{false};
  double captured_at{0};
  double transcribed_at{0};
  double latency_ms{0};
  std::optional<std::string> error;
};

const char *decision_name(SegmentationDecision decision);

#endif
