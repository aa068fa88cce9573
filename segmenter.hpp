//
//  segmenter.hpp
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

#ifndef _SEGMENTER_HPP_
#define _SEGMENTER_HPP_

#include <cstdint>

#include "config.hpp"
#include "types.hpp"

/*
 * SpeechSegmenter
 *
 * Idle         -> Accumulating  on the first speech chunk
 * Accumulating -> Accumulating  on speech, or on silence shorter than
 *                               segment_silence
 * Accumulating -> Idle          on silence >= segment_silence (FlushSegment),
 *                               >= paragraph_silence (FlushParagraph),
 *                               or when the segment reaches max_segment
 *
 * Silence is measured by the gate counter in seconds of audio, never by
 * wall-clock.
 */
class SpeechSegmenter {
public:
  enum class State { Idle, Accumulating };

  explicit SpeechSegmenter(const Config &config);

  /* takes ownership of chunk, out receives the segment on Flush* */
  SegmentationDecision process(AudioChunk &&chunk,
                               const ActivityVerdict &verdict,
                               PendingSegment &out);

  /* hands out any pending audio regardless of silence, false if none */
  bool flush(PendingSegment &out);
  void reset();

  State state() const { return state_; }
  size_t get_pending_samples() const { return pending_.samples.size(); }

  static const char *state_name(State s);

private:
  void append(AudioChunk &&chunk);
  SegmentationDecision finish(SegmentationDecision decision,
                              PendingSegment &out);

  float segment_silence_;
  float paragraph_silence_;
  size_t max_segment_samples_;
  uint32_t rate_;
  State state_{State::Idle};
  PendingSegment pending_;
};

#endif
