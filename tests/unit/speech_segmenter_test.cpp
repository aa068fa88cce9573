//
//  speech_segmenter_test.cpp
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

#include <cassert>
#include <cstring>

#include "config.hpp"
#include "segmenter.hpp"

using State = SpeechSegmenter::State;

static AudioChunk chunk_of(size_t samples, double captured_at) {
  AudioChunk chunk;
  chunk.samples.assign(samples, 100);
  chunk.captured_at = captured_at;
  return chunk;
}

static ActivityVerdict voiced() {
  ActivityVerdict v;
  v.has_speech = true;
  v.probability = 0.9f;
  return v;
}

static ActivityVerdict silent(float silence_seconds) {
  ActivityVerdict v;
  v.probability = 0.1f;
  v.silence_seconds = silence_seconds;
  return v;
}

static void idle_discards_silence(const Config &config) {
  SpeechSegmenter seg(config);
  PendingSegment out;
  auto d = seg.process(chunk_of(48000, 0), silent(3), out);
  assert(d == SegmentationDecision::Continue);
  assert(seg.state() == State::Idle);
  assert(seg.get_pending_samples() == 0);
  assert(out.empty());
}

static void speech_then_short_pause(const Config &config) {
  SpeechSegmenter seg(config);
  PendingSegment out;
  assert(seg.process(chunk_of(48000, 10), voiced(), out) ==
         SegmentationDecision::Continue);
  assert(seg.state() == State::Accumulating);

  /* pauses below the segment threshold stay in the segment */
  assert(seg.process(chunk_of(16000, 13), silent(1.0f), out) ==
         SegmentationDecision::Continue);
  assert(seg.state() == State::Accumulating);
  assert(seg.get_pending_samples() == 64000);

  assert(seg.process(chunk_of(48000, 14), voiced(), out) ==
         SegmentationDecision::Continue);
  assert(seg.get_pending_samples() == 112000);
}

static void flush_segment(const Config &config) {
  SpeechSegmenter seg(config);
  PendingSegment out;
  seg.process(chunk_of(48000, 10), voiced(), out);

  auto d = seg.process(chunk_of(48000, 13), silent(3.0f), out);
  assert(d == SegmentationDecision::FlushSegment);
  assert(seg.state() == State::Idle);
  assert(seg.get_pending_samples() == 0);
  /* the silent chunk is not part of the segment */
  assert(out.samples.size() == 48000);
  assert(out.captured_at == 10);
}

static void flush_paragraph(const Config &config) {
  SpeechSegmenter seg(config);
  PendingSegment out;
  seg.process(chunk_of(48000, 10), voiced(), out);
  assert(seg.process(chunk_of(24000, 13), silent(1.5f), out) ==
         SegmentationDecision::Continue);

  auto d = seg.process(chunk_of(48000, 14.5), silent(4.5f), out);
  assert(d == SegmentationDecision::FlushParagraph);
  assert(seg.state() == State::Idle);
  assert(out.samples.size() == 72000);
  assert(out.captured_at == 10);
}

static void thresholds_are_inclusive(const Config &config) {
  SpeechSegmenter seg(config);
  PendingSegment out;
  seg.process(chunk_of(16000, 0), voiced(), out);
  assert(seg.process(chunk_of(16000, 1), silent(2.0f), out) ==
         SegmentationDecision::FlushSegment);

  seg.process(chunk_of(16000, 5), voiced(), out);
  assert(seg.process(chunk_of(16000, 6), silent(4.0f), out) ==
         SegmentationDecision::FlushParagraph);
}

static void max_segment_forces_flush() {
  Config config;
  config.set_max_segment(6.0f);
  SpeechSegmenter seg(config);
  PendingSegment out;
  assert(seg.process(chunk_of(48000, 0), voiced(), out) ==
         SegmentationDecision::Continue);
  assert(seg.process(chunk_of(48000, 3), voiced(), out) ==
         SegmentationDecision::FlushSegment);
  assert(out.samples.size() == 96000);
  assert(seg.state() == State::Idle);

  /* zero disables the limit */
  config.set_max_segment(0);
  SpeechSegmenter unlimited(config);
  for (int i = 0; i < 20; i++) {
    assert(unlimited.process(chunk_of(48000, i * 3), voiced(), out) ==
           SegmentationDecision::Continue);
  }
  assert(unlimited.get_pending_samples() == 20 * 48000);
}

static void flush_and_reset(const Config &config) {
  SpeechSegmenter seg(config);
  PendingSegment out;
  assert(!seg.flush(out));
  assert(out.empty());

  seg.process(chunk_of(16000, 2), voiced(), out);
  assert(seg.flush(out));
  assert(out.samples.size() == 16000);
  assert(out.captured_at == 2);
  assert(seg.state() == State::Idle);
  assert(!seg.flush(out));

  PendingSegment dropped;
  seg.process(chunk_of(16000, 3), voiced(), dropped);
  seg.reset();
  assert(seg.state() == State::Idle);
  assert(seg.get_pending_samples() == 0);
  assert(dropped.empty());
}

static void names() {
  assert(std::strcmp(SpeechSegmenter::state_name(State::Idle), "Idle") == 0);
  assert(std::strcmp(SpeechSegmenter::state_name(State::Accumulating),
                     "Accumulating") == 0);
  assert(std::strcmp(decision_name(SegmentationDecision::FlushParagraph),
                     "FlushParagraph") == 0);
}

int main() {
  Config config;
  idle_discards_silence(config);
  speech_then_short_pause(config);
  flush_segment(config);
  flush_paragraph(config);
  thresholds_are_inclusive(config);
  max_segment_forces_flush();
  flush_and_reset(config);
  names();
  return 0;
}
