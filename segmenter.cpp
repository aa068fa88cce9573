//
//  segmenter.cpp
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

#include "segmenter.hpp"
#include "log.hpp"
#include "utils.hpp"

SpeechSegmenter::SpeechSegmenter(const Config &config)
    : segment_silence_(config.get_segment_silence()),
      paragraph_silence_(config.get_paragraph_silence()),
      max_segment_samples_(config.get_max_segment() > 0
                               ? static_cast<size_t>(config.get_max_segment() *
                                                     config.get_sample_rate())
                               : 0),
      rate_(config.get_sample_rate()) {
  if (paragraph_silence_ < segment_silence_) {
    BOOST_LOG_TRIVIAL(warning)
        << "segmenter:: paragraph silence " << paragraph_silence_
        << "s below segment silence " << segment_silence_ << "s";
  }
}

SegmentationDecision SpeechSegmenter::process(AudioChunk &&chunk,
                                              const ActivityVerdict &verdict,
                                              PendingSegment &out) {
  switch (state_) {
  case State::Idle:
    if (!verdict.has_speech) {
      BOOST_LOG_TRIVIAL(trace) << "segmenter:: discarding silent chunk";
      return SegmentationDecision::Continue;
    }
    append(std::move(chunk));
    state_ = State::Accumulating;
    break;

  case State::Accumulating:
    if (verdict.has_speech ||
        verdict.silence_seconds < segment_silence_) {
      /* keep buffering through short pauses */
      append(std::move(chunk));
    } else if (verdict.silence_seconds < paragraph_silence_) {
      return finish(SegmentationDecision::FlushSegment, out);
    } else {
      return finish(SegmentationDecision::FlushParagraph, out);
    }
    break;
  }

  if (max_segment_samples_ > 0 &&
      pending_.samples.size() >= max_segment_samples_) {
    BOOST_LOG_TRIVIAL(info) << "segmenter:: segment reached "
                            << samples_to_seconds(pending_.samples.size(),
                                                  rate_)
                            << "s, forcing flush";
    return finish(SegmentationDecision::FlushSegment, out);
  }
  return SegmentationDecision::Continue;
}

bool SpeechSegmenter::flush(PendingSegment &out) {
  if (state_ != State::Accumulating || pending_.empty()) {
    reset();
    return false;
  }
  finish(SegmentationDecision::FlushSegment, out);
  return true;
}

void SpeechSegmenter::reset() {
  if (!pending_.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "segmenter:: dropping "
                             << pending_.samples.size() << " pending samples";
  }
  pending_.clear();
  state_ = State::Idle;
}

void SpeechSegmenter::append(AudioChunk &&chunk) {
  if (pending_.empty()) {
    pending_.captured_at = chunk.captured_at;
    pending_.samples = std::move(chunk.samples);
  } else {
    pending_.samples.insert(pending_.samples.end(), chunk.samples.begin(),
                            chunk.samples.end());
  }
}

SegmentationDecision SpeechSegmenter::finish(SegmentationDecision decision,
                                             PendingSegment &out) {
  BOOST_LOG_TRIVIAL(info) << "segmenter:: " << decision_name(decision) << " "
                          << samples_to_seconds(pending_.samples.size(), rate_)
                          << "s";
  out = std::move(pending_);
  pending_.clear();
  state_ = State::Idle;
  return decision;
}

const char *SpeechSegmenter::state_name(State s) {
  switch (s) {
  case State::Idle:
    return "Idle";
  case State::Accumulating:
    return "Accumulating";
  }
  return "Unknown";
}

const char *decision_name(SegmentationDecision decision) {
  switch (decision) {
  case SegmentationDecision::Continue:
    return "Continue";
  case SegmentationDecision::FlushSegment:
    return "FlushSegment";
  case SegmentationDecision::FlushParagraph:
    return "FlushParagraph";
  }
  return "Unknown";
}
