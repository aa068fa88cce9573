//
//  chunk_accumulator.cpp
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

#include "chunk_accumulator.hpp"
#include "log.hpp"

ChunkAccumulator::ChunkAccumulator(uint16_t chunk_duration_ms, uint32_t rate)
    : chunk_seconds_(chunk_duration_ms / 1000.0),
      chunk_samples_(static_cast<size_t>(rate) * chunk_duration_ms / 1000) {
  buffer_.reserve(chunk_samples_);
}

void ChunkAccumulator::push(const int16_t *samples, size_t samples_num,
                            double received_at) {
  if (samples == nullptr || samples_num == 0)
    return;

  if (buffer_.empty())
    captured_at_ = received_at;
  if (last_emit_at_ < 0)
    last_emit_at_ = received_at;

  buffer_.insert(buffer_.end(), samples, samples + samples_num);
}

bool ChunkAccumulator::should_emit(double now) const {
  if (buffer_.empty())
    return false;
  if (force_)
    return true;
  if (chunk_samples_ > 0 && buffer_.size() >= chunk_samples_)
    return true;
  return (now - last_emit_at_) >= chunk_seconds_;
}

bool ChunkAccumulator::emit(AudioChunk &out, double now) {
  force_ = false;
  if (buffer_.empty())
    return false;

  out.captured_at = captured_at_;
  out.samples = std::move(buffer_);
  buffer_.clear();
  buffer_.reserve(chunk_samples_);
  last_emit_at_ = now;

  BOOST_LOG_TRIVIAL(trace) << "accumulator:: emitted chunk of "
                           << out.samples.size() << " samples";
  return true;
}

void ChunkAccumulator::reset() {
  buffer_.clear();
  force_ = false;
  captured_at_ = 0;
  last_emit_at_ = -1;
}
