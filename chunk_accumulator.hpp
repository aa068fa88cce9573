//
//  chunk_accumulator.hpp
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

#ifndef _CHUNK_ACCUMULATOR_HPP_
#define _CHUNK_ACCUMULATOR_HPP_

#include <cstdint>
#include <vector>

#include "types.hpp"

/*
 * Collects capture blocks into chunks of about chunk_duration ms.
 * Not thread-safe, the owner serializes access.
 */
class ChunkAccumulator {
public:
  ChunkAccumulator(uint16_t chunk_duration_ms, uint32_t rate);

  void push(const int16_t *samples, size_t samples_num, double received_at);
  bool should_emit(double now) const;
  void force_flush() { force_ = true; }

  /* moves the buffer into out, false if there is nothing buffered;
     now is the time passed to the should_emit() that triggered it */
  bool emit(AudioChunk &out, double now);
  void reset();

  size_t get_buffered_samples() const { return buffer_.size(); }
  bool empty() const { return buffer_.empty(); }

private:
  double chunk_seconds_;
  size_t chunk_samples_;
  std::vector<int16_t> buffer_;
  double captured_at_{0};
  /* negative until the first block arrives */
  double last_emit_at_{-1};
  bool force_{false};
};

#endif
