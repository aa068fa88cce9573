//
//  result_queue.hpp
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

#ifndef _RESULT_QUEUE_HPP_
#define _RESULT_QUEUE_HPP_

#include <deque>
#include <mutex>
#include <vector>

#include "types.hpp"

class ResultQueue {
public:
  ResultQueue() = default;
  ResultQueue(const ResultQueue &) = delete;

  void push(TranscriptionResult &&result);
  /* removes and returns everything queued, oldest first */
  std::vector<TranscriptionResult> drain();
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::deque<TranscriptionResult> results_;
};

#endif
