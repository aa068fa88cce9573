//
//  result_queue.cpp
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

#include <iterator>

#include "log.hpp"
#include "result_queue.hpp"

void ResultQueue::push(TranscriptionResult &&result) {
  std::lock_guard<std::mutex> lock(mutex_);
  results_.push_back(std::move(result));
}

std::vector<TranscriptionResult> ResultQueue::drain() {
  std::vector<TranscriptionResult> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.assign(std::make_move_iterator(results_.begin()),
               std::make_move_iterator(results_.end()));
    results_.clear();
  }
  BOOST_LOG_TRIVIAL(trace) << "results:: drained " << out.size();
  return out;
}

size_t ResultQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return results_.size();
}
