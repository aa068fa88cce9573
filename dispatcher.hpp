//
//  dispatcher.hpp
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

#ifndef _DISPATCHER_HPP_
#define _DISPATCHER_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "recognizer.hpp"
#include "result_queue.hpp"
#include "types.hpp"

/*
 * Runs one transcription at a time on a worker thread. Jobs waiting for the
 * worker are kept in a FIFO of queue_depth entries, so results reach the
 * ResultQueue in submission order. Every accepted job produces exactly one
 * result, failed or not.
 */
class TranscriptionDispatcher {
public:
  TranscriptionDispatcher(const Config &config,
                          std::shared_ptr<SpeechRecognizer> recognizer,
                          ResultQueue &results);
  TranscriptionDispatcher(const TranscriptionDispatcher &) = delete;
  ~TranscriptionDispatcher();

  bool start();
  /* with drain the queued jobs run first, otherwise they are dropped */
  bool stop(bool drain = true);

  /* blocks while the FIFO is full */
  bool submit(PendingSegment &&segment, SegmentationDecision kind);
  bool submit_error(double captured_at, const std::string &error);

  bool wait_idle(std::chrono::milliseconds timeout);
  size_t get_queued() const;
  bool is_running() const;

private:
  bool enqueue(TranscriptionJob &&job);
  void run(TranscriptionJob &job);

  std::shared_ptr<SpeechRecognizer> recognizer_;
  ResultQueue &results_;
  size_t queue_depth_;
  std::deque<TranscriptionJob> jobs_;
  bool busy_{false};
  bool running_{false};
  bool drain_{true};
  mutable std::mutex mutex_;
  std::condition_variable jobs_cond_;
  std::condition_variable space_cond_;
  std::condition_variable idle_cond_;
  std::future<bool> res_worker_;
};

#endif
