//
//  dispatcher.cpp
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

#include <algorithm>
#include <stdexcept>

#include "dispatcher.hpp"
#include "log.hpp"
#include "utils.hpp"

TranscriptionDispatcher::TranscriptionDispatcher(
    const Config &config, std::shared_ptr<SpeechRecognizer> recognizer,
    ResultQueue &results)
    : recognizer_(std::move(recognizer)), results_(results),
      queue_depth_(std::max<size_t>(1, config.get_queue_depth())) {
  if (!recognizer_) {
    throw std::invalid_argument("dispatcher needs a speech recognizer");
  }
}

TranscriptionDispatcher::~TranscriptionDispatcher() { stop(false); }

bool TranscriptionDispatcher::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_)
      return true;
    running_ = true;
    drain_ = true;
  }

  res_worker_ = std::async(std::launch::async, [this]() {
    BOOST_LOG_TRIVIAL(debug) << "dispatcher:: worker loop start";
    while (1) {
      TranscriptionJob job;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        jobs_cond_.wait(lock, [&] { return !running_ || !jobs_.empty(); });
        if (jobs_.empty() || (!running_ && !drain_))
          break;
        job = std::move(jobs_.front());
        jobs_.pop_front();
        busy_ = true;
        space_cond_.notify_one();
      }

      run(job);

      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
      if (jobs_.empty())
        idle_cond_.notify_all();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!jobs_.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "dispatcher:: dropping " << jobs_.size()
                                 << " queued jobs on shutdown";
      jobs_.clear();
    }
    idle_cond_.notify_all();
    space_cond_.notify_all();
    BOOST_LOG_TRIVIAL(debug) << "dispatcher:: worker loop end";
    return true;
  });
  return true;
}

bool TranscriptionDispatcher::stop(bool drain) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return true;
    running_ = false;
    drain_ = drain;
    jobs_cond_.notify_all();
    space_cond_.notify_all();
  }
  BOOST_LOG_TRIVIAL(info) << "dispatcher:: stopping"
                          << (drain ? " after queued jobs" : "");
  return res_worker_.valid() ? res_worker_.get() : true;
}

bool TranscriptionDispatcher::submit(PendingSegment &&segment,
                                     SegmentationDecision kind) {
  if (segment.empty() || kind == SegmentationDecision::Continue) {
    BOOST_LOG_TRIVIAL(warning) << "dispatcher:: ignoring empty submission";
    return false;
  }

  TranscriptionJob job;
  job.captured_at = segment.captured_at;
  job.segment = std::move(segment.samples);
  job.new_paragraph = kind == SegmentationDecision::FlushParagraph;
  segment.clear();
  return enqueue(std::move(job));
}

bool TranscriptionDispatcher::submit_error(double captured_at,
                                           const std::string &error) {
  TranscriptionJob job;
  job.captured_at = captured_at;
  job.error = error.empty() ? "unknown error" : error;
  return enqueue(std::move(job));
}

bool TranscriptionDispatcher::enqueue(TranscriptionJob &&job) {
  std::unique_lock<std::mutex> lock(mutex_);
  space_cond_.wait(lock,
                   [&] { return !running_ || jobs_.size() < queue_depth_; });
  if (!running_) {
    BOOST_LOG_TRIVIAL(error) << "dispatcher:: not running, job rejected";
    return false;
  }

  job.submitted_at = wall_clock_now();
  jobs_.push_back(std::move(job));
  BOOST_LOG_TRIVIAL(debug) << "dispatcher:: queued job, " << jobs_.size()
                           << " waiting" << (busy_ ? ", one in flight" : "");
  jobs_cond_.notify_one();
  return true;
}

void TranscriptionDispatcher::run(TranscriptionJob &job) {
  TranscriptionResult result;
  result.captured_at = job.captured_at;

  if (job.error) {
    result.error = job.error;
  } else {
    try {
      TimeElapsed te("dispatcher:: transcription of " +
                     std::to_string(job.segment.size()) + " samples");
      result.text = recognizer_->infer(job.segment);
      result.has_speech = true;
      result.new_paragraph = job.new_paragraph;
    } catch (const std::exception &e) {
      BOOST_LOG_TRIVIAL(error)
          << "dispatcher:: transcription failed: " << e.what();
      result.error = *e.what() ? e.what() : "transcription failed";
    } catch (...) {
      BOOST_LOG_TRIVIAL(error)
          << "dispatcher:: transcription failed: unknown error";
      result.error = "transcription failed";
    }
  }

  if (result.error) {
    result.text.clear();
    result.has_speech = false;
    result.new_paragraph = false;
  }

  /* a capture stamp ahead of our clock yields zero latency */
  result.transcribed_at = std::max(wall_clock_now(), result.captured_at);
  result.latency_ms = (result.transcribed_at - result.captured_at) * 1000.0;

  BOOST_LOG_TRIVIAL(info) << "dispatcher:: result '" << result.text.substr(0, 50)
                          << "' paragraph " << result.new_paragraph
                          << " latency " << static_cast<int>(result.latency_ms)
                          << " ms" << (result.error ? " (error)" : "");
  results_.push(std::move(result));
}

size_t TranscriptionDispatcher::get_queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size() + (busy_ ? 1 : 0);
}

bool TranscriptionDispatcher::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

bool TranscriptionDispatcher::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cond_.wait_for(lock, timeout,
                             [&] { return jobs_.empty() && !busy_; });
}
