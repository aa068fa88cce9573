//
//  transcriber.cpp
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

#include "transcriber.hpp"
#include "audio_codec.hpp"
#include "log.hpp"
#include "utils.hpp"

using namespace std::chrono_literals;

std::shared_ptr<Transcriber>
Transcriber::create(const Config &config,
                    std::shared_ptr<VoiceActivityDetector> detector,
                    std::shared_ptr<SpeechRecognizer> recognizer) {
  return std::shared_ptr<Transcriber>(
      new Transcriber(config, std::move(detector), std::move(recognizer)));
}

Transcriber::Transcriber(const Config &config,
                         std::shared_ptr<VoiceActivityDetector> detector,
                         std::shared_ptr<SpeechRecognizer> recognizer)
    : config_(config), detector_(detector), recognizer_(recognizer),
      accumulator_(config.get_chunk_duration(), config.get_sample_rate()),
      gate_(config, detector), segmenter_(config),
      dispatcher_(config, recognizer, results_) {}

Transcriber::~Transcriber() { terminate(); }

bool Transcriber::init() {
  if (running_)
    return true;

  BOOST_LOG_TRIVIAL(info) << "transcriber:: init";
  if (!is_model_loaded()) {
    BOOST_LOG_TRIVIAL(warning) << "transcriber:: models are not loaded";
  }

  if (!dispatcher_.start()) {
    BOOST_LOG_TRIVIAL(fatal) << "transcriber:: cannot start dispatcher";
    return false;
  }
  running_ = true;

  /* segmentation runs on its own thread, off the capture path */
  res_pipeline_ = std::async(std::launch::async, [&]() {
    BOOST_LOG_TRIVIAL(debug) << "transcriber:: pipeline loop start";
    while (1) {
      PipelineItem item;
      {
        std::unique_lock pipeline_lock(pipeline_mutex_);
        pipeline_cond_.wait(pipeline_lock,
                            [&] { return !running_ || !pipeline_.empty(); });
        /* items queued before termination are still processed */
        if (pipeline_.empty())
          break;
        item = std::move(pipeline_.front());
        pipeline_.pop_front();
        pipeline_busy_ = true;
      }

      if (item.end_session) {
        end_session();
      } else {
        process(std::move(item.chunk));
      }

      std::lock_guard<std::mutex> lock(pipeline_mutex_);
      pipeline_busy_ = false;
      if (pipeline_.empty())
        pipeline_idle_cond_.notify_all();
    }

    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    pipeline_idle_cond_.notify_all();
    BOOST_LOG_TRIVIAL(debug) << "transcriber:: pipeline loop end";
    return true;
  });

  return true;
}

bool Transcriber::terminate() {
  if (!running_)
    return true;

  BOOST_LOG_TRIVIAL(info) << "transcriber:: terminating ... ";
  bool ret = stop_capture();
  {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    running_ = false;
    pipeline_cond_.notify_one();
  }
  if (res_pipeline_.valid() && !res_pipeline_.get())
    ret = false;
  /* shutting down, jobs not yet started are dropped */
  if (!dispatcher_.stop(false))
    ret = false;
  return ret;
}

bool Transcriber::start_capture() {
  if (capturing_)
    return true;
  if (!running_) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: start capture before init";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "transcriber:: starting audio capture ... ";

  uint32_t rate = config_.get_capture_rate();
  if (!capture_.open(config_.get_device_name(), rate)) {
    BOOST_LOG_TRIVIAL(fatal) << "transcriber:: cannot open capture";
    return false;
  }
  capture_.set_chunk_samples(rate / 2); // 500 ms
  capturing_ = true;

  /* start capturing on a separate thread */
  res_capts_ = std::async(std::launch::async, [this, rate]() {
    auto chunk_samples = capture_.get_chunk_samples();
    BOOST_LOG_TRIVIAL(debug)
        << "transcriber:: audio capture loop start, chunk_samples = "
        << chunk_samples;
    std::vector<int16_t> buffer(chunk_samples);
    bool ret = true;
    while (capturing_) {
      auto frames = capture_.read(buffer.data());
      if (frames < 0) {
        ret = false;
        break;
      }
      /* the block ends now, stamp its first sample */
      double captured_at = wall_clock_now() - samples_to_seconds(frames, rate);
      buffer.resize(frames);
      if (rate != config_.get_sample_rate()) {
        auto resampled =
            resample_linear(buffer, rate, config_.get_sample_rate());
        push_samples(resampled.data(), resampled.size(), captured_at);
      } else {
        push_samples(buffer.data(), buffer.size(), captured_at);
      }
      buffer.resize(chunk_samples);
    }
    BOOST_LOG_TRIVIAL(debug) << "transcriber:: audio capture loop end";
    return ret;
  });

  return true;
}

bool Transcriber::stop_capture() {
  if (!capturing_)
    return true;

  BOOST_LOG_TRIVIAL(info) << "transcriber:: stopping audio capture ... ";
  capturing_ = false;
  bool ret = res_capts_.get();
  capture_.close();
  if (!stop_session())
    ret = false;
  return ret;
}

bool Transcriber::push_samples(const int16_t *samples, size_t samples_num,
                               double captured_at) {
  if (!running_) {
    BOOST_LOG_TRIVIAL(warning) << "transcriber:: not running";
    return false;
  }

  /* hand-off under the accumulator lock keeps chunks in capture order */
  std::lock_guard<std::mutex> lock(accumulator_mutex_);
  accumulator_.push(samples, samples_num, captured_at);
  /* time at the end of this block, in the same clock as captured_at */
  double now = captured_at +
               samples_to_seconds(samples_num, config_.get_sample_rate());
  PipelineItem item;
  if (accumulator_.should_emit(now) && accumulator_.emit(item.chunk, now)) {
    hand_off(std::move(item));
  }
  return true;
}

bool Transcriber::stop_session() {
  if (!running_) {
    BOOST_LOG_TRIVIAL(warning) << "transcriber:: not running";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "transcriber:: ending session";
  std::lock_guard<std::mutex> lock(accumulator_mutex_);
  accumulator_.force_flush();
  PipelineItem item;
  if (accumulator_.emit(item.chunk, wall_clock_now())) {
    hand_off(std::move(item));
  }
  /* the next session starts its chunk clock from its first block */
  accumulator_.reset();

  /* queued behind the chunks already handed off */
  PipelineItem end;
  end.end_session = true;
  hand_off(std::move(end));
  return true;
}

void Transcriber::hand_off(PipelineItem &&item) {
  std::lock_guard<std::mutex> lock(pipeline_mutex_);
  pipeline_.push_back(std::move(item));
  pipeline_cond_.notify_one();
}

void Transcriber::process(AudioChunk &&chunk) {
  double captured_at = chunk.captured_at;

  ActivityVerdict verdict;
  try {
    verdict = gate_.classify(chunk);
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error)
        << "transcriber:: voice activity detection failed: " << e.what();
    /* the chunk is dropped, the segmenter keeps its state */
    if (!dispatcher_.submit_error(
            captured_at,
            std::string("voice activity detection failed: ") + e.what())) {
      BOOST_LOG_TRIVIAL(error) << "transcriber:: error submission failed";
    }
    return;
  } catch (...) {
    BOOST_LOG_TRIVIAL(error)
        << "transcriber:: voice activity detection failed: unknown error";
    if (!dispatcher_.submit_error(captured_at,
                                  "voice activity detection failed")) {
      BOOST_LOG_TRIVIAL(error) << "transcriber:: error submission failed";
    }
    return;
  }

  PendingSegment segment;
  SegmentationDecision decision;
  {
    std::lock_guard<std::mutex> lock(segmenter_mutex_);
    decision = segmenter_.process(std::move(chunk), verdict, segment);
  }

  if (decision != SegmentationDecision::Continue &&
      !dispatcher_.submit(std::move(segment), decision)) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: segment submission failed";
  }
}

void Transcriber::end_session() {
  PendingSegment segment;
  bool flushed{false};
  {
    std::lock_guard<std::mutex> lock(segmenter_mutex_);
    flushed = segmenter_.flush(segment);
    segmenter_.reset();
  }
  gate_.reset();

  if (flushed &&
      !dispatcher_.submit(std::move(segment),
                          SegmentationDecision::FlushSegment)) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: final segment submission failed";
  }
}

bool Transcriber::is_model_loaded() const {
  return detector_->is_loaded() && recognizer_->is_loaded();
}

SpeechSegmenter::State Transcriber::get_segmenter_state() const {
  std::lock_guard<std::mutex> lock(segmenter_mutex_);
  return segmenter_.state();
}

bool Transcriber::wait_idle(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  {
    std::unique_lock pipeline_lock(pipeline_mutex_);
    if (!pipeline_idle_cond_.wait_until(pipeline_lock, deadline, [&] {
          return pipeline_.empty() && !pipeline_busy_;
        })) {
      return false;
    }
  }
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return dispatcher_.wait_idle(std::max(remaining, 0ms));
}
