//
//  transcriber.hpp
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

#ifndef _TRANSCRIBER_HPP_
#define _TRANSCRIBER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "capture.hpp"
#include "chunk_accumulator.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "recognizer.hpp"
#include "result_queue.hpp"
#include "segmenter.hpp"
#include "voice_activity.hpp"

/*
 * Capture thread:  Capture -> ChunkAccumulator -> pipeline queue
 * Pipeline thread: VoiceActivityGate -> SpeechSegmenter -> dispatcher
 * Dispatcher:      SpeechRecognizer -> ResultQueue
 */
class Transcriber {
public:
  static std::shared_ptr<Transcriber>
  create(const Config &config, std::shared_ptr<VoiceActivityDetector> detector,
         std::shared_ptr<SpeechRecognizer> recognizer);
  Transcriber() = delete;
  Transcriber(const Transcriber &) = delete;
  ~Transcriber();

  bool init();
  bool terminate();

  bool start_capture();
  bool stop_capture();

  /* entry point of every sample source, never waits on inference */
  bool push_samples(const int16_t *samples, size_t samples_num,
                    double captured_at);
  /* flushes the partial chunk and the pending segment, then back to Idle */
  bool stop_session();

  std::vector<TranscriptionResult> drain_results() { return results_.drain(); }
  bool is_model_loaded() const;
  bool is_running() const { return running_; }
  SpeechSegmenter::State get_segmenter_state() const;

  /* waits until every handed-off chunk has produced its results */
  bool wait_idle(std::chrono::milliseconds timeout);

protected:
  Transcriber(const Config &config,
              std::shared_ptr<VoiceActivityDetector> detector,
              std::shared_ptr<SpeechRecognizer> recognizer);

private:
  struct PipelineItem {
    AudioChunk chunk;
    bool end_session{false};
  };

  void hand_off(PipelineItem &&item);
  void process(AudioChunk &&chunk);
  void end_session();

  const Config &config_;
  std::shared_ptr<VoiceActivityDetector> detector_;
  std::shared_ptr<SpeechRecognizer> recognizer_;

  std::mutex accumulator_mutex_;
  ChunkAccumulator accumulator_;
  VoiceActivityGate gate_;
  mutable std::mutex segmenter_mutex_;
  SpeechSegmenter segmenter_;
  ResultQueue results_;
  TranscriptionDispatcher dispatcher_;

  std::mutex pipeline_mutex_;
  std::condition_variable pipeline_cond_;
  std::condition_variable pipeline_idle_cond_;
  std::deque<PipelineItem> pipeline_;
  bool pipeline_busy_{false};

  std::future<bool> res_pipeline_;
  std::future<bool> res_capts_;
  std::atomic_bool running_{false};
  std::atomic_bool capturing_{false};
  Capture capture_;
};

#endif
