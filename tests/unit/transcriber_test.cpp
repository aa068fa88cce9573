//
//  transcriber_test.cpp
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
#include <memory>

#include "config.hpp"
#include "log.hpp"
#include "stubs.hpp"
#include "transcriber.hpp"

using namespace std::chrono_literals;
using State = SpeechSegmenter::State;

namespace {

constexpr size_t rate = 16000;
constexpr double t0 = 1000.0;

struct Fixture {
  explicit Fixture(const Config &config)
      : detector(std::make_shared<AmplitudeDetector>()),
        recognizer(std::make_shared<EchoRecognizer>()),
        transcriber(Transcriber::create(config, detector, recognizer)) {
    assert(transcriber->init());
  }
  ~Fixture() { transcriber->terminate(); }

  void push(std::vector<int16_t> &&pcm, double captured_at) {
    assert(transcriber->push_samples(pcm.data(), pcm.size(), captured_at));
  }
  std::vector<TranscriptionResult> settle() {
    assert(transcriber->wait_idle(5s));
    return transcriber->drain_results();
  }

  std::shared_ptr<AmplitudeDetector> detector;
  std::shared_ptr<EchoRecognizer> recognizer;
  std::shared_ptr<Transcriber> transcriber;
};

} // namespace

static void speech_then_segment_silence(const Config &config) {
  Fixture f(config);
  f.push(speech(3 * rate), t0);
  f.push(silence(3 * rate), t0 + 3);

  auto results = f.settle();
  assert(results.size() == 1);
  assert(results[0].text == "48000 samples");
  assert(!results[0].new_paragraph);
  assert(results[0].has_speech);
  assert(results[0].captured_at == t0);
  assert(results[0].latency_ms >= 0);
  assert(f.transcriber->get_segmenter_state() == State::Idle);
}

static void speech_then_paragraph_silence() {
  /* chunks short enough for a pause below the segment threshold */
  Config config;
  config.set_chunk_duration(1500);
  Fixture f(config);
  f.push(speech(3 * rate), t0);
  /* below the segment threshold, stays in the segment */
  f.push(silence(3 * rate / 2), t0 + 3);
  assert(f.settle().empty());
  assert(f.transcriber->get_segmenter_state() == State::Accumulating);

  f.push(silence(3 * rate), t0 + 4.5);
  auto results = f.settle();
  assert(results.size() == 1);
  assert(results[0].new_paragraph);
  assert(results[0].text == "72000 samples");
  assert(f.transcriber->get_segmenter_state() == State::Idle);

  /* further silence in Idle produces nothing */
  f.push(silence(3 * rate), t0 + 7.5);
  assert(f.settle().empty());
}

static void silence_only(const Config &config) {
  Fixture f(config);
  f.push(silence(3 * rate), t0);
  assert(f.settle().empty());
  assert(f.transcriber->get_segmenter_state() == State::Idle);
  assert(f.recognizer->calls == 0);
}

static void stop_session_flushes_everything(const Config &config) {
  Fixture f(config);
  f.push(speech(3 * rate), t0);
  /* shorter than a chunk, still buffered in the accumulator */
  f.push(speech(rate), t0 + 3);
  assert(f.settle().empty());

  assert(f.transcriber->stop_session());
  auto results = f.settle();
  assert(results.size() == 1);
  assert(results[0].text == "64000 samples");
  assert(!results[0].new_paragraph);
  assert(f.transcriber->get_segmenter_state() == State::Idle);

  /* a fresh session starts from Idle */
  f.push(speech(3 * rate), t0 + 100);
  f.push(silence(3 * rate), t0 + 103);
  results = f.settle();
  assert(results.size() == 1);
  assert(results[0].text == "48000 samples");
  assert(results[0].captured_at == t0 + 100);

  /* nothing pending, nothing delivered */
  assert(f.transcriber->stop_session());
  assert(f.settle().empty());
}

static void stop_session_drops_silence(const Config &config) {
  Fixture f(config);
  f.push(silence(rate), t0);
  assert(f.transcriber->stop_session());
  assert(f.settle().empty());
  assert(f.recognizer->calls == 0);
}

static void detector_failure(const Config &config) {
  Fixture f(config);
  f.push(speech(3 * rate), t0);
  assert(f.settle().empty());

  f.detector->fail = true;
  f.push(speech(3 * rate), t0 + 3);
  auto results = f.settle();
  assert(results.size() == 1);
  assert(results[0].error);
  assert(results[0].text.empty());
  assert(!results[0].has_speech);
  assert(results[0].captured_at == t0 + 3);
  /* the failed chunk left the segment as it was */
  assert(f.transcriber->get_segmenter_state() == State::Accumulating);

  f.detector->fail = false;
  f.push(silence(3 * rate), t0 + 6);
  results = f.settle();
  assert(results.size() == 1);
  assert(!results[0].error);
  assert(results[0].text == "48000 samples");
}

static void foreign_exceptions(const Config &config) {
  Fixture f(config);
  f.push(speech(3 * rate), t0);
  f.detector->fail_unknown = true;
  f.push(speech(3 * rate), t0 + 3);
  auto results = f.settle();
  assert(results.size() == 1);
  assert(results[0].error);
  assert(results[0].captured_at == t0 + 3);
  assert(f.transcriber->get_segmenter_state() == State::Accumulating);

  f.detector->fail_unknown = false;
  f.recognizer->fail_unknown = true;
  f.push(silence(3 * rate), t0 + 6);
  results = f.settle();
  assert(results.size() == 1);
  assert(results[0].error);
  assert(results[0].text.empty());

  /* both threads are still alive */
  f.recognizer->fail_unknown = false;
  f.push(speech(3 * rate), t0 + 9);
  f.push(silence(3 * rate), t0 + 12);
  results = f.settle();
  assert(results.size() == 1);
  assert(!results[0].error);
  assert(results[0].text == "48000 samples");
  assert(f.transcriber->terminate());
}

static void recognizer_failure(const Config &config) {
  Fixture f(config);
  f.recognizer->fail = true;
  f.push(speech(3 * rate), t0);
  f.push(silence(3 * rate), t0 + 3);
  auto results = f.settle();
  assert(results.size() == 1);
  assert(results[0].error);
  assert(results[0].text.empty());

  /* the pipeline keeps going */
  f.recognizer->fail = false;
  f.push(speech(3 * rate), t0 + 6);
  f.push(silence(3 * rate), t0 + 9);
  results = f.settle();
  assert(results.size() == 1);
  assert(!results[0].error);
}

static void results_in_capture_order() {
  Config config;
  config.set_queue_depth(3);
  Fixture f(config);
  f.recognizer->delay = 20ms;
  double at = t0;
  for (int i = 1; i <= 4; i++) {
    /* segments of increasing length */
    for (int j = 0; j < i; j++) {
      f.push(speech(3 * rate), at);
      at += 3;
    }
    f.push(silence(3 * rate), at);
    at += 3;
  }
  auto results = f.settle();
  assert(results.size() == 4);
  for (size_t i = 0; i < results.size(); i++) {
    assert(results[i].text == std::to_string((i + 1) * 3 * rate) + " samples");
    if (i > 0)
      assert(results[i].captured_at > results[i - 1].captured_at);
  }
}

static void lifecycle(const Config &config) {
  auto detector = std::make_shared<AmplitudeDetector>();
  auto recognizer = std::make_shared<EchoRecognizer>();
  auto transcriber = Transcriber::create(config, detector, recognizer);
  auto pcm = speech(rate);

  assert(!transcriber->is_running());
  assert(!transcriber->push_samples(pcm.data(), pcm.size(), t0));
  assert(!transcriber->stop_session());
  assert(transcriber->is_model_loaded());

  assert(transcriber->init());
  assert(transcriber->is_running());
  assert(transcriber->init());
  assert(transcriber->terminate());
  assert(!transcriber->is_running());
  assert(!transcriber->push_samples(pcm.data(), pcm.size(), t0));
}

int main() {
  Config config;
  config.set_log_severity(4);
  log_init(config);

  speech_then_segment_silence(config);
  speech_then_paragraph_silence();
  silence_only(config);
  stop_session_flushes_everything(config);
  stop_session_drops_silence(config);
  detector_failure(config);
  recognizer_failure(config);
  foreign_exceptions(config);
  results_in_capture_order();
  lifecycle(config);
  return 0;
}
