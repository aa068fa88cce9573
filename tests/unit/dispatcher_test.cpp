//
//  dispatcher_test.cpp
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
#include <stdexcept>

#include "config.hpp"
#include "dispatcher.hpp"
#include "stubs.hpp"
#include "utils.hpp"

using namespace std::chrono_literals;

/* short segments take longest, results must still keep submission order */
class SlowShortRecognizer : public SpeechRecognizer {
public:
  std::string infer(const std::vector<int16_t> &pcm) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(
        pcm.size() < 1000 ? 80 : 5));
    return std::to_string(pcm.size());
  }
};

static PendingSegment segment_of(size_t samples, double captured_at) {
  PendingSegment segment;
  segment.samples = speech(samples);
  segment.captured_at = captured_at;
  return segment;
}

static void keeps_submission_order() {
  Config config;
  config.set_queue_depth(3);
  ResultQueue results;
  TranscriptionDispatcher dispatcher(
      config, std::make_shared<SlowShortRecognizer>(), results);
  assert(dispatcher.start());

  double now = wall_clock_now();
  assert(dispatcher.submit(segment_of(100, now), SegmentationDecision::FlushSegment));
  assert(dispatcher.submit(segment_of(5000, now),
                           SegmentationDecision::FlushParagraph));
  assert(dispatcher.submit(segment_of(200, now), SegmentationDecision::FlushSegment));
  assert(dispatcher.submit(segment_of(6000, now), SegmentationDecision::FlushSegment));
  assert(dispatcher.wait_idle(5s));

  auto out = results.drain();
  assert(out.size() == 4);
  assert(out[0].text == "100");
  assert(out[1].text == "5000");
  assert(out[1].new_paragraph);
  assert(out[2].text == "200");
  assert(!out[2].new_paragraph);
  assert(out[3].text == "6000");
  for (auto &r : out) {
    assert(r.has_speech);
    assert(!r.error);
    assert(r.latency_ms >= 0);
    assert(r.transcribed_at >= r.captured_at);
  }
  assert(dispatcher.stop());
}

static void submit_blocks_on_full_queue() {
  Config config;
  config.set_queue_depth(1);
  ResultQueue results;
  auto recognizer = std::make_shared<EchoRecognizer>();
  recognizer->delay = 30ms;
  TranscriptionDispatcher dispatcher(config, recognizer, results);
  assert(dispatcher.start());

  for (int i = 1; i <= 5; i++) {
    assert(dispatcher.submit(segment_of(i * 10, wall_clock_now()),
                             SegmentationDecision::FlushSegment));
    assert(dispatcher.get_queued() <= 2);
  }
  assert(dispatcher.wait_idle(5s));
  auto out = results.drain();
  assert(out.size() == 5);
  for (int i = 0; i < 5; i++)
    assert(out[i].text == std::to_string((i + 1) * 10) + " samples");
  assert(recognizer->calls == 5);
}

static void failures_become_error_results() {
  Config config;
  ResultQueue results;
  auto recognizer = std::make_shared<EchoRecognizer>();
  TranscriptionDispatcher dispatcher(config, recognizer, results);
  assert(dispatcher.start());

  recognizer->fail = true;
  assert(dispatcher.submit(segment_of(1600, wall_clock_now()),
                           SegmentationDecision::FlushParagraph));
  assert(dispatcher.wait_idle(5s));
  recognizer->fail = false;
  assert(dispatcher.submit_error(wall_clock_now(), "detector failure"));
  assert(dispatcher.submit(segment_of(1600, wall_clock_now()),
                           SegmentationDecision::FlushSegment));
  assert(dispatcher.wait_idle(5s));

  auto out = results.drain();
  assert(out.size() == 3);
  assert(out[0].error);
  assert(*out[0].error == "recognizer failure");
  assert(out[0].text.empty());
  assert(!out[0].has_speech);
  assert(!out[0].new_paragraph);
  assert(out[1].error);
  assert(*out[1].error == "detector failure");
  assert(out[1].text.empty());
  assert(!out[2].error);
  assert(out[2].text == "1600 samples");
  /* error jobs never reach the recognizer */
  assert(recognizer->calls == 2);
}

static void foreign_exceptions_become_error_results() {
  Config config;
  ResultQueue results;
  auto recognizer = std::make_shared<EchoRecognizer>();
  TranscriptionDispatcher dispatcher(config, recognizer, results);
  assert(dispatcher.start());

  recognizer->fail_unknown = true;
  assert(dispatcher.submit(segment_of(1600, wall_clock_now()),
                           SegmentationDecision::FlushParagraph));
  assert(dispatcher.wait_idle(5s));
  auto out = results.drain();
  assert(out.size() == 1);
  assert(out[0].error);
  assert(!out[0].error->empty());
  assert(out[0].text.empty());
  assert(!out[0].has_speech);
  assert(!out[0].new_paragraph);

  /* the worker survived */
  recognizer->fail_unknown = false;
  assert(dispatcher.submit(segment_of(1600, wall_clock_now()),
                           SegmentationDecision::FlushSegment));
  assert(dispatcher.wait_idle(5s));
  out = results.drain();
  assert(out.size() == 1);
  assert(!out[0].error);
  assert(out[0].text == "1600 samples");
  assert(dispatcher.stop());
}

static void blank_transcript_is_delivered() {
  Config config;
  ResultQueue results;
  auto recognizer = std::make_shared<EchoRecognizer>();
  recognizer->blank = true;
  TranscriptionDispatcher dispatcher(config, recognizer, results);
  assert(dispatcher.start());
  assert(dispatcher.submit(segment_of(1600, wall_clock_now()),
                           SegmentationDecision::FlushSegment));
  assert(dispatcher.wait_idle(5s));
  auto out = results.drain();
  assert(out.size() == 1);
  assert(out[0].text.empty());
  assert(out[0].has_speech);
  assert(!out[0].error);
}

static void latency_is_never_negative() {
  Config config;
  ResultQueue results;
  TranscriptionDispatcher dispatcher(
      config, std::make_shared<EchoRecognizer>(), results);
  assert(dispatcher.start());

  double ahead = wall_clock_now() + 100;
  assert(dispatcher.submit(segment_of(160, ahead),
                           SegmentationDecision::FlushSegment));
  double before = wall_clock_now() - 2;
  assert(dispatcher.submit(segment_of(160, before),
                           SegmentationDecision::FlushSegment));
  assert(dispatcher.wait_idle(5s));

  auto out = results.drain();
  assert(out.size() == 2);
  assert(out[0].latency_ms == 0);
  assert(out[0].transcribed_at == ahead);
  assert(out[1].latency_ms >= 2000);
}

static void rejects_empty_and_stopped() {
  Config config;
  ResultQueue results;
  TranscriptionDispatcher dispatcher(
      config, std::make_shared<EchoRecognizer>(), results);

  /* not started yet */
  assert(!dispatcher.submit(segment_of(160, 0),
                            SegmentationDecision::FlushSegment));
  assert(dispatcher.start());
  assert(dispatcher.is_running());
  assert(!dispatcher.submit(PendingSegment{}, SegmentationDecision::FlushSegment));
  assert(!dispatcher.submit(segment_of(160, 0), SegmentationDecision::Continue));
  assert(dispatcher.stop());
  assert(!dispatcher.is_running());
  assert(!dispatcher.submit(segment_of(160, 0),
                            SegmentationDecision::FlushSegment));
  assert(results.drain().empty());

  bool thrown{false};
  try {
    TranscriptionDispatcher broken(config, nullptr, results);
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);
}

static void stop_drains_queued_jobs() {
  Config config;
  config.set_queue_depth(4);
  ResultQueue results;
  auto recognizer = std::make_shared<EchoRecognizer>();
  recognizer->delay = 20ms;
  TranscriptionDispatcher dispatcher(config, recognizer, results);
  assert(dispatcher.start());
  for (int i = 0; i < 4; i++) {
    assert(dispatcher.submit(segment_of(160, wall_clock_now()),
                             SegmentationDecision::FlushSegment));
  }
  assert(dispatcher.stop(true));
  assert(results.size() == 4);
}

int main() {
  keeps_submission_order();
  submit_blocks_on_full_queue();
  failures_become_error_results();
  foreign_exceptions_become_error_results();
  blank_transcript_is_delivered();
  latency_is_never_negative();
  rejects_empty_and_stopped();
  stop_drains_queued_jobs();
  return 0;
}
