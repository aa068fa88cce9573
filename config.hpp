//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

class Config {
 public:
  uint32_t get_sample_rate() const { return sample_rate_; }
  uint32_t get_capture_rate() const { return capture_rate_; }
  uint16_t get_chunk_duration() const { return chunk_duration_; }
  float get_segment_silence() const { return segment_silence_; }
  float get_paragraph_silence() const { return paragraph_silence_; }
  float get_max_segment() const { return max_segment_; }
  uint8_t get_queue_depth() const { return queue_depth_; }
  uint16_t get_poll_interval() const { return poll_interval_; }
  const std::string& get_model() const { return model_; }
  const std::string& get_language() const { return language_; }
  const std::string& get_openvino_device() const { return openvino_device_; }
  int get_threads() const { return threads_; }
  int get_log_severity() const { return log_severity_; };
  const std::string& get_device_name() const { return device_name_; };
  const std::string& get_input_file() const { return input_file_; };
  bool get_use_context() const { return use_context_; };
  const std::string& get_vad_model() const { return vad_model_; };
  float get_vad_threshold() const { return vad_threshold_; };

  /* command line values are checked before narrowing into the setters */
  static bool is_valid_chunk_duration(int ms) {
    return ms >= 500 && ms <= 10000;
  }
  static bool is_valid_queue_depth(int depth) {
    return depth >= 1 && depth <= 10;
  }

  void set_capture_rate(uint32_t capture_rate) { capture_rate_ = capture_rate; }
  void set_chunk_duration(uint16_t chunk_duration) {
    chunk_duration_ = chunk_duration;
  }
  void set_segment_silence(float segment_silence) {
    segment_silence_ = segment_silence;
  }
  void set_paragraph_silence(float paragraph_silence) {
    paragraph_silence_ = paragraph_silence;
  }
  void set_max_segment(float max_segment) { max_segment_ = max_segment; }
  void set_queue_depth(uint8_t queue_depth) { queue_depth_ = queue_depth; }
  void set_poll_interval(uint16_t poll_interval) {
    poll_interval_ = poll_interval;
  }
  void set_model(const std::string& model) { model_ = model; }
  void set_language(const std::string& language) { language_ = language; }
  void set_openvino_device(const std::string& openvino_device) {
    openvino_device_ = openvino_device;
  }
  void set_threads(int threads) { threads_ = threads; }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };
  void set_device_name(std::string_view device_name) {
    device_name_ = device_name;
  };
  void set_input_file(std::string_view input_file) {
    input_file_ = input_file;
  };
  void set_use_context(bool use_context) { use_context_ = use_context; };
  void set_vad_model(const std::string& vad_model) { vad_model_ = vad_model; };
  void set_vad_threshold(float vad_threshold) {
    vad_threshold_ = vad_threshold;
  };

 private:
  /* pipeline rate, fixed by both models */
  uint32_t sample_rate_{16000};
  uint32_t capture_rate_{16000};
  uint16_t chunk_duration_{3000};
  float segment_silence_{2.0f};
  float paragraph_silence_{4.0f};
  float max_segment_{30.0f};
  uint8_t queue_depth_{1};
  uint16_t poll_interval_{500};
  std::string model_{"./models/ggml-base.en.bin"};
  std::string language_{"en"};
  std::string openvino_device_{"CPU"};
  int threads_{4};
  int log_severity_{2};
  std::string device_name_{"default"};
  std::string input_file_;
  bool use_context_{false};
  std::string vad_model_{"./models/ggml-silero-v5.1.2.bin"};
  float vad_threshold_{0.5f};
};

#endif
