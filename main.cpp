//
//  main.cpp
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

#include <boost/program_options.hpp>
#include <algorithm>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <signal.h>
#include <thread>

#include "api.hpp"
#include "audio_codec.hpp"
#include "config.hpp"
#include "log.hpp"
#include "transcriber.hpp"
#include "utils.hpp"
#include "vad.hpp"
#include "whisper.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;

static const std::string version("whisper-dictate-1.0.0");
static std::atomic<bool> terminate = false;

void termination_handler(int signum) {
  BOOST_LOG_TRIVIAL(info) << "main:: got signal " << signum;
  // Terminate program
  terminate = true;
}

bool is_terminated() { return terminate.load(); }

const std::string &get_version() { return version; }

/* appends results the way a text view would, blank line on paragraphs */
static void print_results(const std::vector<TranscriptionResult> &results,
                          bool &has_text) {
  for (const auto &result : results) {
    if (result.error) {
      BOOST_LOG_TRIVIAL(error) << "main:: transcription error: "
                               << *result.error;
      continue;
    }
    if (!result.has_speech || result.text.empty())
      continue;

    if (has_text)
      std::cout << (result.new_paragraph ? "\n\n" : " ");
    std::cout << result.text << std::flush;
    has_text = true;
    BOOST_LOG_TRIVIAL(debug) << "main:: latency "
                             << static_cast<int>(result.latency_ms) << " ms";
  }
}

/* feeds a WAV file through the api in real time, as a recording client */
static bool stream_file(const Config &config, Api &api) {
  std::ifstream file(config.get_input_file(), std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "main:: cannot open "
                             << config.get_input_file();
    return false;
  }
  std::vector<uint8_t> blob((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

  PcmBuffer pcm;
  try {
    pcm = decode_wav(blob);
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "main:: cannot decode "
                             << config.get_input_file() << ": " << e.what();
    return false;
  }

  size_t block = static_cast<size_t>(pcm.sample_rate) *
                 config.get_chunk_duration() / 1000;
  if (block == 0) {
    BOOST_LOG_TRIVIAL(error) << "main:: invalid chunk duration";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "main:: streaming " << pcm.samples.size()
                          << " samples at " << pcm.sample_rate << " Hz";
  bool ret = true;
  for (size_t offset = 0; offset < pcm.samples.size() && !is_terminated();
       offset += block) {
    auto end = std::min(offset + block, pcm.samples.size());
    std::vector<int16_t> samples(pcm.samples.begin() + offset,
                                 pcm.samples.begin() + end);
    auto response = api.submit_audio(
        base64_encode(encode_wav(samples, pcm.sample_rate)), wall_clock_now());
    if (!response.ok()) {
      BOOST_LOG_TRIVIAL(error) << "main:: submit failed: " << response.error;
      ret = false;
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(config.get_chunk_duration()));
  }

  if (!api.reset_buffer().ok()) {
    ret = false;
  }
  return ret;
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("device_name,D", po::value<std::string>()->default_value("default"), "ALSA capture device name")
      ("sample_rate,r", po::value<int>()->default_value(16000), "ALSA capture sample rate")
      ("input,i", po::value<std::string>(), "Stream a WAV file instead of capturing")
      ("chunk_duration,c", po::value<int>()->default_value(3000), "Audio chunk duration in ms from 500 to 10000")
      ("segment_silence,s", po::value<float>()->default_value(2.0f, "2.0"), "Silence in seconds closing a sentence")
      ("paragraph_silence,p", po::value<float>()->default_value(4.0f, "4.0"), "Silence in seconds closing a paragraph, needs a chunk duration below segment_silence to take effect")
      ("max_segment,x", po::value<float>()->default_value(30.0f, "30.0"), "Longest segment in seconds, 0 for unlimited")
      ("queue_depth,q", po::value<int>()->default_value(1), "Segments waiting for transcription from 1 to 10")
      ("poll_interval,P", po::value<int>()->default_value(500), "Result poll interval in ms")
      ("language,l", po::value<std::string>()->default_value("en"), "Whisper default language")
      ("model,m", po::value<std::string>()->default_value("models/ggml-base.en.bin"), "Whisper model to use")
      ("openvino_device,o", po::value<std::string>()->default_value("CPU"), "Whisper openvino device to use")
      ("threads,t", po::value<int>()->default_value(4), "Inference threads")
      ("use_context,u", po::value<bool>()->default_value(false), "Whisper enable/disable token context")
      ("vad_model,a", po::value<std::string>()->default_value("models/ggml-silero-v5.1.2.bin"), "Silero VAD model to use")
      ("vad_threshold,e", po::value<float>()->default_value(0.5f, "0.5"), "VAD speech probability threshold")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("help,h", "Print this help " "message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    po::notify(vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << '\n' << desc << '\n';
      return EXIT_SUCCESS;
    }

  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  signal(SIGINT, termination_handler);
  signal(SIGTERM, termination_handler);
  signal(SIGCHLD, SIG_IGN);

  Config config;
  config.set_device_name(vm["device_name"].as<std::string>());
  config.set_capture_rate(vm["sample_rate"].as<int>());
  if (vm.count("input")) {
    config.set_input_file(vm["input"].as<std::string>());
  }
  int chunk_duration = vm["chunk_duration"].as<int>();
  int queue_depth = vm["queue_depth"].as<int>();
  if (!Config::is_valid_chunk_duration(chunk_duration)) {
    std::cerr << "chunk_duration must be between 500 and 10000 ms\n";
    return EXIT_FAILURE;
  }
  if (!Config::is_valid_queue_depth(queue_depth)) {
    std::cerr << "queue_depth must be between 1 and 10\n";
    return EXIT_FAILURE;
  }
  config.set_chunk_duration(chunk_duration);
  config.set_segment_silence(vm["segment_silence"].as<float>());
  config.set_paragraph_silence(vm["paragraph_silence"].as<float>());
  config.set_max_segment(vm["max_segment"].as<float>());
  config.set_queue_depth(queue_depth);
  config.set_poll_interval(vm["poll_interval"].as<int>());
  config.set_log_severity(vm["log_level"].as<int>());
  config.set_language(vm["language"].as<std::string>());
  config.set_model(vm["model"].as<std::string>());
  config.set_openvino_device(vm["openvino_device"].as<std::string>());
  config.set_threads(vm["threads"].as<int>());
  config.set_vad_model(vm["vad_model"].as<std::string>());
  config.set_vad_threshold(vm["vad_threshold"].as<float>());
  config.set_use_context(vm["use_context"].as<bool>());

  /* init logging */
  log_init(config);


  BOOST_LOG_TRIVIAL(debug) << "main:: initializing ...";
  try {
    auto whisper = std::make_shared<Whisper>(config);
    if (!whisper->init()) {
      throw std::runtime_error(std::string("main:: Whisper init failed"));
    }
    auto vad = std::make_shared<SileroVad>(config);
    if (!vad->init()) {
      throw std::runtime_error(std::string("main:: VAD init failed"));
    }

    auto transcriber = Transcriber::create(config, vad, whisper);
    if (!transcriber->init()) {
      throw std::runtime_error(std::string("main:: Transcriber init failed"));
    }
    Api api(config, transcriber);
    BOOST_LOG_TRIVIAL(info) << "main:: model loaded: "
                            << api.get_status().model_loaded;

    std::future<bool> res_input;
    if (!config.get_input_file().empty()) {
      res_input = std::async(std::launch::async,
                             [&]() { return stream_file(config, api); });
    } else if (!transcriber->start_capture()) {
      throw std::runtime_error(
          std::string("main:: Transcriber start capture failed"));
    }

    BOOST_LOG_TRIVIAL(debug) << "main:: init done, entering loop...";

    bool has_text{false};
    auto poll = std::chrono::milliseconds(config.get_poll_interval());
    while (!is_terminated()) {
      if (res_input.valid() &&
          res_input.wait_for(poll) == std::future_status::ready) {
        break;
      } else if (!res_input.valid()) {
        std::this_thread::sleep_for(poll);
      }
      print_results(api.drain_results(), has_text);
    }

    if (res_input.valid() && !res_input.get()) {
      rc = EXIT_FAILURE;
    }
    if (!transcriber->stop_capture()) {
      throw std::runtime_error(
          std::string("main:: Transcriber stop capture failed"));
    }

    /* let the last segments come through */
    if (!transcriber->wait_idle(std::chrono::seconds(60))) {
      BOOST_LOG_TRIVIAL(warning) << "main:: pending transcriptions timed out";
    }
    print_results(api.drain_results(), has_text);
    if (has_text)
      std::cout << std::endl;

    if (!transcriber->terminate()) {
      throw std::runtime_error(std::string("main:: terminate failed"));
    }
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  return rc;
}
