//
//  api.hpp
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

#ifndef _API_HPP_
#define _API_HPP_

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "transcriber.hpp"
#include "types.hpp"

struct ApiResponse {
  std::string status{"ok"};
  std::string error;

  bool ok() const { return status == "ok"; }
  static ApiResponse failure(const std::string &error) {
    return ApiResponse{"error", error};
  }
};

struct ApiStatus {
  bool model_loaded{false};
};

/* consumer side of the pipeline: push encoded audio, poll for results */
class Api {
public:
  Api(const Config &config, std::shared_ptr<Transcriber> transcriber);

  /* base64 WAV blob, pipeline state is untouched when decoding fails */
  ApiResponse submit_audio(const std::string &audio_base64, double captured_at);
  std::vector<TranscriptionResult> drain_results();
  ApiStatus get_status() const;
  /* ends the recording session, see Transcriber::stop_session() */
  ApiResponse reset_buffer();

private:
  const Config &config_;
  std::shared_ptr<Transcriber> transcriber_;
};

#endif
