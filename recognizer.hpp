//
//  recognizer.hpp
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

#ifndef _RECOGNIZER_HPP_
#define _RECOGNIZER_HPP_

#include <cstdint>
#include <string>
#include <vector>

class SpeechRecognizer {
public:
  virtual ~SpeechRecognizer() = default;

  /* trimmed transcript of 16 kHz mono pcm, throws on failure */
  virtual std::string infer(const std::vector<int16_t> &pcm) = 0;
  virtual bool is_loaded() const { return true; }
};

/* true for "", "[BLANK_AUDIO]", "(music)" and other lone non-speech markers */
bool is_blank_transcript(const std::string &text);

#endif
