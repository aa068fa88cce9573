//
//  recognizer.cpp
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

#include "recognizer.hpp"

bool is_blank_transcript(const std::string &text) {
  if (text.empty())
    return true;

  char close;
  switch (text.front()) {
  case '[':
    close = ']';
    break;
  case '(':
    close = ')';
    break;
  default:
    return false;
  }
  /* a single marker, "[Music] hello [Music]" still carries words */
  return text.find(close) == text.size() - 1;
}
