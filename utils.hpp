//
//  utils.hpp
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

#ifndef _UTILS_HPP_
#define _UTILS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "log.hpp"

class TimeElapsed {
public:
  TimeElapsed() = delete;
  TimeElapsed(const std::string &desc) {
    desc_ = desc;
    start_ = std::chrono::steady_clock::now();
  }

  uint32_t elapsed() {
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start_;
    return elapsed.count();
  }

  ~TimeElapsed() {
    BOOST_LOG_TRIVIAL(info) << desc_ << " returned in " << elapsed() << " ms";
  }

private:
  std::chrono::steady_clock::time_point start_;
  std::string desc_;
};

/* wall-clock time in seconds since epoch, as stamped on chunks and results */
inline double wall_clock_now() {
  using namespace std::chrono;
  return duration<double>(system_clock::now().time_since_epoch()).count();
}

inline double samples_to_seconds(size_t samples, uint32_t rate) {
  return rate ? static_cast<double>(samples) / rate : 0.0;
}

#endif
