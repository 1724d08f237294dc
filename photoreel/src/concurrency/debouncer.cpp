//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "concurrency/debouncer.hpp"

namespace photoreel {

FrameCoalescer::FrameCoalescer(int frame_interval_ms, Callback callback)
    : callback_(std::move(callback)) {
  timer_.setSingleShot(true);
  timer_.setInterval(frame_interval_ms);
  timer_.setTimerType(Qt::PreciseTimer);
  QObject::connect(&timer_, &QTimer::timeout, &timer_, [this]() {
    if (callback_) {
      callback_();
    }
  });
}

void FrameCoalescer::Trigger() {
  if (!timer_.isActive()) {
    timer_.start();
  }
}

TrailingDebouncer::TrailingDebouncer(int quiet_ms, Callback callback)
    : callback_(std::move(callback)) {
  timer_.setSingleShot(true);
  timer_.setInterval(quiet_ms);
  QObject::connect(&timer_, &QTimer::timeout, &timer_, [this]() {
    if (callback_) {
      callback_();
    }
  });
}

void TrailingDebouncer::Trigger() { timer_.start(); }
};  // namespace photoreel
