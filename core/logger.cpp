/*
 * This file is part of CompaReports.
 * Copyright (C) 2025 Luisma Peramato
 *
 * CompaReports is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * CompaReports is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with CompaReports. If not, see <https://www.gnu.org/licenses/>.
 */
#include "logger.h"

#include <cstdlib>
#include <iostream>

namespace {
const char *LevelPrefix(LogLevel level) {
  switch (level) {
  case LogLevel::Warning:
    return "[warn] ";
  case LogLevel::Error:
    return "[error] ";
  case LogLevel::Info:
  default:
    return "";
  }
}
} // namespace

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() {
  const char *path = std::getenv("COMPA_LOG_FILE");
  file_.open(path && *path ? path : "compareports.log",
             std::ios::out | std::ios::trunc);
  worker_ = std::thread(&Logger::Worker, this);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
  if (file_.is_open())
    file_.close();
}

void Logger::Log(const std::string &msg) { Log(LogLevel::Info, msg); }

void Logger::Log(LogLevel level, const std::string &msg) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(LevelPrefix(level) + msg);
  }
  cv_.notify_one();
}

void Logger::SetEchoToStderr(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = enabled;
}

void Logger::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this] { return queue_.empty() && !writing_; });
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return done_ || !queue_.empty(); });
    if (done_ && queue_.empty())
      break;
    auto msg = queue_.front();
    queue_.pop();
    bool echo = echo_;
    writing_ = true;
    lock.unlock();
    if (file_.is_open()) {
      file_ << msg << std::endl;
      file_.flush();
    }
    if (echo)
      std::cerr << msg << std::endl;
    lock.lock();
    writing_ = false;
    if (queue_.empty())
      drained_.notify_all();
  }
  drained_.notify_all();
}
