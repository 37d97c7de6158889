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
#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

enum class LogLevel { Info, Warning, Error };

// Asynchronous logger that writes messages to stderr and a log file.
// The file is taken from COMPA_LOG_FILE when set, otherwise
// compareports.log in the working directory.
class Logger {
public:
  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Queue a message to be logged.
  void Log(const std::string &msg);
  void Log(LogLevel level, const std::string &msg);

  // Disable the stderr copy (the file keeps receiving messages).
  void SetEchoToStderr(bool enabled);

  // Block until every queued message has been written.
  void Flush();

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::queue<std::string> queue_;
  bool done_ = false;
  bool echo_ = true;
  bool writing_ = false;
  std::thread worker_;
};
