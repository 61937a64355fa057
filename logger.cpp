#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

#include "config.hpp"

static std::mutex log_mutex;
static std::string log_path = LOG_FILE;

void set_log_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_path = path;
}

void logMessage(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::ofstream logFile(log_path, std::ios_base::app);
  if (!logFile) {
    std::cerr << "Failed to open log file." << std::endl;
    return;
  }
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local_time{};
  localtime_r(&now, &local_time);
  logFile << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S") << " " << message
          << std::endl;
}
