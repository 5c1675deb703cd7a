/* @file FileLogger.cpp
 * @brief buffered fopen/fwrite append writer
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

// Pantheon headers
#include "io/FileLogger.hpp"

using namespace pantheon::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kFlushThreshold);
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (!fp_)
    return false;

  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kFlushThreshold)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t n = std::fwrite(buffer_.data() + total, 1, buffer_.size() - total, fp_);
    if (n == 0) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
      return false;
    }
    total += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "[FileLogger] " << buffer_.size() << " buffered bytes lost on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}
