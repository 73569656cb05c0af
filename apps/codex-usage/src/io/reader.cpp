#include "reader.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace usage {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

} // namespace

bool readLogFile(const std::string& path, const LineSink& sink, Metrics& metrics) {
  std::ifstream input(path);
  if (!input.is_open()) {
    std::cerr << "Failed to open log file: " << path << "\n";
    return false;
  }

  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    metrics.incrementRead();
    sink(line);
  }
  return true;
}

LogTail::LogTail(std::string path) : path_(std::move(path)) {}

bool LogTail::poll(const LineSink& sink, Metrics& metrics) {
  std::ifstream input(path_, std::ios::binary);
  if (!input.is_open()) {
    return false;
  }

  input.seekg(0, std::ios::end);
  const std::streamoff size = input.tellg();
  if (size < 0) {
    return false;
  }
  if (static_cast<std::uintmax_t>(size) < offset_) {
    offset_ = 0;
    partial_.clear();
  }
  input.seekg(static_cast<std::streamoff>(offset_), std::ios::beg);

  std::string chunk(kReadChunkBytes, '\0');
  while (input.read(&chunk[0], static_cast<std::streamsize>(chunk.size())) || input.gcount() > 0) {
    const std::size_t got = static_cast<std::size_t>(input.gcount());
    offset_ += got;
    partial_.append(chunk, 0, got);

    std::size_t begin = 0;
    std::size_t newline = partial_.find('\n', begin);
    while (newline != std::string::npos) {
      std::string line = partial_.substr(begin, newline - begin);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      metrics.incrementRead();
      sink(line);
      begin = newline + 1;
      newline = partial_.find('\n', begin);
    }
    partial_.erase(0, begin);
  }
  return true;
}

} // namespace usage
