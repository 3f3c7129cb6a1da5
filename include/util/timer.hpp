#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// for printing to the command line in colors
#define RED    "\033[0;31m"
#define GREEN  "\033[0;32m"
#define WHITE  "\033[0;37m"
#define RESET  "\033[0m"

/**
 * times consecutive phases of a run and prints one tagged line per phase,
 * e.g. "[ keygen ] sample S and P  : 0.412 ms"
 */
class Timer {
public:
  void start(const std::string& tag, const std::string& what, const char* color = WHITE) {
    this->label = "[" + centered(tag, 8) + "] " + what;
    this->color = color;
    this->begin = std::chrono::steady_clock::now();
  }

  // returns the phase duration in milliseconds
  double stop() {
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - begin;
    phases_.emplace_back(label, elapsed.count());

    std::cout << color << std::left << std::setw(32) << label << ": "
              << std::fixed << std::setprecision(3) << elapsed.count() << " ms"
              << RESET << std::endl;
    return elapsed.count();
  }

  double total() const {
    double sum = 0;
    for (const auto& phase : phases_) { sum += phase.second; }
    return sum;
  }

private:
  static std::string centered(const std::string& text, size_t width) {
    if (text.size() >= width) { return text; }
    size_t left = (width - text.size()) / 2;
    return std::string(left, ' ') + text + std::string(width - text.size() - left, ' ');
  }

  std::string label;
  const char* color = WHITE;
  std::chrono::steady_clock::time_point begin;
  std::vector<std::pair<std::string, double>> phases_;
};
