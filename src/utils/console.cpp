#include "console.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <termcolor/termcolor.hpp>

std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string format_size(size_t bytes) {
  const char *units[] = {"B", "KB", "MB", "GB"};
  int unit = 0;
  double size = bytes;

  while (size >= 1024 && unit < 3) {
    size /= 1024;
    unit++;
  }

  std::stringstream ss;
  ss << std::fixed << std::setprecision(1) << size << " " << units[unit];
  return ss.str();
}

void print_banner(const std::string &title) {
  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║  " << std::setw(41) << std::left << title << "║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n";
}

void print_step(const std::string &title) {
  std::cout << "\n"
            << termcolor::bright_cyan << "▶ " << title << termcolor::reset
            << "\n";
}

void print_ok(const std::string &message) {
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << message << "\n";
}

void print_detail(const std::string &label, const std::string &value) {
  std::cout << termcolor::bright_blue << "    " << label << ": "
            << termcolor::reset << termcolor::white << value
            << termcolor::reset << "\n";
}

void print_warning(const std::string &message) {
  std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

void print_error(const std::string &message) {
  std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
            << message << "\n";
}

void print_summary_box(
    const std::string &title,
    const std::vector<std::pair<std::string, std::string>> &rows) {
  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║  " << std::setw(41) << std::left << title << "║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";

  for (const auto &[label, value] : rows) {
    std::cout << termcolor::bright_green << "║  " << termcolor::reset
              << std::setw(10) << std::left << (label + ":")
              << termcolor::bright_white << std::setw(31) << std::left
              << value << termcolor::reset << termcolor::bright_green << "║"
              << termcolor::reset << "\n";
  }

  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";
}

void log_request(const std::string &method, const std::string &path,
                 int status, size_t bytes) {
  std::cout << termcolor::bright_blue << "[" << get_timestamp() << "]"
            << termcolor::reset << " ";

  if (method == "GET") {
    std::cout << termcolor::bright_cyan;
  } else if (method == "HEAD") {
    std::cout << termcolor::bright_magenta;
  } else {
    std::cout << termcolor::bright_yellow;
  }
  std::cout << method << termcolor::reset << " ";

  std::cout << termcolor::white << std::setw(30) << std::left << path
            << termcolor::reset << " ";

  if (status >= 200 && status < 300) {
    std::cout << termcolor::bright_green;
  } else if (status >= 300 && status < 400) {
    std::cout << termcolor::bright_yellow;
  } else if (status >= 400 && status < 500) {
    std::cout << termcolor::bright_red;
  } else {
    std::cout << termcolor::red << termcolor::bold;
  }
  std::cout << status << termcolor::reset << " " << termcolor::bright_blue
            << format_size(bytes) << termcolor::reset << std::endl;
}
