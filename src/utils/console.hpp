#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// HH:MM:SS.mmm, local time
std::string get_timestamp();

std::string format_size(size_t bytes);

void print_banner(const std::string &title);

void print_step(const std::string &title);

void print_ok(const std::string &message);

void print_detail(const std::string &label, const std::string &value);

void print_warning(const std::string &message);

void print_error(const std::string &message);

// Green box with aligned "label: value" rows, closing a successful stage.
void print_summary_box(const std::string &title,
                       const std::vector<std::pair<std::string, std::string>> &rows);

void log_request(const std::string &method, const std::string &path,
                 int status, size_t bytes);

#endif // CONSOLE_HPP
