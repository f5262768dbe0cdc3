#include "dncbench/log.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <utility>

namespace dncbench::log {

namespace {

std::mutex g_mu;
Level g_level = Level::info;
std::ofstream g_file;

std::string timestamp() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

} // namespace

std::string_view level_name(Level l) {
  switch (l) {
  case Level::debug:
    return "DEBUG";
  case Level::info:
    return "INFO";
  case Level::warning:
    return "WARNING";
  case Level::error:
    return "ERROR";
  }
  return "INFO";
}

std::optional<Level> parse_level(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (s == "DEBUG")
    return Level::debug;
  if (s == "INFO")
    return Level::info;
  if (s == "WARNING" || s == "WARN")
    return Level::warning;
  if (s == "ERROR")
    return Level::error;
  return std::nullopt;
}

void set_level(Level l) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_level = l;
}

Level level() {
  std::lock_guard<std::mutex> lk(g_mu);
  return g_level;
}

bool open_file(const std::string &path) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file.is_open())
    g_file.close();
  g_file.open(path, std::ios::out | std::ios::app);
  return g_file.is_open();
}

void close_file() {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file.is_open())
    g_file.close();
}

void write(Level l, std::string_view msg) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (static_cast<int>(l) < static_cast<int>(g_level))
    return;
  std::string line = timestamp();
  line += " - dncbench - ";
  line += level_name(l);
  line += " - ";
  line += msg;
  line += '\n';
  std::cerr << line;
  if (g_file.is_open()) {
    g_file << line;
    g_file.flush();
  }
}

} // namespace dncbench::log
