// Leveled diagnostics on stderr with an optional mirror file.
// Line format: "YYYY-MM-DD HH:MM:SS - dncbench - LEVEL - message".

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dncbench::log {

enum class Level : int { debug = 0, info = 1, warning = 2, error = 3 };

std::string_view level_name(Level l);
std::optional<Level> parse_level(std::string s);

void set_level(Level l);
Level level();

// Appends to `path`; returns false if it cannot be opened.
bool open_file(const std::string &path);
void close_file();

// Thread-safe. Messages below the current level are dropped.
void write(Level l, std::string_view msg);

inline void debug(std::string_view msg) { write(Level::debug, msg); }
inline void info(std::string_view msg) { write(Level::info, msg); }
inline void warning(std::string_view msg) { write(Level::warning, msg); }
inline void error(std::string_view msg) { write(Level::error, msg); }

} // namespace dncbench::log
