#pragma once

#include <chrono>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Sleep for a chrono duration (no-op for zero or negative durations).
void sleep_for(std::chrono::milliseconds duration);

} // namespace platform
