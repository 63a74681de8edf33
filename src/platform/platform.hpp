#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Per-user runtime directory: XDG_RUNTIME_DIR, else /tmp/wprs-<uid>
// (created owner-only).
std::filesystem::path runtime_dir();

// Short local hostname as reported by gethostname().
std::string hostname();

// Value of an environment variable, "" if unset.
std::string getenv_or_empty(const char* name);

// Create a directory (and parents) and restrict it to the owner (0700).
// Returns false if it could not be created or locked down.
bool ensure_private_dir(const std::filesystem::path& dir);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
