#pragma once

#include <string>

namespace driftgrid {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Writes go to a temporary sibling file which is then renamed over the target,
// so a crash mid-write never leaves a truncated file behind.
void write_text_file(const std::string& path, const std::string& contents);

// Same, for binary payloads (image snapshots).
void write_binary_file(const std::string& path, const std::string& bytes);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

} // namespace driftgrid
