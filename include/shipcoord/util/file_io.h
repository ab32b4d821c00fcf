#pragma once

#include <string>

namespace shipcoord {

// Finds a relative path that does not exist from the working directory by
// trying the source tree and then each parent of the working directory.
// Returns the path unchanged when nothing matches.
std::string resolve_data_path(const std::string& path);

// Throws std::runtime_error when the file cannot be read.
std::string read_text_file(const std::string& path);

// Replaces the file atomically (write to a sibling, then rename) and
// creates missing parent directories. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

void append_text_file(const std::string& path, const std::string& contents);

} // namespace shipcoord
