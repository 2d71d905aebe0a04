#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace blitz::atomic_file {

/**
 * @brief Replace path with contents so readers see either the old or the new file.
 *
 * Writes a temporary sibling (same directory, hence same filesystem), flushes
 * it to disk and renames it over path. Parent directories are created.
 *
 * @return false when any step fails; path is then left untouched.
 */
bool write(std::filesystem::path const& path, std::string const& contents);

/**
 * @brief Append one line (a trailing newline is added) without touching prior bytes.
 *
 * The new file is the old file's bytes followed by the line, published with
 * write(). A missing file is created.
 */
bool append_line(std::filesystem::path const& path, std::string const& line);

/// Whole file contents, nullopt if it cannot be opened.
std::optional<std::string> read(std::filesystem::path const& path);

} // namespace blitz::atomic_file
