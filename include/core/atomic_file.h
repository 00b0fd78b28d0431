#pragma once

#include <filesystem>
#include <string>

namespace prerender::atomic_file {

// Writes content to "<target>.tmp" and renames it over target, so a reader
// (the concat demuxer, a stats scraper) never sees a half-written file.
// On failure the temp file is removed and error describes the step.
bool replace(const std::filesystem::path& target, const std::string& content, std::string& error);

// Missing-file tolerant remove. Returns false only on a real I/O error.
bool removeIfExists(const std::filesystem::path& path);

}  // namespace prerender::atomic_file
