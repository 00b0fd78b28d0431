#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace prerender::media {

struct TrackMetadata {
    std::string title;     // required
    std::string filename;  // required
    std::string artist;
    std::string comments;
};

// Greedy word wrap at spaces. Words longer than width are kept whole.
std::vector<std::string> wrapLine(const std::string& line, std::size_t width);

// Text overlay drawn over the visualiser:
//   Title: ..., Artist: ... (if any), Filename: ..., Comments: (if any)
// Every line wrapped to lineWidth columns.
std::string composeMetadataCard(const TrackMetadata& metadata, std::size_t lineWidth);

bool writeMetadataCard(const std::filesystem::path& path, const std::string& text);

}  // namespace prerender::media
