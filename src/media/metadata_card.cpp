#include "media/metadata_card.h"

#include <fstream>
#include <sstream>

namespace prerender::media {

std::vector<std::string> wrapLine(const std::string& line, std::size_t width) {
    std::vector<std::string> out;
    if (width == 0 || line.size() <= width) {
        out.push_back(line);
        return out;
    }

    std::string current;
    std::istringstream words(line);
    std::string word;
    while (words >> word) {
        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= width) {
            current += ' ';
            current += word;
        } else {
            out.push_back(current);
            current = word;
        }
    }
    if (!current.empty() || out.empty()) {
        out.push_back(current);
    }
    return out;
}

std::string composeMetadataCard(const TrackMetadata& metadata, std::size_t lineWidth) {
    std::vector<std::string> lines;
    lines.push_back("Title: " + metadata.title);
    if (!metadata.artist.empty()) {
        lines.push_back("Artist: " + metadata.artist);
    }
    lines.push_back("Filename: " + metadata.filename);
    if (!metadata.comments.empty()) {
        lines.push_back("Comments:");
        std::istringstream comments(metadata.comments);
        std::string commentLine;
        while (std::getline(comments, commentLine)) {
            if (!commentLine.empty() && commentLine.back() == '\r') {
                commentLine.pop_back();
            }
            lines.push_back(commentLine);
        }
    }

    std::string card;
    for (const auto& line : lines) {
        for (const auto& wrapped : wrapLine(line, lineWidth)) {
            card += wrapped;
            card += '\n';
        }
    }
    return card;
}

bool writeMetadataCard(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << text;
    return static_cast<bool>(out);
}

}  // namespace prerender::media
