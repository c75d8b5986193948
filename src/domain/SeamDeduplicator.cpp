#include "domain/SeamDeduplicator.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace longscribe::domain {

namespace {

// Byte offset of every UTF-8 character start, followed by text.size().
std::vector<std::size_t> CharBoundaries(const std::string& text) {
    std::vector<std::size_t> bounds;
    bounds.reserve(text.size() + 1);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            bounds.push_back(i);
        }
    }
    bounds.push_back(text.size());
    return bounds;
}

std::size_t FindOverlap(const std::string& prevText, const std::vector<std::size_t>& prevBounds,
                        const std::string& newText, const std::vector<std::size_t>& newBounds,
                        std::size_t maxOverlap) {
    const std::size_t prevChars = prevBounds.size() - 1;
    const std::size_t newChars = newBounds.size() - 1;
    const std::size_t checkLen = std::min({maxOverlap, prevChars, newChars});

    for (std::size_t len = checkLen; len > 0; --len) {
        const std::size_t prevStart = prevBounds[prevChars - len];
        const std::size_t prevBytes = prevText.size() - prevStart;
        if (prevBytes != newBounds[len]) continue;
        if (prevText.compare(prevStart, prevBytes, newText, 0, prevBytes) == 0) {
            return len;
        }
    }
    return 0;
}

} // namespace

std::size_t SeamDeduplicator::findOverlap(const std::string& prevText,
                                          const std::string& newText,
                                          std::size_t maxOverlap) {
    if (prevText.empty() || newText.empty()) return 0;
    return FindOverlap(prevText, CharBoundaries(prevText), newText, CharBoundaries(newText), maxOverlap);
}

std::string SeamDeduplicator::dedup(const std::string& prevText,
                                    const std::string& newText,
                                    std::size_t maxOverlap) {
    if (prevText.empty() || newText.empty()) return newText;

    const auto newBounds = CharBoundaries(newText);
    const std::size_t trim = FindOverlap(prevText, CharBoundaries(prevText), newText, newBounds, maxOverlap);
    if (trim == 0) return newText;

    std::size_t pos = newBounds[trim];
    while (pos < newText.size() && std::isspace(static_cast<unsigned char>(newText[pos]))) {
        ++pos;
    }
    return newText.substr(pos);
}

} // namespace longscribe::domain
