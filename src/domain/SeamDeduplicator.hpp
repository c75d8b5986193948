/**
 * @file SeamDeduplicator.hpp
 * @brief Removes text duplicated at the junction of two chunks' outputs.
 */

#pragma once

#include <cstddef>
#include <string>

namespace longscribe::domain {

/**
 * @class SeamDeduplicator
 * @brief Timing-free fallback for chunk boundaries.
 *
 * Lengths and the overlap cap count UTF-8 characters, not bytes, and a cut
 * never splits a code point.
 */
class SeamDeduplicator {
public:
    static constexpr std::size_t kDefaultMaxOverlap = 80;

    /**
     * @brief Length, in characters, of the longest suffix of prevText that is also a prefix of newText.
     *
     * Lengths are tried from min(maxOverlap, |prevText|, |newText|) down to 1.
     * @return The first (longest) matching length, or 0.
     */
    static std::size_t findOverlap(const std::string& prevText,
                                   const std::string& newText,
                                   std::size_t maxOverlap = kDefaultMaxOverlap);

    /**
     * @brief newText without the overlapping prefix (leading whitespace stripped),
     * or newText unchanged when nothing overlaps.
     */
    static std::string dedup(const std::string& prevText,
                             const std::string& newText,
                             std::size_t maxOverlap = kDefaultMaxOverlap);
};

} // namespace longscribe::domain
