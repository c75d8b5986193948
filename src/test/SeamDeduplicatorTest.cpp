#undef NDEBUG
#include <iostream>
#include <cassert>
#include <string>
#include "domain/SeamDeduplicator.hpp"

using longscribe::domain::SeamDeduplicator;

int main() {
    std::cout << "[Test] Starting SeamDeduplicator tests..." << std::endl;

    std::cout << "[Test] Repeated phrase at the seam..." << std::endl;
    const std::string prev = "...and then we went to the store";
    const std::string next = "the store was closed";
    assert(SeamDeduplicator::findOverlap(prev, next) == 9);
    assert(SeamDeduplicator::dedup(prev, next) == "was closed");

    std::cout << "[Test] No overlap leaves the text unchanged..." << std::endl;
    assert(SeamDeduplicator::findOverlap("hello world", "goodbye") == 0);
    assert(SeamDeduplicator::dedup("hello world", "goodbye") == "goodbye");
    assert(SeamDeduplicator::dedup("hello world", "  goodbye") == "  goodbye");

    std::cout << "[Test] Empty inputs..." << std::endl;
    assert(SeamDeduplicator::findOverlap("", "abc") == 0);
    assert(SeamDeduplicator::findOverlap("abc", "") == 0);
    assert(SeamDeduplicator::dedup("", "abc") == "abc");
    assert(SeamDeduplicator::dedup("abc", "").empty());

    std::cout << "[Test] Longest match wins..." << std::endl;
    assert(SeamDeduplicator::findOverlap("abab", "ababc") == 4);
    assert(SeamDeduplicator::dedup("abab", "ababc") == "c");

    std::cout << "[Test] Full duplicate collapses to empty..." << std::endl;
    assert(SeamDeduplicator::dedup("we said hello", "hello") == "");

    std::cout << "[Test] maxOverlap caps the search..." << std::endl;
    const std::string longPhrase(100, 'x');
    assert(SeamDeduplicator::findOverlap(longPhrase, longPhrase) == SeamDeduplicator::kDefaultMaxOverlap);
    assert(SeamDeduplicator::findOverlap(prev, next, 5) == 0);
    assert(SeamDeduplicator::findOverlap(prev, next, 9) == 9);

    std::cout << "[Test] Multi-byte text is cut on a character boundary..." << std::endl;
    const std::string prevUtf8 = "fomos ao mercado e ent\xC3\xA3o";   // "... então"
    const std::string nextUtf8 = "e ent\xC3\xA3o fechou";
    assert(SeamDeduplicator::findOverlap(prevUtf8, nextUtf8) == 7);
    assert(SeamDeduplicator::dedup(prevUtf8, nextUtf8) == "fechou");

    std::cout << "[Test] The overlap cap counts characters, not bytes..." << std::endl;
    std::string seam;
    for (int i = 0; i < 50; ++i) seam += "\xD0\xB4";   // 50 x Cyrillic "d", 100 bytes
    const std::string prevCyrillic = "\xD0\xBD\xD0\xB0\xD1\x87\xD0\xB0\xD0\xBB\xD0\xBE " + seam;
    const std::string nextCyrillic = seam + " \xD0\xBA\xD0\xBE\xD0\xBD\xD0\xB5\xD1\x86";
    assert(SeamDeduplicator::findOverlap(prevCyrillic, nextCyrillic) == 50);
    assert(SeamDeduplicator::dedup(prevCyrillic, nextCyrillic) == "\xD0\xBA\xD0\xBE\xD0\xBD\xD0\xB5\xD1\x86");
    assert(SeamDeduplicator::findOverlap(prevCyrillic, nextCyrillic, 30) == 30);

    std::cout << "[PASS] SeamDeduplicator tests passed." << std::endl;
    return 0;
}
