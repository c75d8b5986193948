#include "domain/BoundaryResolver.hpp"

#include <algorithm>
#include <iterator>

namespace longscribe::domain {

namespace {

template <typename Unit>
std::vector<Unit> keepFrom(const std::vector<Unit>& units, double boundary) {
    std::vector<Unit> kept;
    kept.reserve(units.size());
    std::copy_if(units.begin(), units.end(), std::back_inserter(kept),
                 [boundary](const Unit& u) { return u.start >= boundary; });
    return kept;
}

template <typename Unit>
std::size_t eraseInconsistent(std::vector<Unit>& units, double lo, double hi, double eps) {
    const auto before = units.size();
    units.erase(std::remove_if(units.begin(), units.end(), [lo, hi, eps](const Unit& u) {
                    return u.start < lo - eps || u.start > hi + eps || u.end < u.start - eps;
                }),
                units.end());
    return before - units.size();
}

} // namespace

std::vector<WordToken> BoundaryResolver::trimWords(const std::vector<WordToken>& words,
                                                   double ownedBoundarySec,
                                                   double epsilonSec) {
    return keepFrom(words, ownedBoundarySec - epsilonSec);
}

std::vector<Segment> BoundaryResolver::trimSegments(const std::vector<Segment>& segments,
                                                    double ownedBoundarySec,
                                                    double epsilonSec) {
    return keepFrom(segments, ownedBoundarySec - epsilonSec);
}

void BoundaryResolver::offsetToGlobal(ChunkResult& result, double offsetSec) {
    for (auto& w : result.words) {
        w.start += offsetSec;
        w.end += offsetSec;
    }
    for (auto& s : result.segments) {
        s.start += offsetSec;
        s.end += offsetSec;
    }
    result.timeBase = TimeBase::Global;
}

std::size_t BoundaryResolver::dropInconsistentUnits(ChunkResult& result,
                                                    const ChunkWindow& window,
                                                    double epsilonSec) {
    const double lo = window.actualStartSec();
    const double hi = window.actualEndSec();
    return eraseInconsistent(result.words, lo, hi, epsilonSec) +
           eraseInconsistent(result.segments, lo, hi, epsilonSec);
}

} // namespace longscribe::domain
