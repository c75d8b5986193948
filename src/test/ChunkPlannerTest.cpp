#undef NDEBUG
#include <iostream>
#include <cassert>
#include <vector>
#include "domain/ChunkPlanner.hpp"
#include "domain/Errors.hpp"

using namespace longscribe::domain;

namespace {

ChunkWindow Window(int index, std::int64_t ls, std::int64_t le, std::int64_t as, std::int64_t ae) {
    ChunkWindow w;
    w.chunkIndex = index;
    w.logicalStartMs = ls;
    w.logicalEndMs = le;
    w.actualStartMs = as;
    w.actualEndMs = ae;
    return w;
}

template <typename Fn>
bool ThrowsPlanningError(Fn fn) {
    try {
        fn();
    } catch (const PlanningError&) {
        return true;
    }
    return false;
}

void TestThreeChunkPlan() {
    std::cout << "[Test] 150s of audio, 60s chunks, 1.5s overlap..." << std::endl;
    auto windows = ChunkPlanner::plan(150000, 60000, 1500);
    assert(windows.size() == 3);
    assert(windows[0] == Window(0, 0, 60000, 0, 60000));
    assert(windows[1] == Window(1, 60000, 120000, 58500, 120000));
    assert(windows[2] == Window(2, 120000, 150000, 118500, 150000));
}

void TestSingleChunk() {
    std::cout << "[Test] Audio shorter than one chunk..." << std::endl;
    auto windows = ChunkPlanner::plan(30000, 60000, 1500);
    assert(windows.size() == 1);
    assert(windows[0] == Window(0, 0, 30000, 0, 30000));
}

void TestExactMultiple() {
    std::cout << "[Test] Audio length is an exact multiple of the chunk duration..." << std::endl;
    auto windows = ChunkPlanner::plan(120000, 60000, 1500);
    assert(windows.size() == 2);
    assert(windows[1].logicalEndMs == 120000);
    assert(windows[1].actualStartMs == 58500);
}

void TestEmptyAudio() {
    std::cout << "[Test] Zero-length audio yields no windows..." << std::endl;
    assert(ChunkPlanner::plan(0, 60000, 1500).empty());
}

void TestOverlapLongerThanChunk() {
    std::cout << "[Test] Overlap longer than a chunk is clamped at zero..." << std::endl;
    auto windows = ChunkPlanner::plan(25000, 10000, 15000);
    assert(windows.size() == 3);
    assert(windows[0].actualStartMs == 0);
    assert(windows[1].actualStartMs == 0);
    assert(windows[2].actualStartMs == 5000);
    assert(windows[2].logicalEndMs == 25000);
}

void TestPartitionInvariants() {
    std::cout << "[Test] Logical windows tile the recording without gaps..." << std::endl;
    const std::int64_t lengths[] = {1, 999, 59999, 60001, 3600000 + 17};
    for (auto length : lengths) {
        auto windows = ChunkPlanner::plan(length, 60000, 1500);
        assert(!windows.empty());
        assert(windows.front().logicalStartMs == 0);
        assert(windows.back().logicalEndMs == length);
        for (size_t i = 0; i < windows.size(); ++i) {
            const auto& w = windows[i];
            assert(w.chunkIndex == static_cast<int>(i));
            assert(w.logicalStartMs < w.logicalEndMs);
            assert(w.actualEndMs == w.logicalEndMs);
            assert(w.actualStartMs <= w.logicalStartMs);
            assert(w.logicalStartMs - w.actualStartMs <= 1500);
            if (i > 0) assert(windows[i - 1].logicalEndMs == w.logicalStartMs);
        }
    }
}

void TestInvalidConfiguration() {
    std::cout << "[Test] Invalid chunking parameters raise PlanningError..." << std::endl;
    assert(ThrowsPlanningError([] { ChunkPlanner::plan(1000, 0, 0); }));
    assert(ThrowsPlanningError([] { ChunkPlanner::plan(1000, -5, 0); }));
    assert(ThrowsPlanningError([] { ChunkPlanner::plan(1000, 1000, -1); }));
    assert(ThrowsPlanningError([] { ChunkPlanner::plan(-1, 1000, 0); }));
    assert(!ThrowsPlanningError([] { ChunkPlanner::plan(1000, 1000, 0); }));
}

} // namespace

int main() {
    std::cout << "[Test] Starting ChunkPlanner tests..." << std::endl;
    TestThreeChunkPlan();
    TestSingleChunk();
    TestExactMultiple();
    TestEmptyAudio();
    TestOverlapLongerThanChunk();
    TestPartitionInvariants();
    TestInvalidConfiguration();
    std::cout << "[PASS] ChunkPlanner tests passed." << std::endl;
    return 0;
}
