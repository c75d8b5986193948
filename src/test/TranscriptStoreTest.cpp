#undef NDEBUG
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TranscriptStoreFs.hpp"

using namespace longscribe;
namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

domain::TranscriptRecord SampleRecord() {
    domain::TranscriptRecord record;
    record.name = "meeting";
    record.status = "partial";
    record.durationSeconds = 150.0;
    record.language = "en";
    record.transcript.text = "we went to the store and we went home";

    domain::Segment seg;
    seg.start = 57.0;
    seg.end = 59.7;
    seg.text = "we went to the store";
    seg.speaker = "Speaker 1";
    seg.extra["avg_logprob"] = -0.3;
    record.transcript.segments.push_back(seg);

    domain::WordToken word;
    word.text = "home";
    word.start = 120.7;
    word.end = 121.1;
    record.transcript.words.push_back(word);

    domain::GapRange gap;
    gap.chunkIndex = 1;
    gap.logicalStartMs = 60000;
    gap.logicalEndMs = 120000;
    gap.reason = "HTTP 500";
    record.gaps.push_back(gap);
    return record;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranscriptStore tests..." << std::endl;

    const fs::path testRoot = fs::temp_directory_path() / "longscribe_store_test";
    fs::remove_all(testRoot);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::TranscriptStoreFs store(testRoot.string(), persistence);

    std::cout << "[Test] Saving writes JSON and text files..." << std::endl;
    store.save(SampleRecord());
    persistence->flush();
    assert(persistence->failedWrites() == 0);
    assert(fs::exists(store.jsonPath("meeting")));
    assert(ReadFile(store.textPath("meeting")) == "we went to the store and we went home\n");

    std::cout << "[Test] Saved records load back..." << std::endl;
    auto loaded = store.load("meeting");
    assert(loaded.has_value());
    assert(loaded->status == "partial");
    assert(loaded->transcript.text == "we went to the store and we went home");
    assert(loaded->transcript.segments.size() == 1);
    assert(*loaded->transcript.segments[0].speaker == "Speaker 1");
    assert(loaded->transcript.segments[0].extra["avg_logprob"] == -0.3);
    assert(loaded->transcript.words.size() == 1);
    assert(!loaded->transcript.words[0].speaker);
    assert(loaded->gaps.size() == 1);
    assert(loaded->gaps[0].logicalEndMs == 120000);
    assert(loaded->gaps[0].reason == "HTTP 500");
    assert(!store.load("unknown").has_value());

    std::cout << "[Test] Diarized text goes to the .txt file..." << std::endl;
    auto diarized = SampleRecord();
    diarized.name = "interview";
    diarized.diarizedText = "Speaker 1: hello\nSpeaker 2: hi";
    store.save(diarized);
    persistence->flush();
    assert(ReadFile(store.textPath("interview")) == "Speaker 1: hello\nSpeaker 2: hi\n");

    std::cout << "[Test] Concurrent saves to one file leave a complete document..." << std::endl;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store, i]() {
            auto record = SampleRecord();
            record.transcript.text = "version " + std::to_string(i);
            store.save(record);
        });
    }
    for (auto& t : threads) t.join();
    persistence->flush();
    auto last = store.load("meeting");
    assert(last.has_value());
    assert(last->transcript.text.rfind("version ", 0) == 0);

    std::cout << "[Test] Text cut mid-character is still saved..." << std::endl;
    auto truncated = SampleRecord();
    truncated.name = "truncated";
    truncated.transcript.text = "ent\xC3";
    truncated.transcript.segments[0].text = "ent\xC3";
    store.save(truncated);
    persistence->flush();
    assert(persistence->failedWrites() == 0);
    auto repaired = store.load("truncated");
    assert(repaired.has_value());
    assert(repaired->transcript.text == "ent\xEF\xBF\xBD");
    assert(repaired->transcript.segments[0].text == "ent\xEF\xBF\xBD");
    assert(repaired->gaps.size() == 1);

    std::cout << "[Test] No temp files are left behind..." << std::endl;
    for (const auto& entry : fs::directory_iterator(testRoot)) {
        assert(entry.path().extension() != ".tmp");
    }

    persistence->stop();
    fs::remove_all(testRoot);
    std::cout << "[PASS] TranscriptStore tests passed." << std::endl;
    return 0;
}
