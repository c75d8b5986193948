#undef NDEBUG
#include <iostream>
#include <cassert>
#include <cmath>
#include "infrastructure/TranscriptionResponseParser.hpp"
#include "domain/Errors.hpp"

using longscribe::infrastructure::TranscriptionResponseParser;
using namespace longscribe::domain;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

void TestVerboseJson() {
    std::cout << "[Test] verbose_json with words and segments..." << std::endl;
    const std::string body = R"({
        "task": "transcribe",
        "language": "english",
        "duration": 61.5,
        "text": " the store was closed ",
        "segments": [
            {"id": 0, "seek": 0, "start": 0.5, "end": 1.2, "text": " the store", "avg_logprob": -0.21},
            {"id": 1, "seek": 0, "start": 1.6, "end": 2.3, "text": " was closed"}
        ],
        "words": [
            {"word": "the", "start": 0.5, "end": 0.7},
            {"word": "store", "start": 0.8, "end": 1.2},
            {"word": "was", "start": 1.6, "end": 1.8},
            {"word": "closed", "start": 1.9, "end": 2.3}
        ]
    })";

    auto result = TranscriptionResponseParser::Parse(body, 3);
    assert(result.chunkIndex == 3);
    assert(result.timeBase == TimeBase::ChunkLocal);
    assert(result.rawText == "the store was closed");
    assert(result.segments.size() == 2);
    assert(result.segments[0].text == "the store");
    assert(result.segments[0].extra["id"] == 0);
    assert(result.segments[0].extra["avg_logprob"] == -0.21);
    assert(!result.segments[0].extra.contains("text"));
    assert(result.words.size() == 4);
    assert(result.words[3].text == "closed");
    assert(Near(result.words[3].start, 1.9));
}

void TestSegmentsWithoutWords() {
    std::cout << "[Test] Missing words are inferred from segments..." << std::endl;
    const std::string body = R"({"text": "one two", "segments": [{"start": 0.0, "end": 1.0, "text": "one two", "speaker": "A"}]})";
    auto result = TranscriptionResponseParser::Parse(body, 0);
    assert(result.words.size() == 2);
    assert(result.words[0].text == "one");
    assert(Near(result.words[1].end, 1.0));
    assert(result.words[0].speaker && *result.words[0].speaker == "A");
    assert(result.segments[0].speaker && *result.segments[0].speaker == "A");
}

void TestTextOnlyShapes() {
    std::cout << "[Test] Plain text, JSON strings and text-only objects..." << std::endl;
    auto plain = TranscriptionResponseParser::Parse("  hello world\n", 1);
    assert(plain.rawText == "hello world");
    assert(plain.words.empty() && plain.segments.empty());

    auto quoted = TranscriptionResponseParser::Parse("\"hello world\"", 1);
    assert(quoted.rawText == "hello world");

    auto object = TranscriptionResponseParser::Parse(R"({"text": "hi"})", 1);
    assert(object.rawText == "hi");
    assert(object.words.empty());
}

void TestTextFallsBackToSegments() {
    std::cout << "[Test] Missing text is rebuilt from segment texts..." << std::endl;
    auto result = TranscriptionResponseParser::Parse(
        R"({"segments": [{"start": 0, "end": 1, "text": " a "}, {"start": 1, "end": 2, "text": "b"}]})", 0);
    assert(result.rawText == "a b");
}

void TestUnexpectedType() {
    std::cout << "[Test] A JSON array is rejected..." << std::endl;
    bool threw = false;
    try {
        TranscriptionResponseParser::Parse("[1, 2, 3]", 4);
    } catch (const ChunkTranscriptionError& e) {
        threw = e.chunkIndex() == 4;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranscriptionResponseParser tests..." << std::endl;
    TestVerboseJson();
    TestSegmentsWithoutWords();
    TestTextOnlyShapes();
    TestTextFallsBackToSegments();
    TestUnexpectedType();
    std::cout << "[PASS] TranscriptionResponseParser tests passed." << std::endl;
    return 0;
}
