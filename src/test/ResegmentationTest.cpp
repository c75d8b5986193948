#undef NDEBUG
#include <iostream>
#include <cassert>
#include <cmath>
#include "domain/Resegmentation.hpp"

using namespace longscribe::domain;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

WordToken Word(const std::string& text, double start, double end, std::optional<std::string> speaker = std::nullopt) {
    WordToken w;
    w.text = text;
    w.start = start;
    w.end = end;
    w.speaker = std::move(speaker);
    return w;
}

Segment Seg(const std::string& text, double start, double end, std::optional<std::string> speaker = std::nullopt) {
    Segment s;
    s.text = text;
    s.start = start;
    s.end = end;
    s.speaker = std::move(speaker);
    return s;
}

void TestTokenize() {
    std::cout << "[Test] Tokenizing splits on any whitespace..." << std::endl;
    auto tokens = TokenizeText("  hello,\tworld \n again ");
    assert(tokens.size() == 3);
    assert(tokens[0] == "hello,");
    assert(tokens[2] == "again");
    assert(TokenizeText("   ").empty());
}

void TestInferWordTimings() {
    std::cout << "[Test] Word timings are spread by character length..." << std::endl;
    auto words = InferWordTokensFromSegments({Seg("ab abcd ab", 10.0, 18.0, "A")});
    assert(words.size() == 3);
    assert(Near(words[0].start, 10.0));
    assert(Near(words[0].end, 12.0));
    assert(Near(words[1].start, 12.0));
    assert(Near(words[1].end, 16.0));
    assert(Near(words[2].end, 18.0));
    assert(words[1].speaker && *words[1].speaker == "A");

    std::cout << "[Test] Very short segments still give each word the minimum duration..." << std::endl;
    auto tight = InferWordTokensFromSegments({Seg("a b", 1.0, 1.02)});
    assert(tight.size() == 2);
    assert(Near(tight[0].end, 1.02));   // capped at the segment end
    assert(Near(tight[1].end, 1.02));

    assert(InferWordTokensFromSegments({Seg("", 0.0, 1.0)}).empty());
}

void TestResegmentSplits() {
    std::cout << "[Test] Resegmentation splits on pauses, punctuation and length..." << std::endl;
    std::vector<WordToken> words = {
        Word("hello", 0.0, 0.3), Word("there", 0.35, 0.6),
        Word("after", 1.0, 1.2),                         // 400 ms pause
        Word("done.", 1.25, 1.4), Word("next", 1.45, 1.6) // sentence end
    };
    auto segments = ResegmentWordsToSegments(words);
    assert(segments.size() == 3);
    assert(segments[0].text == "hello there");
    assert(segments[1].text == "after done.");
    assert(segments[2].text == "next");
    assert(Near(segments[1].start, 1.0));
    assert(Near(segments[1].end, 1.4));

    ResegmentOptions noPunct;
    noPunct.splitOnPunctuation = false;
    assert(ResegmentWordsToSegments(words, noPunct).size() == 2);

    ResegmentOptions shortMax;
    shortMax.maxSegmentMs = 300;
    shortMax.pauseThresholdMs = 10000;
    shortMax.splitOnPunctuation = false;
    auto capped = ResegmentWordsToSegments(words, shortMax);
    assert(capped.size() == 5);

    assert(ResegmentWordsToSegments({}).empty());
}

void TestResegmentSpeakers() {
    std::cout << "[Test] Speaker changes split segments and majority label wins..." << std::endl;
    std::vector<WordToken> words = {
        Word("yes", 0.0, 0.2, "A"), Word("I", 0.25, 0.3, "A"),
        Word("agree", 0.35, 0.6, "B"),
    };
    auto segments = ResegmentWordsToSegments(words);
    assert(segments.size() == 2);
    assert(*segments[0].speaker == "A");
    assert(*segments[1].speaker == "B");

    std::vector<WordToken> unlabeled = {Word("one", 0.0, 0.2), Word("two", 0.25, 0.4)};
    auto plain = ResegmentWordsToSegments(unlabeled);
    assert(plain.size() == 1);
    assert(!plain[0].speaker);
}

void TestNormalizeAndFormat() {
    std::cout << "[Test] Speaker labels are normalized and formatted..." << std::endl;
    std::vector<Segment> segments = {
        Seg("hi", 0, 1, "spk_7"), Seg("how are you", 1, 2, "spk_7"),
        Seg("fine", 2, 3, "spk_2"), Seg("thanks", 3, 4, "spk_7"),
        Seg("mumble", 4, 5),
    };
    auto normalized = NormalizeSpeakerLabels(segments);
    assert(*normalized[0].speaker == "Speaker 1");
    assert(*normalized[2].speaker == "Speaker 2");
    assert(*normalized[3].speaker == "Speaker 1");
    assert(!normalized[4].speaker);

    const std::string formatted = FormatDiarizedTranscript(normalized);
    assert(formatted ==
           "Speaker 1: hi how are you\n"
           "Speaker 2: fine\n"
           "Speaker 1: thanks\n"
           "Unknown: mumble");
    assert(FormatDiarizedTranscript({}).empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting Resegmentation tests..." << std::endl;
    TestTokenize();
    TestInferWordTimings();
    TestResegmentSplits();
    TestResegmentSpeakers();
    TestNormalizeAndFormat();
    std::cout << "[PASS] Resegmentation tests passed." << std::endl;
    return 0;
}
