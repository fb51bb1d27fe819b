// tests/aligner-test.cpp
#include "include/aligner.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace Fusion;

namespace {

SpeakerTurn turn(const std::string& speaker, double start, double end) {
    return {speaker, {start, end}};
}

TranscriptSegment segment(const std::string& text, double start, double end) {
    return {text, {start, end}, std::nullopt};
}

std::string joined_text(const std::vector<LabeledUtterance>& utterances) {
    std::string out;
    for (const auto& u : utterances) {
        out += u.text;
    }
    return out;
}

std::string joined_text(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        out += s.text;
    }
    return out;
}

std::string without_spaces(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), ' '), text.end());
    return text;
}

} // namespace

TEST(AlignerTest, ReadmeExampleKeepsBothTurns) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 3.61), turn("SPEAKER_02", 3.61, 5.75)}};
    TranscriptionResult transcription{{segment("At some point...", 0.03, 3.61),
                                       segment("What is the vision...", 3.61, 5.75)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 2u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
    EXPECT_EQ(utterances[0].text, "At some point...");
    EXPECT_DOUBLE_EQ(utterances[0].interval.start, 0.03);
    EXPECT_DOUBLE_EQ(utterances[0].interval.end, 3.61);
    EXPECT_EQ(utterances[1].speaker_id, "SPEAKER_02");
    EXPECT_EQ(utterances[1].text, "What is the vision...");
    EXPECT_DOUBLE_EQ(utterances[1].interval.start, 3.61);
    EXPECT_DOUBLE_EQ(utterances[1].interval.end, 5.75);
}

TEST(AlignerTest, DominantDurationRegression) {
    // A covers 2.0s of the segment, B only 1.2s
    DiarizationResult diarization{{turn("A", 0.0, 2.0), turn("B", 1.8, 5.0)}};
    TranscriptionResult transcription{{segment("spanning", 0.0, 3.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "A");
    EXPECT_EQ(utterances[0].text, "spanning");
    EXPECT_DOUBLE_EQ(utterances[0].interval.start, 0.0);
    EXPECT_DOUBLE_EQ(utterances[0].interval.end, 3.0);
}

TEST(AlignerTest, SegmentSpanningSpeakerChangeGoesToMajority) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 5.0), turn("SPEAKER_01", 5.0, 10.0)}};
    TranscriptionResult transcription{{segment("straddles", 4.0, 8.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_01");
}

TEST(AlignerTest, ExactTieGoesToEarlierTurn) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 2.0), turn("SPEAKER_01", 2.0, 4.0)}};
    TranscriptionResult transcription{{segment("tie", 1.0, 3.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
}

TEST(AlignerTest, SimultaneousTurnsWithSameStartTieToInputOrder) {
    DiarizationResult diarization{{turn("SPEAKER_03", 1.0, 4.0), turn("SPEAKER_01", 1.0, 4.0)}};
    TranscriptionResult transcription{{segment("crosstalk", 1.5, 2.5)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_03");
}

TEST(AlignerTest, OverlapIsSummedPerSpeaker) {
    // A talks twice around B's interjection: 0.6 + 0.6 beats B's 0.8
    DiarizationResult diarization{{turn("A", 0.0, 1.0), turn("B", 1.0, 1.8), turn("A", 1.8, 3.0)}};
    TranscriptionResult transcription{{segment("interrupted", 0.4, 2.4)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "A");
}

TEST(AlignerTest, FullContainmentKeepsSegmentUnchanged) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 10.0)}};
    TranscriptionResult transcription{{segment("hello", 1.0, 2.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
    EXPECT_EQ(utterances[0].text, "hello");
    EXPECT_DOUBLE_EQ(utterances[0].interval.start, 1.0);
    EXPECT_DOUBLE_EQ(utterances[0].interval.end, 2.0);
}

TEST(AlignerTest, EmptyDiarizationLabelsEverythingUnknown) {
    DiarizationResult diarization;
    TranscriptionResult transcription{{segment("one", 0.0, 1.0), segment("two", 5.0, 6.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 2u);
    for (const auto& u : utterances) {
        EXPECT_EQ(u.speaker_id, kUnknownSpeaker);
    }
}

TEST(AlignerTest, EmptyTranscriptionGivesEmptyOutput) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 3.0)}};
    TranscriptionResult transcription;

    EXPECT_TRUE(align_transcript(diarization, transcription).empty());
}

TEST(AlignerTest, TrailingAudioAfterLastTurnIsUnknown) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 3.0)}};
    TranscriptionResult transcription{{segment("covered", 0.5, 2.5), segment("trailing", 3.5, 4.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 2u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
    EXPECT_EQ(utterances[1].speaker_id, kUnknownSpeaker);
    EXPECT_EQ(utterances[1].text, "trailing");
}

TEST(AlignerTest, SegmentJustAfterTurnWithinToleranceKeepsSpeaker) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 3.6095)}};
    TranscriptionResult transcription{{segment("jittered tail", 3.61, 4.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
}

TEST(AlignerTest, SegmentJustBeforeTurnWithinToleranceKeepsSpeaker) {
    DiarizationResult diarization{{turn("SPEAKER_01", 2.0005, 5.0)}};
    TranscriptionResult transcription{{segment("jittered head", 1.0, 2.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_01");
}

TEST(AlignerTest, SegmentBeyondToleranceIsUnknown) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 3.0)}};
    TranscriptionResult transcription{{segment("late", 3.002, 4.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, kUnknownSpeaker);
}

TEST(AlignerTest, SegmentPartlyPastLastTurnKeepsSpeaker) {
    DiarizationResult diarization{{turn("SPEAKER_00", 5.75, 12.4)}};
    TranscriptionResult transcription{{segment("Thanks.", 12.0, 13.5)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
    EXPECT_DOUBLE_EQ(utterances[0].interval.end, 13.5);
}

TEST(AlignerTest, NearMissLosesToRealOverlap) {
    // SPEAKER_00 only touches the segment, SPEAKER_01 overlaps it by 10 ms
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 1.0), turn("SPEAKER_01", 1.99, 3.0)}};
    TranscriptionResult transcription{{segment("short", 1.0, 2.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_01");
}

TEST(AlignerTest, LongTurnStaysVisibleToLaterSegments) {
    DiarizationResult diarization{{turn("HOST", 0.0, 100.0), turn("GUEST", 1.0, 2.0),
                                   turn("GUEST", 3.0, 4.0)}};
    TranscriptionResult transcription{{segment("question", 1.2, 1.8), segment("answer", 3.1, 3.9),
                                       segment("wrap up", 50.0, 55.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 3u);
    EXPECT_EQ(utterances[0].speaker_id, "HOST");  // tie with GUEST, HOST's turn comes first
    EXPECT_EQ(utterances[1].speaker_id, "HOST");
    EXPECT_EQ(utterances[2].speaker_id, "HOST");
    EXPECT_EQ(utterances[2].text, "wrap up");
}

TEST(AlignerTest, MergeAveragesConfidence) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 6.0)}};
    TranscriptionResult transcription{{{"one", {0.0, 2.0}, 0.9f},
                                       {"two", {2.0, 4.0}, std::nullopt},
                                       {"three", {4.0, 6.0}, 0.5f}}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    ASSERT_TRUE(utterances[0].confidence.has_value());
    EXPECT_NEAR(*utterances[0].confidence, 0.7f, 1e-6);
    EXPECT_EQ(utterances[0].confidence_samples, 2);
}

TEST(AlignerTest, ConfidenceStaysUnsetWithoutScores) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 2.0)}};
    TranscriptionResult transcription{{segment("plain", 0.0, 2.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_FALSE(utterances[0].confidence.has_value());
}

TEST(AlignerTest, GapBetweenTurnsIsUnknown) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 1.0), turn("SPEAKER_01", 3.0, 4.0)}};
    TranscriptionResult transcription{{segment("silence?", 1.2, 2.8)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 1u);
    EXPECT_EQ(utterances[0].speaker_id, kUnknownSpeaker);
}

TEST(AlignerTest, MergesAbuttingSegmentsOfSameSpeaker) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 6.0), turn("SPEAKER_01", 6.0, 9.0)}};
    TranscriptionResult transcription{{segment("First sentence.", 0.0, 2.0),
                                       segment("Second sentence.", 2.0005, 4.0),
                                       segment("Third sentence.", 4.0, 6.0),
                                       segment("Reply.", 6.0, 8.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 2u);
    EXPECT_EQ(utterances[0].speaker_id, "SPEAKER_00");
    EXPECT_EQ(utterances[0].text, "First sentence. Second sentence. Third sentence.");
    EXPECT_DOUBLE_EQ(utterances[0].interval.start, 0.0);
    EXPECT_DOUBLE_EQ(utterances[0].interval.end, 6.0);
    EXPECT_EQ(utterances[1].text, "Reply.");
}

TEST(AlignerTest, DoesNotMergeAcrossPause) {
    DiarizationResult diarization{{turn("SPEAKER_00", 0.0, 10.0)}};
    TranscriptionResult transcription{{segment("before", 0.0, 2.0), segment("after", 4.0, 5.0)}};

    auto utterances = align_transcript(diarization, transcription);

    ASSERT_EQ(utterances.size(), 2u);
    EXPECT_EQ(utterances[0].text, "before");
    EXPECT_EQ(utterances[1].text, "after");
}

TEST(AlignerTest, MergeToleratesSmallSegmentOverlap) {
    std::vector<LabeledUtterance> input{{"A", {0.0, 2.1}, "one"}, {"A", {2.0, 3.0}, "two"}};

    auto merged = merge_utterances(input);

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].text, "one two");
    EXPECT_DOUBLE_EQ(merged[0].interval.end, 3.0);
}

TEST(AlignerTest, MergeIsIdempotent) {
    std::vector<LabeledUtterance> input{{"A", {0.0, 1.0}, "a1"},
                                        {"A", {1.0, 2.0}, "a2"},
                                        {"B", {2.0, 3.0}, "b1"},
                                        {"B", {3.5, 4.0}, "b2"},
                                        {"A", {4.0, 5.0}, "a3"}};

    auto once = merge_utterances(input);
    auto twice = merge_utterances(once);

    ASSERT_EQ(once.size(), 4u);
    ASSERT_EQ(twice.size(), once.size());
    for (size_t i = 0; i < once.size(); i++) {
        EXPECT_EQ(twice[i].speaker_id, once[i].speaker_id);
        EXPECT_EQ(twice[i].text, once[i].text);
        EXPECT_DOUBLE_EQ(twice[i].interval.start, once[i].interval.start);
        EXPECT_DOUBLE_EQ(twice[i].interval.end, once[i].interval.end);
    }
}

TEST(AlignerTest, CoversAllTextInOrder) {
    DiarizationResult diarization{{turn("A", 0.0, 2.0), turn("B", 1.5, 4.0), turn("A", 4.0, 6.0),
                                   turn("C", 7.0, 9.0)}};
    TranscriptionResult transcription{{segment("alpha", 0.0, 1.0), segment("beta", 1.0, 2.5),
                                       segment("gamma", 2.5, 4.2), segment("delta", 4.2, 6.5),
                                       segment("epsilon", 6.5, 7.0), segment("zeta", 7.0, 8.0),
                                       segment("eta", 9.5, 10.0)}};

    auto utterances = align_transcript(diarization, transcription);

    EXPECT_EQ(without_spaces(joined_text(utterances)), joined_text(transcription.segments));
    for (size_t i = 1; i < utterances.size(); i++) {
        EXPECT_LE(utterances[i - 1].interval.start, utterances[i].interval.start);
    }
}

TEST(AlignerTest, IdenticalInputsGiveIdenticalOutputs) {
    DiarizationResult diarization{{turn("X", 0.0, 1.5), turn("Y", 0.5, 2.0), turn("Z", 0.5, 2.0)}};
    TranscriptionResult transcription{{segment("who", 0.5, 1.5), segment("said", 1.5, 2.0)}};

    auto first = align_transcript(diarization, transcription);
    for (int run = 0; run < 10; run++) {
        auto again = align_transcript(diarization, transcription);
        ASSERT_EQ(again.size(), first.size());
        for (size_t i = 0; i < first.size(); i++) {
            EXPECT_EQ(again[i].speaker_id, first[i].speaker_id);
            EXPECT_EQ(again[i].text, first[i].text);
        }
    }
}

TEST(AlignerTest, RejectsUnsortedTurns) {
    DiarizationResult diarization{{turn("A", 2.0, 3.0), turn("B", 0.0, 1.0)}};
    TranscriptionResult transcription{{segment("text", 0.0, 1.0)}};

    EXPECT_THROW(align_transcript(diarization, transcription), InvalidInputError);
}

TEST(AlignerTest, RejectsUnsortedSegments) {
    DiarizationResult diarization{{turn("A", 0.0, 5.0)}};
    TranscriptionResult transcription{{segment("late", 2.0, 3.0), segment("early", 1.0, 2.0)}};

    EXPECT_THROW(align_transcript(diarization, transcription), InvalidInputError);
}

TEST(AlignerTest, RejectsEmptyInterval) {
    DiarizationResult diarization{{turn("A", 0.0, 5.0)}};
    TranscriptionResult transcription{{segment("instant", 2.0, 2.0)}};

    EXPECT_THROW(align_transcript(diarization, transcription), InvalidInputError);
}

TEST(AlignerTest, RejectsInvertedTurn) {
    DiarizationResult diarization{{turn("A", 3.0, 1.0)}};
    TranscriptionResult transcription;

    EXPECT_THROW(align_transcript(diarization, transcription), InvalidInputError);
}

TEST(AlignerTest, ReportsEmptyInputs) {
    auto warnings = detect_empty_results(DiarizationResult{}, TranscriptionResult{});

    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], EmptyResultWarning::NoSpeakerTurns);
    EXPECT_EQ(warnings[1], EmptyResultWarning::NoTranscriptSegments);
}
