// src/native/fusion/include/aligner.h
#pragma once

#include "include/transcript-types.h"

#include <vector>

namespace Fusion {

/**
 * Fuse diarization turns and transcript segments into speaker-labeled utterances.
 *
 * Every segment is attributed to the speaker with the greatest overlap
 * (summed over that speaker's turns); ties go to the speaker whose turn comes
 * first. Segments that no turn overlaps are labeled UNKNOWN. Consecutive
 * utterances of the same speaker are then merged when they abut.
 *
 * Text is never split: without word timestamps a segment that spans a
 * speaker change goes to its dominant speaker as a whole.
 *
 * Pure function, safe to call concurrently on independent inputs.
 *
 * @throws InvalidInputError if either input is unsorted or has a bad interval
 */
std::vector<LabeledUtterance> align_transcript(const DiarizationResult& diarization,
                                               const TranscriptionResult& transcription);

/**
 * Pick the speaker for a single transcript interval
 * @param turns Turns sorted by start time
 * @return Speaker ID, or kUnknownSpeaker when no turn overlaps the interval
 */
std::string resolve_speaker(const std::vector<SpeakerTurn>& turns, const TimeInterval& interval);

/**
 * Merge consecutive same-speaker utterances whose intervals abut.
 * Applying it to its own output changes nothing.
 */
std::vector<LabeledUtterance> merge_utterances(const std::vector<LabeledUtterance>& utterances);

/**
 * @throws InvalidInputError naming the offending turn
 */
void validate_turns(const std::vector<SpeakerTurn>& turns);

/**
 * @throws InvalidInputError naming the offending segment
 */
void validate_segments(const std::vector<TranscriptSegment>& segments);

/**
 * Report empty inputs so callers can log them
 */
std::vector<EmptyResultWarning> detect_empty_results(const DiarizationResult& diarization,
                                                     const TranscriptionResult& transcription);

} // namespace Fusion
