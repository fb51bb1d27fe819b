// src/native/fusion/include/transcript-types.h
#pragma once

#include "include/time-interval.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Fusion {

/// Label given to text that no diarization turn covers
extern const char* const kUnknownSpeaker;

struct SpeakerTurn {
    std::string speaker_id;
    TimeInterval interval;
};

struct TranscriptSegment {
    std::string text;
    TimeInterval interval;
    std::optional<float> confidence;  // [0, 1] when the model reports one
};

struct LabeledUtterance {
    std::string speaker_id;
    TimeInterval interval;
    std::string text;
    std::optional<float> confidence;  // mean over the merged segments that reported one
    int confidence_samples = 0;
};

/**
 * Speaker turns from one diarization run, sorted by start time.
 * Turns of different speakers may overlap (simultaneous speech).
 */
struct DiarizationResult {
    std::vector<SpeakerTurn> turns;
};

/**
 * Transcript segments from one transcription run, sorted by start time
 */
struct TranscriptionResult {
    std::vector<TranscriptSegment> segments;
};

/**
 * Window of the source audio covered by one job.
 * An unset end means "until the end of the recording".
 */
struct TimeRange {
    double start = 0.0;
    std::optional<double> end;

    bool is_bounded() const { return start > 0.0 || end.has_value(); }
};

/**
 * Raised when aligner input is unsorted or carries a malformed interval
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * Conditions that are not errors but leave the transcript unlabeled or empty
 */
enum class EmptyResultWarning {
    NoSpeakerTurns,
    NoTranscriptSegments
};

const char* describe(EmptyResultWarning warning);

} // namespace Fusion
