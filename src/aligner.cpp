// src/native/fusion/aligner.cpp
#include "include/aligner.h"

#include <algorithm>
#include <sstream>

namespace Fusion {

const char* const kUnknownSpeaker = "UNKNOWN";

const char* describe(EmptyResultWarning warning) {
    switch (warning) {
        case EmptyResultWarning::NoSpeakerTurns:
            return "diarization produced no speaker turns, transcript will be labeled UNKNOWN";
        case EmptyResultWarning::NoTranscriptSegments:
            return "transcription produced no segments, transcript will be empty";
    }
    return "unknown warning";
}

namespace {

struct SpeakerOverlap {
    std::string speaker_id;
    double total = 0.0;
};

template <typename Item>
void validate_sequence(const std::vector<Item>& items, const char* name) {
    for (size_t i = 0; i < items.size(); i++) {
        const auto& interval = items[i].interval;
        if (!interval.is_valid()) {
            std::ostringstream oss;
            oss << name << " " << i << " has invalid interval ["
                << interval.start << ", " << interval.end << ")";
            throw InvalidInputError(oss.str());
        }
        if (i > 0 && interval.start < items[i - 1].interval.start) {
            std::ostringstream oss;
            oss << name << " " << i << " starts at " << interval.start
                << "s, before " << name << " " << (i - 1) << " at "
                << items[i - 1].interval.start << "s (input must be sorted by start time)";
            throw InvalidInputError(oss.str());
        }
    }
}

void append_text(std::string& target, const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (!target.empty()) {
        target += ' ';
    }
    target += text;
}

} // namespace

void validate_turns(const std::vector<SpeakerTurn>& turns) {
    validate_sequence(turns, "speaker turn");
}

void validate_segments(const std::vector<TranscriptSegment>& segments) {
    validate_sequence(segments, "transcript segment");
}

namespace {

using TurnIterator = std::vector<SpeakerTurn>::const_iterator;

double gap_between(const TimeInterval& a, const TimeInterval& b) {
    return std::max(a.start - b.end, b.start - a.end);
}

std::string resolve_speaker_in(TurnIterator first, TurnIterator end, const TimeInterval& interval) {
    // Turns starting ε or more after the interval end cannot reach it
    auto last = std::lower_bound(first, end, interval.end + kTimestampTolerance,
        [](const SpeakerTurn& turn, double limit) { return turn.interval.start < limit; });

    // Collected in turn order, so the first entry of a speaker marks its earliest turn
    std::vector<SpeakerOverlap> overlaps;
    const SpeakerTurn* only_turn = nullptr;
    const SpeakerTurn* nearest = nullptr;
    double nearest_gap = kTimestampTolerance;
    size_t candidate_count = 0;

    for (auto it = first; it != last; ++it) {
        double amount = overlap_duration(it->interval, interval);
        if (amount <= 0.0) {
            // Misses by less than ε count as abutting, but lose to any real overlap
            double gap = gap_between(it->interval, interval);
            if (gap < nearest_gap) {
                nearest_gap = gap;
                nearest = &*it;
            }
            continue;
        }
        candidate_count++;
        only_turn = &*it;

        auto existing = std::find_if(overlaps.begin(), overlaps.end(),
            [&](const SpeakerOverlap& o) { return o.speaker_id == it->speaker_id; });
        if (existing == overlaps.end()) {
            overlaps.push_back({it->speaker_id, amount});
        } else {
            existing->total += amount;
        }
    }

    if (overlaps.empty()) {
        return nearest != nullptr ? nearest->speaker_id : kUnknownSpeaker;
    }

    if (candidate_count == 1 && contains(only_turn->interval, interval)) {
        return only_turn->speaker_id;
    }

    // Strict comparison keeps the earlier speaker on an exact tie
    const SpeakerOverlap* best = &overlaps.front();
    for (const auto& o : overlaps) {
        if (o.total > best->total) {
            best = &o;
        }
    }
    return best->speaker_id;
}

void merge_confidence(LabeledUtterance& target, const LabeledUtterance& next) {
    if (!next.confidence) {
        return;
    }
    if (!target.confidence) {
        target.confidence = next.confidence;
        target.confidence_samples = next.confidence_samples;
        return;
    }
    int samples = target.confidence_samples + next.confidence_samples;
    target.confidence = (*target.confidence * target.confidence_samples
                         + *next.confidence * next.confidence_samples) / samples;
    target.confidence_samples = samples;
}

} // namespace

std::string resolve_speaker(const std::vector<SpeakerTurn>& turns, const TimeInterval& interval) {
    return resolve_speaker_in(turns.begin(), turns.end(), interval);
}

std::vector<LabeledUtterance> merge_utterances(const std::vector<LabeledUtterance>& utterances) {
    std::vector<LabeledUtterance> merged;
    merged.reserve(utterances.size());

    for (const auto& utterance : utterances) {
        if (!merged.empty()) {
            auto& last = merged.back();
            if (last.speaker_id == utterance.speaker_id && abuts(last.interval, utterance.interval)) {
                append_text(last.text, utterance.text);
                last.interval.end = std::max(last.interval.end, utterance.interval.end);
                merge_confidence(last, utterance);
                continue;
            }
        }
        merged.push_back(utterance);
    }

    return merged;
}

std::vector<LabeledUtterance> align_transcript(const DiarizationResult& diarization,
                                               const TranscriptionResult& transcription) {
    validate_turns(diarization.turns);
    validate_segments(transcription.segments);

    std::vector<LabeledUtterance> labeled;
    labeled.reserve(transcription.segments.size());

    const auto& turns = diarization.turns;
    auto first = turns.begin();

    for (const auto& segment : transcription.segments) {
        // Segments only move forward, so a leading run of turns that ended
        // ε or more before this segment can never match a later one
        while (first != turns.end() && segment.interval.start - first->interval.end >= kTimestampTolerance) {
            ++first;
        }

        LabeledUtterance utterance;
        utterance.speaker_id = resolve_speaker_in(first, turns.end(), segment.interval);
        utterance.interval = segment.interval;
        utterance.text = segment.text;
        utterance.confidence = segment.confidence;
        utterance.confidence_samples = segment.confidence ? 1 : 0;
        labeled.push_back(std::move(utterance));
    }

    return merge_utterances(labeled);
}

std::vector<EmptyResultWarning> detect_empty_results(const DiarizationResult& diarization,
                                                     const TranscriptionResult& transcription) {
    std::vector<EmptyResultWarning> warnings;
    if (diarization.turns.empty()) {
        warnings.push_back(EmptyResultWarning::NoSpeakerTurns);
    }
    if (transcription.segments.empty()) {
        warnings.push_back(EmptyResultWarning::NoTranscriptSegments);
    }
    return warnings;
}

} // namespace Fusion
