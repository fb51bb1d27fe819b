// src/native/fusion/include/providers.h
#pragma once

#include "include/transcript-types.h"

#include <istream>
#include <memory>
#include <stdexcept>
#include <string>

namespace Fusion {

/**
 * One source recording together with the model outputs computed for it
 */
struct MediaSource {
    std::string audio_path;
    std::string diarization_path;    // empty = resolve sidecar from ProviderConfig
    std::string transcription_path;  // empty = resolve sidecar from ProviderConfig
};

struct ProviderConfig {
    std::string sidecar_dir;  // empty = directory of the audio file
    std::string diarization_suffix = ".diarization.json";
    std::string rttm_suffix = ".rttm";
    std::string transcription_suffix = ".transcription.json";
    std::string model = "base";  // whisper model size the transcripts came from
    bool verbose = false;
};

/**
 * Raised when a provider cannot read or parse its input
 */
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& path, const std::string& reason)
        : std::runtime_error(path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Source of speaker turns for a recording.
 * Implementations must be safe to call from several worker threads at once.
 */
class DiarizationProvider {
public:
    virtual ~DiarizationProvider() = default;

    /**
     * @param source Recording to diarize
     * @param range Window to cover; turn times are relative to range.start
     * @return Turns sorted by start time
     */
    virtual DiarizationResult diarize(const MediaSource& source, const TimeRange& range) const = 0;

    virtual std::string name() const = 0;
};

/**
 * Source of timestamped transcript text for a recording
 */
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    /**
     * @param source Recording to transcribe
     * @param range Window to cover; segment times are relative to range.start
     * @return Segments sorted by start time
     */
    virtual TranscriptionResult transcribe(const MediaSource& source, const TimeRange& range) const = 0;

    virtual std::string name() const = 0;
};

/**
 * Reads diarization JSON: {"segments": [{"start_time", "end_time", "speaker_id"}]}
 * as written by diarize-cli, or the same with "start", "end", "speaker" keys
 */
class JsonDiarizationProvider : public DiarizationProvider {
public:
    explicit JsonDiarizationProvider(ProviderConfig config);

    DiarizationResult diarize(const MediaSource& source, const TimeRange& range) const override;
    std::string name() const override { return "json-diarization"; }

private:
    ProviderConfig config_;
};

/**
 * Reads pyannote RTTM: SPEAKER <uri> 1 <start> <duration> <NA> <NA> <speaker> <NA> <NA>
 */
class RttmDiarizationProvider : public DiarizationProvider {
public:
    explicit RttmDiarizationProvider(ProviderConfig config);

    DiarizationResult diarize(const MediaSource& source, const TimeRange& range) const override;
    std::string name() const override { return "rttm-diarization"; }

private:
    ProviderConfig config_;
};

/**
 * Reads whisper segment JSON, either {"segments": [{"start", "end", "text"}]}
 * or whisper.cpp's {"transcription": [{"offsets": {"from", "to"}, "text"}]}
 */
class JsonTranscriptionProvider : public TranscriptionProvider {
public:
    explicit JsonTranscriptionProvider(ProviderConfig config);

    TranscriptionResult transcribe(const MediaSource& source, const TimeRange& range) const override;
    std::string name() const override { return "json-transcription"; }

private:
    ProviderConfig config_;
};

/**
 * Create a diarization provider by format name ("json" or "rttm")
 * @throws std::invalid_argument for an unknown format
 */
std::unique_ptr<DiarizationProvider> make_diarization_provider(const std::string& format,
                                                               const ProviderConfig& config);

// Parsers behind the file-backed providers; origin only labels errors
DiarizationResult parse_diarization_json(std::istream& input, const std::string& origin);
DiarizationResult parse_rttm(std::istream& input, const std::string& origin);
TranscriptionResult parse_transcription_json(std::istream& input, const std::string& origin);

/**
 * Speaker label for a numeric diarization cluster
 * @return e.g. SPEAKER_00 for 0
 */
std::string format_speaker_label(int speaker_index);

/**
 * Path of a model output stored next to the audio file
 * @param explicit_path Returned as is when non-empty
 * @return <sidecar_dir or audio dir>/<audio stem><suffix>
 */
std::string resolve_result_path(const std::string& audio_path,
                                const std::string& explicit_path,
                                const std::string& sidecar_dir,
                                const std::string& suffix);

/**
 * Restrict results to a window and shift them so range.start becomes 0.
 * Items outside the window are dropped, partial items are clamped.
 * @throws InvalidInputError if the input is malformed
 */
DiarizationResult clip_to_range(const DiarizationResult& diarization, const TimeRange& range);
TranscriptionResult clip_to_range(const TranscriptionResult& transcription, const TimeRange& range);

} // namespace Fusion
