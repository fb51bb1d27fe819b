// src/native/fusion/include/fuse-cli.h
#pragma once

#include "include/providers.h"
#include "include/transcript-types.h"

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FuseOptions {
    std::string audio_path;
    std::string diarization_path;
    std::string transcription_path;
    std::string diarization_format = "json";
    std::string batch_manifest;
    std::string start_time;
    std::string end_time;
    std::string trim_output;
    std::string output_format = "text";
    std::string output_file;
    std::string sidecar_dir;
    std::string model = "base";
    std::string config_file;
    int jobs = 0;
    bool verbose = false;
};

struct FusionJobResult {
    Fusion::MediaSource source;
    Fusion::TimeRange range;
    std::vector<Fusion::LabeledUtterance> utterances;
    std::vector<Fusion::EmptyResultWarning> warnings;
    size_t turn_count = 0;
    size_t segment_count = 0;
};

struct BatchOutcome {
    Fusion::MediaSource source;
    std::optional<FusionJobResult> result;
    std::string error;
    std::string failed_input;  // file a provider could not read, when known
};

/**
 * Runs one recording through diarization, transcription and alignment
 */
class TranscriptPipeline {
private:
    std::unique_ptr<Fusion::DiarizationProvider> diarizer_;
    std::unique_ptr<Fusion::TranscriptionProvider> transcriber_;
    bool verbose_;

public:
    explicit TranscriptPipeline(bool verbose = false);
    TranscriptPipeline(std::unique_ptr<Fusion::DiarizationProvider> diarizer,
                       std::unique_ptr<Fusion::TranscriptionProvider> transcriber,
                       bool verbose = false);
    ~TranscriptPipeline();

    /**
     * Build the file-backed providers selected by the options
     * @return false if the options name an unknown provider
     */
    bool initialize(const FuseOptions& options);

    /**
     * Fuse the model outputs for one recording.
     * Safe to call from several threads at once.
     * @throws Fusion::ProviderError, Fusion::InvalidInputError
     */
    FusionJobResult process(const Fusion::MediaSource& source, const Fusion::TimeRange& range) const;

    bool is_initialized() const { return diarizer_ != nullptr && transcriber_ != nullptr; }
};

/**
 * Processes many recordings in parallel and reports them in input order
 */
class BatchRunner {
private:
    const TranscriptPipeline& pipeline_;
    size_t jobs_;
    bool verbose_;

public:
    BatchRunner(const TranscriptPipeline& pipeline, size_t jobs, bool verbose = false);

    /**
     * A failing recording yields an outcome with an error, the rest still run
     */
    std::vector<BatchOutcome> run(const std::vector<Fusion::MediaSource>& sources,
                                  const Fusion::TimeRange& range) const;
};

/**
 * Read batch jobs, one per line: audio_path[|diarization_path|transcription_path].
 * Blank lines and lines starting with '#' are skipped.
 * @throws std::invalid_argument on a line with two fields
 */
std::vector<Fusion::MediaSource> parse_manifest(std::istream& input);

/**
 * Render a single job in the requested output format (text, json, context, batch)
 * @throws std::invalid_argument for an unknown format
 */
std::string render_output(const FusionJobResult& result, const FuseOptions& options);

/**
 * Provider settings derived from command line options
 */
Fusion::ProviderConfig make_provider_config(const FuseOptions& options);

/**
 * Entry point shared by main() and tests
 * @return Process exit code
 */
int run_cli(const FuseOptions& options);
