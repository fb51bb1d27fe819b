// src/native/fusion/fuse-cli.cpp
#include "include/fuse-cli.h"
#include "include/aligner.h"
#include "include/formatter.h"
#include "include/utils.h"
#include "include/worker-pool.h"

#include <fstream>
#include <future>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

TranscriptPipeline::TranscriptPipeline(bool verbose)
    : verbose_(verbose) {}

TranscriptPipeline::TranscriptPipeline(std::unique_ptr<Fusion::DiarizationProvider> diarizer,
                                       std::unique_ptr<Fusion::TranscriptionProvider> transcriber,
                                       bool verbose)
    : diarizer_(std::move(diarizer)), transcriber_(std::move(transcriber)), verbose_(verbose) {}

TranscriptPipeline::~TranscriptPipeline() = default;

bool TranscriptPipeline::initialize(const FuseOptions& options) {
    if (verbose_) {
        Utils::Log::info("🔧 Initializing transcript pipeline...");
    }

    auto config = make_provider_config(options);

    try {
        diarizer_ = Fusion::make_diarization_provider(options.diarization_format, config);
    } catch (const std::invalid_argument& e) {
        Utils::Log::error("❌ Failed to initialize diarization provider: " + std::string(e.what()));
        return false;
    }
    transcriber_ = std::make_unique<Fusion::JsonTranscriptionProvider>(config);

    if (verbose_) {
        Utils::Log::info("✅ Pipeline ready (" + diarizer_->name() + " + " + transcriber_->name() + ")");
    }

    return true;
}

FusionJobResult TranscriptPipeline::process(const Fusion::MediaSource& source,
                                            const Fusion::TimeRange& range) const {
    if (!is_initialized()) {
        throw std::logic_error("TranscriptPipeline used before initialize()");
    }

    FusionJobResult result;
    result.source = source;
    result.range = range;

    auto diarization = diarizer_->diarize(source, range);
    auto transcription = transcriber_->transcribe(source, range);
    result.turn_count = diarization.turns.size();
    result.segment_count = transcription.segments.size();

    result.warnings = Fusion::detect_empty_results(diarization, transcription);
    for (auto warning : result.warnings) {
        Utils::Log::warn("⚠️ " + source.audio_path + ": " + Fusion::describe(warning));
    }

    result.utterances = Fusion::align_transcript(diarization, transcription);

    if (verbose_) {
        Utils::Log::info("🎭 " + source.audio_path + ": " + std::to_string(result.turn_count) + " turns + "
                         + std::to_string(result.segment_count) + " segments -> "
                         + std::to_string(result.utterances.size()) + " utterances");
    }

    return result;
}

BatchRunner::BatchRunner(const TranscriptPipeline& pipeline, size_t jobs, bool verbose)
    : pipeline_(pipeline), jobs_(jobs), verbose_(verbose) {}

std::vector<BatchOutcome> BatchRunner::run(const std::vector<Fusion::MediaSource>& sources,
                                           const Fusion::TimeRange& range) const {
    std::vector<std::future<FusionJobResult>> futures;
    futures.reserve(sources.size());

    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(sources.size());

    {
        WorkerPool pool(jobs_);
        if (verbose_) {
            Utils::Log::info("🚀 Processing " + std::to_string(sources.size()) + " files on "
                             + std::to_string(pool.size()) + " workers");
        }

        for (const auto& source : sources) {
            futures.push_back(pool.submit([this, source, range]() {
                return pipeline_.process(source, range);
            }));
        }

        for (size_t i = 0; i < sources.size(); i++) {
            BatchOutcome outcome;
            outcome.source = sources[i];
            try {
                outcome.result = futures[i].get();
            } catch (const Fusion::ProviderError& e) {
                outcome.error = e.what();
                outcome.failed_input = e.path();
                Utils::Log::error("❌ " + sources[i].audio_path + " (unreadable input): " + outcome.error);
            } catch (const std::exception& e) {
                outcome.error = e.what();
                Utils::Log::error("❌ " + sources[i].audio_path + ": " + outcome.error);
            }
            outcomes.push_back(std::move(outcome));
        }
    }

    return outcomes;
}

std::vector<Fusion::MediaSource> parse_manifest(std::istream& input) {
    std::vector<Fusion::MediaSource> sources;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, '|')) {
            fields.push_back(field);
        }

        Fusion::MediaSource source;
        if (fields.size() == 1) {
            source.audio_path = fields[0];
        } else if (fields.size() == 3) {
            source.audio_path = fields[0];
            source.diarization_path = fields[1];
            source.transcription_path = fields[2];
        } else {
            throw std::invalid_argument("manifest line " + std::to_string(line_number)
                                        + ": expected audio_path or audio_path|diarization|transcription");
        }
        sources.push_back(std::move(source));
    }

    return sources;
}

std::string render_output(const FusionJobResult& result, const FuseOptions& options) {
    namespace Fmt = Fusion::Formatter;

    if (options.output_format == "text") {
        return Fmt::format_transcript(result.utterances);
    }
    if (options.output_format == "json") {
        return Utils::Json::render_results(result, options);
    }
    if (options.output_format == "context") {
        return Fmt::format_context(result.utterances);
    }
    if (options.output_format == "batch") {
        return Fmt::format_batch_record(result.source.audio_path, result.utterances);
    }
    throw std::invalid_argument("unknown output format: " + options.output_format);
}

Fusion::ProviderConfig make_provider_config(const FuseOptions& options) {
    Fusion::ProviderConfig config;
    config.sidecar_dir = options.sidecar_dir;
    config.model = options.model;
    config.verbose = options.verbose;
    return config;
}

namespace {

int run_single(const TranscriptPipeline& pipeline, const FuseOptions& options, const Fusion::TimeRange& range) {
    Fusion::MediaSource source{options.audio_path, options.diarization_path, options.transcription_path};
    auto result = pipeline.process(source, range);

    if (options.verbose) {
        std::map<std::string, double> speaker_durations;
        for (const auto& utterance : result.utterances) {
            speaker_durations[utterance.speaker_id] += utterance.interval.duration();
        }
        Utils::Log::info("👥 " + std::to_string(speaker_durations.size()) + " speakers:");
        for (const auto& [speaker_id, seconds] : speaker_durations) {
            std::ostringstream oss;
            oss << "   " << speaker_id << ": " << std::fixed << std::setprecision(1) << seconds << "s total";
            Utils::Log::info(oss.str());
        }
    }

    if (!Utils::FileSystem::write_output(render_output(result, options), options.output_file)) {
        return 1;
    }
    if (options.verbose && !options.output_file.empty()) {
        Utils::Log::info("✅ Results written to: " + options.output_file);
    }
    return 0;
}

int run_batch(const TranscriptPipeline& pipeline, const FuseOptions& options, const Fusion::TimeRange& range) {
    std::ifstream manifest(options.batch_manifest);
    if (!manifest) {
        Utils::Log::error("❌ Cannot open batch manifest: " + options.batch_manifest);
        return 1;
    }
    auto sources = parse_manifest(manifest);
    if (sources.empty()) {
        Utils::Log::warn("⚠️ Batch manifest lists no files: " + options.batch_manifest);
    }

    BatchRunner runner(pipeline, static_cast<size_t>(options.jobs), options.verbose);
    auto outcomes = runner.run(sources, range);

    std::string records;
    size_t failures = 0;
    std::string unreadable;
    for (const auto& outcome : outcomes) {
        if (!outcome.result) {
            failures++;
            if (!outcome.failed_input.empty()) {
                unreadable += (unreadable.empty() ? "" : ", ") + outcome.failed_input;
            }
            continue;
        }
        records += Fusion::Formatter::format_batch_record(outcome.source.audio_path, outcome.result->utterances);
        records += '\n';
    }

    if (!unreadable.empty()) {
        Utils::Log::warn("⚠️ Unreadable provider inputs: " + unreadable);
    }
    if (!Utils::FileSystem::write_output(records, options.output_file)) {
        return 1;
    }
    if (options.verbose) {
        Utils::Log::info("✅ Batch complete: " + std::to_string(outcomes.size() - failures) + " succeeded, "
                         + std::to_string(failures) + " failed");
    }
    return failures == 0 ? 0 : 1;
}

} // namespace

int run_cli(const FuseOptions& options) {
    const bool batch = !options.batch_manifest.empty();
    const bool has_results = !options.diarization_path.empty() && !options.transcription_path.empty();

    if (!batch && options.audio_path.empty() && !has_results) {
        Utils::Log::error("❌ Error: --audio, or both --diarization and --transcription, or --batch is required");
        Utils::Log::error("Use --help for usage information");
        return 1;
    }

    auto range = Utils::Time::parse_range(options.start_time, options.end_time);

    if (options.verbose) {
        Utils::Log::info("🔧 WhisperDesk Transcript Fusion CLI");
        if (!options.audio_path.empty()) {
            Utils::Log::info("📁 Audio file: " + options.audio_path);
        }
        if (batch) {
            Utils::Log::info("📋 Batch manifest: " + options.batch_manifest);
        }
        Utils::Log::info("⏱️ Time range: " + Utils::Time::format_time(range.start) + " - "
                         + (range.end ? Utils::Time::format_time(*range.end) : std::string("end")));
        Utils::Log::info("🧠 Whisper model: " + options.model);
    }

    if (!options.trim_output.empty()) {
        if (options.audio_path.empty() || !Utils::FileSystem::file_exists(options.audio_path)) {
            Utils::Log::error("❌ Audio file not found: " + options.audio_path);
            return 1;
        }
        long long frames = Utils::Audio::extract_time_range(options.audio_path, options.trim_output, range);
        if (options.verbose) {
            Utils::Log::info("✂️ Wrote " + std::to_string(frames) + " frames to " + options.trim_output);
        }
    }

    TranscriptPipeline pipeline(options.verbose);
    if (!pipeline.initialize(options)) {
        Utils::Log::error("❌ Failed to initialize transcript pipeline");
        return 1;
    }

    return batch ? run_batch(pipeline, options, range) : run_single(pipeline, options, range);
}
