// src/native/fusion/providers.cpp
#include "include/providers.h"
#include "include/aligner.h"
#include "include/utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <json/json.h>

namespace Fusion {

namespace {

std::ifstream open_input(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ProviderError(path, "cannot open file");
    }
    return file;
}

Json::Value read_json(std::istream& input, const std::string& origin) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, input, &root, &errors)) {
        throw ProviderError(origin, "invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ProviderError(origin, "expected a JSON object at top level");
    }
    return root;
}

double read_seconds(const Json::Value& item, const char* primary, const char* fallback,
                    const std::string& origin, Json::ArrayIndex index) {
    const Json::Value* value = nullptr;
    if (item.isMember(primary)) {
        value = &item[primary];
    } else if (item.isMember(fallback)) {
        value = &item[fallback];
    }
    if (value == nullptr || !value->isNumeric()) {
        throw ProviderError(origin, "segment " + std::to_string(index) + " has no numeric '"
                                    + primary + "' or '" + fallback + "'");
    }
    return value->asDouble();
}

std::string read_speaker(const Json::Value& item, const std::string& origin, Json::ArrayIndex index) {
    const Json::Value& value = item.isMember("speaker_id") ? item["speaker_id"] : item["speaker"];
    const std::string out_of_range_reason = "segment " + std::to_string(index) + " has an out-of-range speaker id";
    if (value.isIntegral()) {
        if (!value.isInt() || value.asInt() < 0) {
            throw ProviderError(origin, out_of_range_reason);
        }
        return format_speaker_label(value.asInt());
    }
    if (value.isString() && !value.asString().empty()) {
        const std::string label = value.asString();
        if (std::all_of(label.begin(), label.end(), [](unsigned char c) { return std::isdigit(c); })) {
            try {
                return format_speaker_label(std::stoi(label));
            } catch (const std::out_of_range&) {
                throw ProviderError(origin, out_of_range_reason);
            }
        }
        return label;
    }
    throw ProviderError(origin, "segment " + std::to_string(index) + " has no speaker");
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<float> read_confidence(const Json::Value& item) {
    if (item.isMember("confidence") && item["confidence"].isNumeric()) {
        return std::clamp(item["confidence"].asFloat(), 0.0f, 1.0f);
    }
    if (item.isMember("avg_logprob") && item["avg_logprob"].isNumeric()) {
        return std::clamp(static_cast<float>(std::exp(item["avg_logprob"].asDouble())), 0.0f, 1.0f);
    }
    return std::nullopt;
}

std::optional<TimeInterval> clip_interval(const TimeInterval& interval, const TimeRange& range) {
    TimeInterval window{range.start, range.end.value_or(std::numeric_limits<double>::infinity())};
    auto clipped = overlap(interval, window);
    if (!clipped) {
        return std::nullopt;
    }
    return TimeInterval{clipped->start - range.start, clipped->end - range.start};
}

} // namespace

std::string format_speaker_label(int speaker_index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "SPEAKER_%02d", speaker_index);
    return buffer;
}

std::string resolve_result_path(const std::string& audio_path,
                                const std::string& explicit_path,
                                const std::string& sidecar_dir,
                                const std::string& suffix) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    std::filesystem::path audio(audio_path);
    std::filesystem::path dir = sidecar_dir.empty() ? audio.parent_path()
                                                    : std::filesystem::path(sidecar_dir);
    return (dir / (audio.stem().string() + suffix)).string();
}

DiarizationResult parse_diarization_json(std::istream& input, const std::string& origin) {
    Json::Value root = read_json(input, origin);
    const Json::Value& segments = root["segments"];
    if (!segments.isArray()) {
        throw ProviderError(origin, "missing 'segments' array");
    }

    DiarizationResult result;
    result.turns.reserve(segments.size());
    for (Json::ArrayIndex i = 0; i < segments.size(); i++) {
        const Json::Value& item = segments[i];
        SpeakerTurn turn;
        turn.speaker_id = read_speaker(item, origin, i);
        turn.interval.start = read_seconds(item, "start_time", "start", origin, i);
        turn.interval.end = read_seconds(item, "end_time", "end", origin, i);
        result.turns.push_back(std::move(turn));
    }
    return result;
}

DiarizationResult parse_rttm(std::istream& input, const std::string& origin) {
    DiarizationResult result;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        std::istringstream fields(line);
        std::string type, uri, channel, speaker, ortho, stype;
        double start = 0.0;
        double duration = 0.0;

        if (!(fields >> type) || type != "SPEAKER") {
            continue;  // blank lines and other RTTM record types
        }
        if (!(fields >> uri >> channel >> start >> duration >> ortho >> stype >> speaker)) {
            throw ProviderError(origin, "malformed SPEAKER record on line " + std::to_string(line_number));
        }
        result.turns.push_back({speaker, {start, start + duration}});
    }
    return result;
}

TranscriptionResult parse_transcription_json(std::istream& input, const std::string& origin) {
    Json::Value root = read_json(input, origin);
    TranscriptionResult result;

    if (root["segments"].isArray()) {
        const Json::Value& segments = root["segments"];
        for (Json::ArrayIndex i = 0; i < segments.size(); i++) {
            const Json::Value& item = segments[i];
            std::string text = trim(item["text"].asString());
            if (text.empty()) {
                continue;
            }
            TranscriptSegment segment;
            segment.text = std::move(text);
            segment.interval.start = read_seconds(item, "start", "start_time", origin, i);
            segment.interval.end = read_seconds(item, "end", "end_time", origin, i);
            segment.confidence = read_confidence(item);
            result.segments.push_back(std::move(segment));
        }
        return result;
    }

    if (root["transcription"].isArray()) {
        // whisper.cpp -oj: offsets are in milliseconds
        const Json::Value& entries = root["transcription"];
        for (Json::ArrayIndex i = 0; i < entries.size(); i++) {
            const Json::Value& item = entries[i];
            std::string text = trim(item["text"].asString());
            if (text.empty()) {
                continue;
            }
            const Json::Value& offsets = item["offsets"];
            if (!offsets["from"].isNumeric() || !offsets["to"].isNumeric()) {
                throw ProviderError(origin, "transcription entry " + std::to_string(i) + " has no offsets");
            }
            TranscriptSegment segment;
            segment.text = std::move(text);
            segment.interval.start = offsets["from"].asDouble() / 1000.0;
            segment.interval.end = offsets["to"].asDouble() / 1000.0;
            segment.confidence = read_confidence(item);
            result.segments.push_back(std::move(segment));
        }
        return result;
    }

    throw ProviderError(origin, "missing 'segments' or 'transcription' array");
}

DiarizationResult clip_to_range(const DiarizationResult& diarization, const TimeRange& range) {
    validate_turns(diarization.turns);
    if (!range.is_bounded()) {
        return diarization;
    }

    DiarizationResult clipped;
    for (const auto& turn : diarization.turns) {
        if (auto interval = clip_interval(turn.interval, range)) {
            clipped.turns.push_back({turn.speaker_id, *interval});
        }
    }
    return clipped;
}

TranscriptionResult clip_to_range(const TranscriptionResult& transcription, const TimeRange& range) {
    validate_segments(transcription.segments);
    if (!range.is_bounded()) {
        return transcription;
    }

    TranscriptionResult clipped;
    for (const auto& segment : transcription.segments) {
        // Text is kept whole, only the interval is clamped
        if (auto interval = clip_interval(segment.interval, range)) {
            clipped.segments.push_back({segment.text, *interval, segment.confidence});
        }
    }
    return clipped;
}

JsonDiarizationProvider::JsonDiarizationProvider(ProviderConfig config)
    : config_(std::move(config)) {}

DiarizationResult JsonDiarizationProvider::diarize(const MediaSource& source, const TimeRange& range) const {
    std::string path = resolve_result_path(source.audio_path, source.diarization_path,
                                           config_.sidecar_dir, config_.diarization_suffix);
    auto file = open_input(path);
    auto result = clip_to_range(parse_diarization_json(file, path), range);

    if (config_.verbose) {
        Utils::Log::info("👥 Loaded " + std::to_string(result.turns.size()) + " speaker turns from " + path);
    }
    return result;
}

RttmDiarizationProvider::RttmDiarizationProvider(ProviderConfig config)
    : config_(std::move(config)) {}

DiarizationResult RttmDiarizationProvider::diarize(const MediaSource& source, const TimeRange& range) const {
    std::string path = resolve_result_path(source.audio_path, source.diarization_path,
                                           config_.sidecar_dir, config_.rttm_suffix);
    auto file = open_input(path);
    auto result = clip_to_range(parse_rttm(file, path), range);

    if (config_.verbose) {
        Utils::Log::info("👥 Loaded " + std::to_string(result.turns.size()) + " RTTM speaker turns from " + path);
    }
    return result;
}

JsonTranscriptionProvider::JsonTranscriptionProvider(ProviderConfig config)
    : config_(std::move(config)) {}

TranscriptionResult JsonTranscriptionProvider::transcribe(const MediaSource& source, const TimeRange& range) const {
    std::string path = resolve_result_path(source.audio_path, source.transcription_path,
                                           config_.sidecar_dir, config_.transcription_suffix);
    auto file = open_input(path);
    auto result = clip_to_range(parse_transcription_json(file, path), range);

    if (config_.verbose) {
        Utils::Log::info("📝 Loaded " + std::to_string(result.segments.size()) + " transcript segments ("
                         + config_.model + " model) from " + path);
    }
    return result;
}

std::unique_ptr<DiarizationProvider> make_diarization_provider(const std::string& format,
                                                               const ProviderConfig& config) {
    if (format == "json") {
        return std::make_unique<JsonDiarizationProvider>(config);
    }
    if (format == "rttm") {
        return std::make_unique<RttmDiarizationProvider>(config);
    }
    throw std::invalid_argument("unknown diarization format: " + format);
}

} // namespace Fusion
