// src/native/fusion/utils.cpp
#include "include/utils.h"
#include "include/fuse-cli.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <chrono>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <json/json.h>
#include <sndfile.h>

namespace Utils {

// Audio I/O functions
namespace Audio {

namespace {

struct SndFileCloser {
    void operator()(SNDFILE* file) const { sf_close(file); }
};

using SndFilePtr = std::unique_ptr<SNDFILE, SndFileCloser>;

} // namespace

long long extract_time_range(const std::string& input_path,
                             const std::string& output_path,
                             const Fusion::TimeRange& range) {
    SF_INFO in_info{};
    SndFilePtr in_file(sf_open(input_path.c_str(), SFM_READ, &in_info));
    if (!in_file) {
        throw std::runtime_error("Failed to open audio file: " + input_path + " (" + sf_strerror(nullptr) + ")");
    }

    const double total_duration = static_cast<double>(in_info.frames) / in_info.samplerate;
    if (range.start >= total_duration) {
        throw std::runtime_error("Start time " + Time::format_time(range.start)
                                 + " is past the end of " + input_path);
    }

    sf_count_t start_frame = static_cast<sf_count_t>(range.start * in_info.samplerate);
    sf_count_t end_frame = in_info.frames;
    if (range.end) {
        end_frame = std::min(in_info.frames, static_cast<sf_count_t>(*range.end * in_info.samplerate));
    }

    if (sf_seek(in_file.get(), start_frame, SEEK_SET) < 0) {
        throw std::runtime_error("Failed to seek in audio file: " + input_path);
    }

    SF_INFO out_info{};
    out_info.samplerate = in_info.samplerate;
    out_info.channels = in_info.channels;
    out_info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SndFilePtr out_file(sf_open(output_path.c_str(), SFM_WRITE, &out_info));
    if (!out_file) {
        throw std::runtime_error("Failed to create audio file: " + output_path + " ("
                                 + sf_strerror(nullptr) + ")");
    }

    // Copy in blocks to keep memory flat for long recordings
    const sf_count_t block_frames = 65536;
    std::vector<float> buffer(static_cast<size_t>(block_frames * in_info.channels));
    sf_count_t remaining = end_frame - start_frame;
    long long written = 0;

    while (remaining > 0) {
        sf_count_t wanted = std::min(block_frames, remaining);
        sf_count_t got = sf_readf_float(in_file.get(), buffer.data(), wanted);
        if (got <= 0) {
            break;
        }
        if (sf_writef_float(out_file.get(), buffer.data(), got) != got) {
            throw std::runtime_error("Failed to write audio file: " + output_path + " ("
                                     + sf_strerror(out_file.get()) + ")");
        }
        written += got;
        remaining -= got;
    }

    return written;
}

} // namespace Audio

// JSON output formatting
namespace Json {

std::string render_results(const FusionJobResult& result, const FuseOptions& options) {
    // Fully qualified names: Utils::Json shadows the jsoncpp namespace here
    ::Json::Value root;
    ::Json::Value segments_json(::Json::arrayValue);

    auto speaker_stats = generate_speaker_stats(result.utterances);

    for (const auto& utterance : result.utterances) {
        ::Json::Value seg;
        seg["start_time"] = utterance.interval.start;
        seg["end_time"] = utterance.interval.end;
        seg["speaker_id"] = utterance.speaker_id;
        seg["duration"] = utterance.interval.duration();
        seg["text"] = utterance.text;
        if (utterance.confidence) {
            seg["confidence"] = *utterance.confidence;
        }
        segments_json.append(seg);
    }

    root["segments"] = segments_json;
    root["total_speakers"] = static_cast<int>(speaker_stats.size());
    root["total_duration"] = result.utterances.empty() ? 0.0 : result.utterances.back().interval.end;
    root["audio_path"] = result.source.audio_path;
    root["created_at"] = Time::get_current_timestamp();

    ::Json::Value warnings_json(::Json::arrayValue);
    for (auto warning : result.warnings) {
        warnings_json.append(Fusion::describe(warning));
    }
    root["warnings"] = warnings_json;

    ::Json::Value source_info;
    source_info["diarization_format"] = options.diarization_format;
    source_info["whisper_model"] = options.model;
    source_info["speaker_turns"] = static_cast<::Json::UInt64>(result.turn_count);
    source_info["transcript_segments"] = static_cast<::Json::UInt64>(result.segment_count);
    source_info["range_start"] = Time::format_time(result.range.start);
    if (result.range.end) {
        source_info["range_end"] = Time::format_time(*result.range.end);
    }
    root["source_info"] = source_info;

    ::Json::Value speakers_json(::Json::arrayValue);
    for (const auto& [speaker_id, stats] : speaker_stats) {
        ::Json::Value speaker;
        speaker["speaker_id"] = speaker_id;
        speaker["utterance_count"] = static_cast<int>(stats.at("utterance_count"));
        speaker["total_duration"] = stats.at("total_duration");
        speaker["word_count"] = static_cast<int>(stats.at("word_count"));
        if (stats.at("confidence_samples") > 0.0) {
            speaker["average_confidence"] = stats.at("average_confidence");
        } else {
            speaker["average_confidence"] = ::Json::Value(::Json::nullValue);
        }
        speakers_json.append(speaker);
    }
    root["speakers"] = speakers_json;

    ::Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    return ::Json::writeString(writer, root);
}

std::map<std::string, std::map<std::string, double>> generate_speaker_stats(
    const std::vector<Fusion::LabeledUtterance>& utterances) {
    std::map<std::string, std::map<std::string, double>> stats;

    for (const auto& utterance : utterances) {
        auto& speaker_stats = stats[utterance.speaker_id];
        if (speaker_stats.empty()) {
            speaker_stats = {
                {"utterance_count", 0.0},
                {"total_duration", 0.0},
                {"word_count", 0.0},
                {"confidence_sum", 0.0},
                {"confidence_samples", 0.0},
                {"average_confidence", 0.0}
            };
        }

        std::istringstream words(utterance.text);
        double word_count = static_cast<double>(std::distance(std::istream_iterator<std::string>(words),
                                                              std::istream_iterator<std::string>()));

        speaker_stats["utterance_count"] += 1.0;
        speaker_stats["total_duration"] += utterance.interval.duration();
        speaker_stats["word_count"] += word_count;

        // Weighted by the number of scored segments behind each utterance
        if (utterance.confidence) {
            speaker_stats["confidence_sum"] += *utterance.confidence * utterance.confidence_samples;
            speaker_stats["confidence_samples"] += utterance.confidence_samples;
        }
    }

    // Calculate averages
    for (auto& [speaker_id, speaker_stats] : stats) {
        double samples = speaker_stats["confidence_samples"];
        if (samples > 0) {
            speaker_stats["average_confidence"] = speaker_stats["confidence_sum"] / samples;
        }
    }

    return stats;
}

void load_config(const std::string& file_path, FuseOptions& options) {
    std::ifstream file(file_path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + file_path);
    }

    ::Json::CharReaderBuilder builder;
    ::Json::Value root;
    std::string errors;
    if (!::Json::parseFromStream(builder, file, &root, &errors)) {
        throw std::runtime_error("Invalid config file " + file_path + ": " + errors);
    }

    auto read_string = [&root](const char* key, std::string& target) {
        if (root.isMember(key)) {
            target = root[key].asString();
        }
    };

    read_string("diarization_format", options.diarization_format);
    read_string("output_format", options.output_format);
    read_string("sidecar_dir", options.sidecar_dir);
    read_string("model", options.model);
    read_string("start", options.start_time);
    read_string("end", options.end_time);
    if (root.isMember("jobs")) {
        options.jobs = root["jobs"].asInt();
    }
    if (root.isMember("verbose")) {
        options.verbose = root["verbose"].asBool();
    }
}

} // namespace Json

// Command line argument parsing
namespace Args {

FuseOptions parse_arguments(int argc, char* argv[]) {
    FuseOptions options;

    // The config file only supplies defaults, so it is applied before any other flag
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_file = argv[i + 1];
            Json::load_config(options.config_file, options);
            break;
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--audio" && i + 1 < argc) {
            options.audio_path = argv[++i];
        } else if (arg == "--diarization" && i + 1 < argc) {
            options.diarization_path = argv[++i];
        } else if (arg == "--transcription" && i + 1 < argc) {
            options.transcription_path = argv[++i];
        } else if (arg == "--diarization-format" && i + 1 < argc) {
            options.diarization_format = argv[++i];
        } else if (arg == "--batch" && i + 1 < argc) {
            options.batch_manifest = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            options.start_time = argv[++i];
        } else if (arg == "--end" && i + 1 < argc) {
            options.end_time = argv[++i];
        } else if (arg == "--trim-output" && i + 1 < argc) {
            options.trim_output = argv[++i];
        } else if (arg == "--output-format" && i + 1 < argc) {
            options.output_format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            options.output_file = argv[++i];
        } else if (arg == "--sidecar-dir" && i + 1 < argc) {
            options.sidecar_dir = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            options.model = argv[++i];
        } else if (arg == "--jobs" && i + 1 < argc) {
            options.jobs = std::stoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            ++i;  // already applied
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_help();
            exit(0);
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            exit(0);
        } else {
            throw std::invalid_argument("Unknown or incomplete option: " + arg);
        }
    }

    if (options.jobs < 0) {
        throw std::invalid_argument("--jobs must not be negative");
    }

    return options;
}

void print_help() {
    std::cout << "WhisperDesk Transcript Fusion CLI\n\n"
              << "USAGE:\n"
              << "    fuse-cli [OPTIONS]\n\n"
              << "INPUT (one of):\n"
              << "    --audio <PATH>                  Audio file; model outputs are read from sidecar files\n"
              << "    --diarization <PATH>            Diarization result file\n"
              << "    --transcription <PATH>          Transcription result file (whisper JSON)\n"
              << "    --batch <PATH>                  Manifest, one job per line:\n"
              << "                                    audio_path[|diarization|transcription]\n"
              << "                                    Writes one audio_path|text record per file\n\n"
              << "OPTIONS:\n"
              << "    --diarization-format <FMT>      json or rttm (default: json)\n"
              << "    --start <HH:MM:SS>              Start of the time range (default: 00:00:00)\n"
              << "    --end <HH:MM:SS>                End of the time range (default: end of audio)\n"
              << "    --trim-output <PATH>            Also write the time range of --audio to a WAV file\n"
              << "    --output-format <FORMAT>        text, json, context or batch (default: text)\n"
              << "    --output <PATH>                 Output file (default: stdout)\n"
              << "    --sidecar-dir <DIR>             Directory holding sidecar files (default: audio dir)\n"
              << "    --model <NAME>                  Whisper model the transcripts came from (default: base)\n"
              << "    --jobs <NUM>                    Worker threads for --batch (default: all cores)\n"
              << "    --config <PATH>                 JSON file with default option values\n"
              << "    --verbose                       Verbose output with detailed progress\n"
              << "    --help, -h                      Show this help\n"
              << "    --version, -v                   Show version\n\n"
              << "SIDECAR FILES:\n"
              << "    <stem>.diarization.json, <stem>.rttm, <stem>.transcription.json\n\n"
              << "EXAMPLES:\n"
              << "    # Fuse diarize-cli and whisper output:\n"
              << "    fuse-cli --diarization talk.diarization.json \\\n"
              << "             --transcription talk.transcription.json\n\n"
              << "    # First five minutes, with the trimmed audio saved:\n"
              << "    fuse-cli --audio talk.wav --start 00:00:00 --end 00:05:00 \\\n"
              << "             --trim-output talk-0-5.wav --output talk.txt\n\n"
              << "    # Many recordings on 4 threads:\n"
              << "    fuse-cli --batch recordings.txt --jobs 4 --output transcripts.txt\n";
}

void print_version() {
    std::cout << "WhisperDesk Transcript Fusion CLI v1.0.0\n"
              << "Aligns speaker diarization with whisper transcripts\n"
              << "Copyright (c) 2024 WhisperDesk Team\n";
}

} // namespace Args

// File system utilities
namespace FileSystem {

bool file_exists(const std::string& file_path) {
    std::ifstream file(file_path);
    return file.good();
}

bool write_output(const std::string& content, const std::string& file_path) {
    if (file_path.empty()) {
        std::cout << content;
        if (!content.empty() && content.back() != '\n') {
            std::cout << '\n';
        }
        std::cout << std::flush;
        return true;
    }

    std::ofstream output_file(file_path);
    if (!output_file) {
        Log::error("❌ Failed to write output file: " + file_path);
        return false;
    }
    output_file << content;
    if (!content.empty() && content.back() != '\n') {
        output_file << '\n';
    }
    return static_cast<bool>(output_file);
}

} // namespace FileSystem

// Time formatting utilities
namespace Time {

std::string format_time(double seconds) {
    int hours = static_cast<int>(seconds / 3600.0);
    int minutes = static_cast<int>(std::fmod(seconds, 3600.0) / 60.0);
    double secs = seconds - hours * 3600.0 - minutes * 60.0;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ":"
        << std::setfill('0') << std::setw(2) << minutes << ":"
        << std::setfill('0') << std::setw(6) << std::fixed << std::setprecision(3) << secs;

    return oss.str();
}

bool validate_time_format(const std::string& time_str) {
    static const std::regex pattern(R"(^([0-9]{1,2}:)?[0-5]?[0-9]:[0-5][0-9](\.[0-9]{1,3})?$)");
    return std::regex_match(time_str, pattern);
}

double parse_time(const std::string& time_str) {
    static const std::regex plain_seconds(R"(^[0-9]+(\.[0-9]+)?$)");
    if (std::regex_match(time_str, plain_seconds)) {
        return std::stod(time_str);
    }
    if (!validate_time_format(time_str)) {
        throw std::invalid_argument("Invalid time format '" + time_str + "', use HH:MM:SS or MM:SS");
    }

    double fraction = 0.0;
    std::string clock = time_str;
    size_t dot_pos = time_str.find('.');
    if (dot_pos != std::string::npos) {
        fraction = std::stod("0" + time_str.substr(dot_pos));
        clock = time_str.substr(0, dot_pos);
    }

    std::vector<int> parts;
    std::stringstream ss(clock);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(std::stoi(part));
    }

    int seconds = 0;
    for (int value : parts) {
        seconds = seconds * 60 + value;
    }
    return seconds + fraction;
}

Fusion::TimeRange parse_range(const std::string& start_str, const std::string& end_str) {
    Fusion::TimeRange range;
    if (!start_str.empty()) {
        range.start = parse_time(start_str);
    }
    if (!end_str.empty()) {
        range.end = parse_time(end_str);
        if (*range.end <= range.start) {
            throw std::invalid_argument("End time " + end_str + " must be after start time "
                                        + (start_str.empty() ? std::string("00:00:00") : start_str));
        }
    }
    return range;
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return oss.str();
}

} // namespace Time

// Console logging
namespace Log {

namespace {
std::mutex log_mutex;
}

// Progress goes to clog so stdout carries only the transcript
void info(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::clog << message << std::endl;
}

void warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << message << std::endl;
}

void error(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << message << std::endl;
}

} // namespace Log

} // namespace Utils
