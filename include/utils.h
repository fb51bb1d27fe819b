// src/native/fusion/include/utils.h
#pragma once

#include <vector>
#include <string>
#include <map>

#include "include/transcript-types.h"

// Forward declarations
struct FuseOptions;
struct FusionJobResult;

namespace Utils {

/**
 * Audio I/O functions
 */
namespace Audio {
    /**
     * Copy a time window of an audio file into a 16-bit PCM WAV file
     * @param input_path Source audio (any format libsndfile reads)
     * @param output_path Destination WAV file
     * @param range Window to extract; an unset end copies to the end of the file
     * @return Number of frames written
     */
    long long extract_time_range(const std::string& input_path,
                                 const std::string& output_path,
                                 const Fusion::TimeRange& range);
}

/**
 * JSON input and output
 */
namespace Json {
    /**
     * Render a fused transcript as a JSON document
     * @param result Aligned utterances and job metadata
     * @param options Options used for the job
     * @return Pretty-printed JSON
     */
    std::string render_results(const FusionJobResult& result, const FuseOptions& options);

    /**
     * Generate speaker statistics
     * @param utterances Labeled utterances
     * @return Map of speaker_id -> statistics
     */
    std::map<std::string, std::map<std::string, double>> generate_speaker_stats(
        const std::vector<Fusion::LabeledUtterance>& utterances);

    /**
     * Overlay options from a JSON config file
     * @param file_path Config file path
     * @param options Options to update in place
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    void load_config(const std::string& file_path, FuseOptions& options);
}

/**
 * Command line argument parsing
 */
namespace Args {
    /**
     * Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options
     * @throws std::invalid_argument on a bad value
     */
    FuseOptions parse_arguments(int argc, char* argv[]);

    /**
     * Print help message
     */
    void print_help();

    /**
     * Print version information
     */
    void print_version();
}

/**
 * File system utilities
 */
namespace FileSystem {
    /**
     * Check if file exists
     * @param file_path Path to check
     * @return true if file exists
     */
    bool file_exists(const std::string& file_path);

    /**
     * Write content to a file, or to stdout when file_path is empty
     * @return false if the file could not be written
     */
    bool write_output(const std::string& content, const std::string& file_path);
}

/**
 * Time formatting utilities
 */
namespace Time {
    /**
     * Format seconds as HH:MM:SS.mmm
     * @param seconds Time in seconds
     * @return Formatted time string
     */
    std::string format_time(double seconds);

    /**
     * Check a time string is [HH:]MM:SS[.mmm]
     */
    bool validate_time_format(const std::string& time_str);

    /**
     * Parse [HH:]MM:SS[.mmm] or plain seconds into seconds
     * @throws std::invalid_argument on a malformed string
     */
    double parse_time(const std::string& time_str);

    /**
     * Build a time range from optional start/end strings
     * @throws std::invalid_argument if a string is malformed or end <= start
     */
    Fusion::TimeRange parse_range(const std::string& start_str, const std::string& end_str);

    /**
     * Get current timestamp as ISO string
     * @return ISO timestamp string
     */
    std::string get_current_timestamp();
}

/**
 * Console logging, one line at a time even from worker threads
 */
namespace Log {
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
}

} // namespace Utils
