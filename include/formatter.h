// src/native/fusion/include/formatter.h
#pragma once

#include "include/transcript-types.h"

#include <string>
#include <vector>

namespace Fusion {
namespace Formatter {

/**
 * Seconds with two decimals, e.g. 3.61
 */
std::string format_seconds(double seconds);

/**
 * Display line for one utterance
 * @return "<speaker> (<start>s - <end>s): <text>"
 */
std::string format_utterance(const LabeledUtterance& utterance);

/**
 * Display lines for every utterance, separated by a blank line
 * (layout of the downloadable transcript file)
 */
std::string format_transcript(const std::vector<LabeledUtterance>& utterances);

/**
 * "<speaker>: <text>" per line, used as conversation context for summarizers
 */
std::string format_context(const std::vector<LabeledUtterance>& utterances);

/**
 * All utterance text joined by single spaces, newlines folded to spaces
 */
std::string concatenate_text(const std::vector<LabeledUtterance>& utterances);

/**
 * One record of a multi-file listing
 * @return "<source>|<concatenated text>"
 */
std::string format_batch_record(const std::string& source,
                                const std::vector<LabeledUtterance>& utterances);

} // namespace Formatter
} // namespace Fusion
