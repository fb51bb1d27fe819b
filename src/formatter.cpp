// src/native/fusion/formatter.cpp
#include "include/formatter.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Fusion {
namespace Formatter {

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds;
    return oss.str();
}

std::string format_utterance(const LabeledUtterance& utterance) {
    return utterance.speaker_id + " (" + format_seconds(utterance.interval.start) + "s - "
         + format_seconds(utterance.interval.end) + "s): " + utterance.text;
}

std::string format_transcript(const std::vector<LabeledUtterance>& utterances) {
    std::string out;
    for (size_t i = 0; i < utterances.size(); i++) {
        if (i > 0) {
            out += "\n\n";
        }
        out += format_utterance(utterances[i]);
    }
    return out;
}

std::string format_context(const std::vector<LabeledUtterance>& utterances) {
    std::string out;
    for (size_t i = 0; i < utterances.size(); i++) {
        if (i > 0) {
            out += '\n';
        }
        out += utterances[i].speaker_id + ": " + utterances[i].text;
    }
    return out;
}

std::string concatenate_text(const std::vector<LabeledUtterance>& utterances) {
    std::string out;
    for (const auto& utterance : utterances) {
        if (utterance.text.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += utterance.text;
    }
    // A record must stay on one line
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return out;
}

std::string format_batch_record(const std::string& source,
                                const std::vector<LabeledUtterance>& utterances) {
    return source + "|" + concatenate_text(utterances);
}

} // namespace Formatter
} // namespace Fusion
