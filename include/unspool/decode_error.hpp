#pragma once

#include <string>
#include <utility>
#include <vector>

namespace unspool {

/// Prefix attached to every message raised through fail()
inline constexpr const char* failed_reading_prefix = "Failed reading: ";

/**
 * @brief Render a label trace
 *
 * @param trace Labels, outermost first
 * @return "Empty call stack" for an empty trace, otherwise
 *         "From:\t<label_1>\n\t<label_2>...\n"
 */
[[nodiscard]] inline std::string format_trace(const std::vector<std::string>& trace) {
    if (trace.empty()) {
        return "Empty call stack";
    }
    std::string out = "From:\t";
    for (std::size_t i = 0; i < trace.size(); ++i) {
        if (i != 0) {
            out += "\n\t";
        }
        out += trace[i];
    }
    out += "\n";
    return out;
}

/**
 * @brief Error information from a failed decode
 *
 * Carries the failure reason raised at the failure site and the labels of every
 * enclosing label() combinator, outermost first. Labels are collected only on
 * the failure path.
 */
struct DecodeError {
    std::string reason;              ///< Message from the failing primitive
    std::vector<std::string> trace;  ///< Enclosing labels, outermost first

    DecodeError() = default;
    DecodeError(std::string why, std::vector<std::string> labels)
        : reason(std::move(why)),
          trace(std::move(labels)) {}

    /**
     * @brief Human-readable error text
     *
     * The reason, a newline, the rendered trace, and a trailing newline.
     */
    [[nodiscard]] std::string message() const { return reason + "\n" + format_trace(trace) + "\n"; }

    friend bool operator==(const DecodeError&, const DecodeError&) = default;
};

} // namespace unspool
