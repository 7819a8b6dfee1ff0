#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace oirun::pair_check {

// Replaces CRLF with LF and strips trailing whitespace of every line and of
// the whole text
std::string normalize_output(std::string_view output);

struct DiffSegment {
    enum class Kind { UNCHANGED, ADDED, REMOVED };

    Kind kind;
    std::string text; // whole lines, each ending with '\n' except possibly the last one

    bool operator==(const DiffSegment&) const = default;
};

constexpr std::string_view to_str(DiffSegment::Kind kind) noexcept {
    switch (kind) {
    case DiffSegment::Kind::UNCHANGED: return "unchanged";
    case DiffSegment::Kind::ADDED: return "added";
    case DiffSegment::Kind::REMOVED: return "removed";
    }
    return "unknown";
}

/**
 * @brief Line diff of @p a and @p b based on their longest common
 *   subsequence of lines
 * @details Concatenating UNCHANGED and REMOVED segments in order gives @p a,
 *   UNCHANGED and ADDED segments give @p b. Adjacent lines of the same kind
 *   are merged into one segment; within a change REMOVED comes first.
 *   Runs in O((N + M) * D) time and linear memory, where D is the number of
 *   differing lines that have a counterpart on the other side.
 */
std::vector<DiffSegment> line_diff(std::string_view a, std::string_view b);

} // namespace oirun::pair_check
