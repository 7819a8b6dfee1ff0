#include <cstddef>
#include <oirun/pair_check/line_diff.hh>
#include <oirun/string_transform.hh>
#include <unordered_map>
#include <utility>

using std::ptrdiff_t;
using std::string;
using std::string_view;
using std::vector;

namespace {

// Lines with their '\n', the last one may lack it
vector<string_view> split_lines(string_view str) {
    vector<string_view> lines;
    size_t beg = 0;
    while (beg < str.size()) {
        auto nl = str.find('\n', beg);
        size_t end = (nl == string_view::npos ? str.size() : nl + 1);
        lines.emplace_back(str.substr(beg, end - beg));
        beg = end;
    }
    return lines;
}

string_view without_newline(string_view line) noexcept {
    if (not line.empty() and line.back() == '\n') {
        line.remove_suffix(1);
    }
    return line;
}

string_view trim_trailing_whitespace(string_view str) noexcept {
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

} // namespace

namespace {

// Longest common subsequence of two id sequences, found with Myers' O(ND)
// algorithm in linear space (middle snake bisection)
class LcsFinder {
    const vector<size_t>& a_;
    const vector<size_t>& b_;
    vector<ptrdiff_t> fwd_;
    vector<ptrdiff_t> bwd_;
    vector<std::pair<size_t, size_t>> matches_;

    struct Snake {
        ptrdiff_t x_beg, y_beg, x_end, y_end;
    };

    Snake middle_snake(ptrdiff_t a0, ptrdiff_t n, ptrdiff_t b0, ptrdiff_t m) {
        ptrdiff_t delta = n - m;
        bool odd = (delta % 2 != 0);
        ptrdiff_t max_d = (n + m + 1) / 2;
        ptrdiff_t off = max_d + 1;
        fwd_[off + 1] = 0;
        bwd_[off + 1] = 0;
        for (ptrdiff_t d = 0; d <= max_d; ++d) {
            for (ptrdiff_t k = -d; k <= d; k += 2) {
                ptrdiff_t x = (k == -d or (k != d and fwd_[off + k - 1] < fwd_[off + k + 1]))
                    ? fwd_[off + k + 1]
                    : fwd_[off + k - 1] + 1;
                ptrdiff_t y = x - k;
                ptrdiff_t x0 = x;
                ptrdiff_t y0 = y;
                while (x < n and y < m and a_[a0 + x] == b_[b0 + y]) {
                    ++x;
                    ++y;
                }
                fwd_[off + k] = x;
                ptrdiff_t rk = delta - k;
                if (odd and rk >= -(d - 1) and rk <= d - 1 and x + bwd_[off + rk] >= n) {
                    return {x0, y0, x, y};
                }
            }
            for (ptrdiff_t k = -d; k <= d; k += 2) {
                ptrdiff_t x = (k == -d or (k != d and bwd_[off + k - 1] < bwd_[off + k + 1]))
                    ? bwd_[off + k + 1]
                    : bwd_[off + k - 1] + 1;
                ptrdiff_t y = x - k;
                ptrdiff_t x0 = x;
                ptrdiff_t y0 = y;
                while (x < n and y < m and a_[a0 + n - 1 - x] == b_[b0 + m - 1 - y]) {
                    ++x;
                    ++y;
                }
                bwd_[off + k] = x;
                ptrdiff_t rk = delta - k;
                if (not odd and rk >= -d and rk <= d and x + fwd_[off + rk] >= n) {
                    return {n - x, m - y, n - x0, m - y0};
                }
            }
        }
        // Unreachable: the paths always meet for d <= max_d
        return {0, 0, 0, 0};
    }

    void find(ptrdiff_t a0, ptrdiff_t a1, ptrdiff_t b0, ptrdiff_t b1) {
        while (a0 < a1 and b0 < b1 and a_[a0] == b_[b0]) {
            matches_.emplace_back(a0++, b0++);
        }
        ptrdiff_t suffix = 0;
        while (a0 < a1 - suffix and b0 < b1 - suffix and
               a_[a1 - suffix - 1] == b_[b1 - suffix - 1])
        {
            ++suffix;
        }
        a1 -= suffix;
        b1 -= suffix;

        if (a0 < a1 and b0 < b1) {
            auto snake = middle_snake(a0, a1 - a0, b0, b1 - b0);
            find(a0, a0 + snake.x_beg, b0, b0 + snake.y_beg);
            for (ptrdiff_t x = snake.x_beg, y = snake.y_beg; x < snake.x_end; ++x, ++y) {
                matches_.emplace_back(a0 + x, b0 + y);
            }
            find(a0 + snake.x_end, a1, b0 + snake.y_end, b1);
        }

        for (ptrdiff_t i = 0; i < suffix; ++i) {
            matches_.emplace_back(a1 + i, b1 + i);
        }
    }

public:
    LcsFinder(const vector<size_t>& a, const vector<size_t>& b)
    : a_(a)
    , b_(b)
    , fwd_(a.size() + b.size() + 4)
    , bwd_(a.size() + b.size() + 4) {}

    // Pairs of matched indices, increasing in both coordinates
    vector<std::pair<size_t, size_t>> run() && {
        find(0, static_cast<ptrdiff_t>(a_.size()), 0, static_cast<ptrdiff_t>(b_.size()));
        return std::move(matches_);
    }
};

} // namespace

namespace oirun::pair_check {

string normalize_output(string_view output) {
    string unified;
    unified.reserve(output.size());
    for (size_t i = 0; i < output.size(); ++i) {
        if (output[i] == '\r' and i + 1 < output.size() and output[i + 1] == '\n') {
            continue;
        }
        unified += output[i];
    }

    string res;
    res.reserve(unified.size());
    for (auto line : split_lines(unified)) {
        bool had_newline = (not line.empty() and line.back() == '\n');
        res += trim_trailing_whitespace(without_newline(line));
        if (had_newline) {
            res += '\n';
        }
    }
    res.resize(trim_trailing_whitespace(res).size());
    return res;
}

vector<DiffSegment> line_diff(string_view a, string_view b) {
    auto lines_a = split_lines(a);
    auto lines_b = split_lines(b);

    // A line without the final '\n' still matches the same line with it
    std::unordered_map<string_view, size_t> line_ids;
    auto to_ids = [&](const vector<string_view>& lines) {
        vector<size_t> ids;
        ids.reserve(lines.size());
        for (auto line : lines) {
            auto [it, inserted] = line_ids.try_emplace(without_newline(line), line_ids.size());
            ids.emplace_back(it->second);
        }
        return ids;
    };
    auto ids_a = to_ids(lines_a);
    auto ids_b = to_ids(lines_b);

    // Lines present on one side only never match, leave them out of the search
    vector<bool> in_a(line_ids.size(), false);
    vector<bool> in_b(line_ids.size(), false);
    for (auto id : ids_a) {
        in_a[id] = true;
    }
    for (auto id : ids_b) {
        in_b[id] = true;
    }
    auto common_part = [](const vector<size_t>& ids, const vector<bool>& present) {
        std::pair<vector<size_t>, vector<size_t>> res; // (ids, original positions)
        for (size_t i = 0; i < ids.size(); ++i) {
            if (present[ids[i]]) {
                res.first.emplace_back(ids[i]);
                res.second.emplace_back(i);
            }
        }
        return res;
    };
    auto [common_a, pos_a] = common_part(ids_a, in_b);
    auto [common_b, pos_b] = common_part(ids_b, in_a);
    auto matches = LcsFinder{common_a, common_b}.run();

    vector<DiffSegment> segments;
    auto append = [&](DiffSegment::Kind kind, string_view line) {
        if (segments.empty() or segments.back().kind != kind) {
            segments.push_back({kind, {}});
        }
        segments.back().text += line;
    };

    size_t i = 0;
    size_t j = 0;
    auto emit_until = [&](size_t end_a, size_t end_b) {
        while (i < end_a) {
            append(DiffSegment::Kind::REMOVED, lines_a[i++]);
        }
        while (j < end_b) {
            append(DiffSegment::Kind::ADDED, lines_b[j++]);
        }
    };
    for (auto [ci, cj] : matches) {
        emit_until(pos_a[ci], pos_b[cj]);
        // Keep each side exact when only one of the lines ends with '\n'
        if (lines_a[i] == lines_b[j]) {
            append(DiffSegment::Kind::UNCHANGED, lines_a[i]);
        } else {
            append(DiffSegment::Kind::REMOVED, lines_a[i]);
            append(DiffSegment::Kind::ADDED, lines_b[j]);
        }
        ++i;
        ++j;
    }
    emit_until(lines_a.size(), lines_b.size());
    return segments;
}

} // namespace oirun::pair_check
