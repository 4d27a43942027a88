#include "core/line_diff.hpp"

#include <algorithm>
#include <memory>

namespace core {

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

std::vector<DiffLine> diff_lines(std::string_view old_text, std::string_view new_text) {
    const auto a = split_lines(old_text);
    const auto b = split_lines(new_text);
    const std::size_t n = a.size();
    const std::size_t m = b.size();

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix && a[n - 1 - suffix] == b[m - 1 - suffix]) {
        ++suffix;
    }

    std::vector<DiffLine> script;
    script.reserve(n + m);
    for (std::size_t i = 0; i < prefix; ++i) {
        script.push_back({DiffOp::Context, std::string(a[i])});
    }

    const std::size_t na = n - prefix - suffix;
    const std::size_t nb = m - prefix - suffix;
    const bool fits = na == 0 || nb == 0 || (na + 1) <= kMaxLcsCells / (nb + 1);
    if (!fits) {
        for (std::size_t i = 0; i < na; ++i) {
            script.push_back({DiffOp::Removed, std::string(a[prefix + i])});
        }
        for (std::size_t j = 0; j < nb; ++j) {
            script.push_back({DiffOp::Added, std::string(b[prefix + j])});
        }
    } else {
        // lcs[i][j] = LCS length of a[prefix+i..] and b[prefix+j..]
        const std::size_t width = nb + 1;
        auto lcs = std::make_unique<std::uint32_t[]>((na + 1) * width);
        auto at = [&](std::size_t i, std::size_t j) -> std::uint32_t& { return lcs[i * width + j]; };
        for (std::size_t i = na; i-- > 0;) {
            for (std::size_t j = nb; j-- > 0;) {
                if (a[prefix + i] == b[prefix + j]) {
                    at(i, j) = at(i + 1, j + 1) + 1;
                } else {
                    at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
                }
            }
        }
        std::size_t i = 0;
        std::size_t j = 0;
        while (i < na && j < nb) {
            if (a[prefix + i] == b[prefix + j]) {
                script.push_back({DiffOp::Context, std::string(a[prefix + i])});
                ++i;
                ++j;
            } else if (at(i + 1, j) >= at(i, j + 1)) {
                script.push_back({DiffOp::Removed, std::string(a[prefix + i])});
                ++i;
            } else {
                script.push_back({DiffOp::Added, std::string(b[prefix + j])});
                ++j;
            }
        }
        for (; i < na; ++i) {
            script.push_back({DiffOp::Removed, std::string(a[prefix + i])});
        }
        for (; j < nb; ++j) {
            script.push_back({DiffOp::Added, std::string(b[prefix + j])});
        }
    }

    for (std::size_t k = n - suffix; k < n; ++k) {
        script.push_back({DiffOp::Context, std::string(a[k])});
    }
    return script;
}

std::vector<DiffHunk> make_hunks(const std::vector<DiffLine>& script, std::size_t context) {
    const std::size_t size = script.size();
    // old_before[k] / new_before[k]: lines consumed on each side before script[k].
    std::vector<std::size_t> old_before(size + 1, 0);
    std::vector<std::size_t> new_before(size + 1, 0);
    for (std::size_t k = 0; k < size; ++k) {
        old_before[k + 1] = old_before[k] + (script[k].op != DiffOp::Added ? 1 : 0);
        new_before[k + 1] = new_before[k] + (script[k].op != DiffOp::Removed ? 1 : 0);
    }

    std::vector<DiffHunk> hunks;
    std::size_t floor = 0;
    std::size_t i = 0;
    while (i < size) {
        std::size_t k = i;
        while (k < size && script[k].op == DiffOp::Context) {
            ++k;
        }
        if (k == size) {
            break;
        }
        const std::size_t start = std::max(floor, k >= context ? k - context : 0);
        std::size_t end = k + 1;
        while (true) {
            std::size_t j = end;
            while (j < size && script[j].op == DiffOp::Context) {
                ++j;
            }
            if (j < size && (j - end) <= 2 * context) {
                end = j + 1;
                continue;
            }
            end = std::min(size, end + context);
            break;
        }

        DiffHunk h;
        h.old_count = old_before[end] - old_before[start];
        h.new_count = new_before[end] - new_before[start];
        h.old_start = old_before[start] + (h.old_count > 0 ? 1 : 0);
        h.new_start = new_before[start] + (h.new_count > 0 ? 1 : 0);
        h.lines.assign(script.begin() + static_cast<std::ptrdiff_t>(start),
                       script.begin() + static_cast<std::ptrdiff_t>(end));
        hunks.push_back(std::move(h));
        floor = end;
        i = end;
    }
    return hunks;
}

std::vector<DiffHunk> diff_hunks(std::string_view old_text, std::string_view new_text, std::size_t context) {
    if (old_text == new_text) {
        return {};
    }
    return make_hunks(diff_lines(old_text, new_text), context);
}

std::string render_unified(const std::vector<DiffHunk>& hunks,
                           std::string_view old_label,
                           std::string_view new_label) {
    if (hunks.empty()) {
        return {};
    }
    std::string out;
    out += "--- ";
    out += old_label;
    out += "\n+++ ";
    out += new_label;
    out += '\n';
    for (const auto& h : hunks) {
        out += "@@ -" + std::to_string(h.old_start) + "," + std::to_string(h.old_count) +
               " +" + std::to_string(h.new_start) + "," + std::to_string(h.new_count) + " @@\n";
        for (const auto& line : h.lines) {
            switch (line.op) {
                case DiffOp::Context: out += ' '; break;
                case DiffOp::Removed: out += '-'; break;
                case DiffOp::Added: out += '+'; break;
            }
            out += line.text;
            out += '\n';
        }
    }
    return out;
}

} // namespace core
