// SPDX-License-Identifier: Apache-2.0
#include "TextDiff.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

namespace mcprt
{

namespace
{

    // Above this many table cells the changed region is reported as one replaced block.
    constexpr auto MaxLcsCells = size_t { 4'000'000 };

    struct DiffLine
    {
        char tag; // ' ' unchanged, '-' removed, '+' added
        std::string_view text;
    };

    auto diffLines(const std::vector<std::string_view>& a, const std::vector<std::string_view>& b)
        -> std::vector<DiffLine>
    {
        auto prefix = size_t { 0 };
        while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix])
            ++prefix;

        auto suffix = size_t { 0 };
        while (suffix < a.size() - prefix && suffix < b.size() - prefix
               && a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix])
            ++suffix;

        auto result = std::vector<DiffLine> {};
        result.reserve(a.size() + b.size());
        for (size_t i = 0; i < prefix; ++i)
            result.push_back(DiffLine { ' ', a[i] });

        auto const n = a.size() - prefix - suffix;
        auto const m = b.size() - prefix - suffix;
        auto const oldLine = [&](size_t i) { return a[prefix + i]; };
        auto const newLine = [&](size_t j) { return b[prefix + j]; };

        if (n * m <= MaxLcsCells)
        {
            // lcs(i, j) is the length of the longest common subsequence of old[i..] and new[j..].
            auto table = std::vector<std::uint32_t>((n + 1) * (m + 1), 0);
            auto const lcs = [&](size_t i, size_t j) -> std::uint32_t& { return table[i * (m + 1) + j]; };
            for (size_t i = n; i-- > 0;)
            {
                for (size_t j = m; j-- > 0;)
                {
                    lcs(i, j) = oldLine(i) == newLine(j) ? lcs(i + 1, j + 1) + 1
                                                         : std::max(lcs(i + 1, j), lcs(i, j + 1));
                }
            }

            auto i = size_t { 0 };
            auto j = size_t { 0 };
            while (i < n && j < m)
            {
                if (oldLine(i) == newLine(j))
                {
                    result.push_back(DiffLine { ' ', oldLine(i) });
                    ++i;
                    ++j;
                }
                else if (lcs(i + 1, j) >= lcs(i, j + 1))
                    result.push_back(DiffLine { '-', oldLine(i++) });
                else
                    result.push_back(DiffLine { '+', newLine(j++) });
            }
            for (; i < n; ++i)
                result.push_back(DiffLine { '-', oldLine(i) });
            for (; j < m; ++j)
                result.push_back(DiffLine { '+', newLine(j) });
        }
        else
        {
            for (size_t i = 0; i < n; ++i)
                result.push_back(DiffLine { '-', oldLine(i) });
            for (size_t j = 0; j < m; ++j)
                result.push_back(DiffLine { '+', newLine(j) });
        }

        for (size_t i = a.size() - suffix; i < a.size(); ++i)
            result.push_back(DiffLine { ' ', a[i] });
        return result;
    }

    // Range of a hunk header; @p start is zero-based.
    auto formatRange(size_t start, size_t length) -> std::string
    {
        auto beginning = start + 1;
        if (length == 1)
            return std::format("{}", beginning);
        if (length == 0)
            --beginning;
        return std::format("{},{}", beginning, length);
    }

} // namespace

auto splitTextLines(std::string_view text) -> std::vector<std::string_view>
{
    auto lines = std::vector<std::string_view> {};
    while (!text.empty())
    {
        auto const end = text.find('\n');
        auto line = text.substr(0, end);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        lines.push_back(line);
        if (end == std::string_view::npos)
            break;
        text.remove_prefix(end + 1);
    }
    return lines;
}

auto unifiedDiff(
    std::string_view before, std::string_view after, std::string_view fromFile, std::string_view toFile, size_t context)
    -> std::string
{
    auto const lines = diffLines(splitTextLines(before), splitTextLines(after));

    auto changes = std::vector<size_t> {};
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (lines[i].tag != ' ')
            changes.push_back(i);
    }
    if (changes.empty())
        return {};

    auto output = std::format("--- {}\n+++ {}", fromFile, toFile);

    for (size_t first = 0; first < changes.size();)
    {
        auto last = first;
        while (last + 1 < changes.size() && changes[last + 1] - changes[last] - 1 <= 2 * context)
            ++last;

        auto const begin = changes[first] > context ? changes[first] - context : 0;
        auto const end = std::min(lines.size(), changes[last] + context + 1);

        auto oldStart = size_t { 0 };
        auto newStart = size_t { 0 };
        for (size_t i = 0; i < begin; ++i)
        {
            oldStart += lines[i].tag != '+' ? 1 : 0;
            newStart += lines[i].tag != '-' ? 1 : 0;
        }

        auto oldLength = size_t { 0 };
        auto newLength = size_t { 0 };
        auto body = std::string {};
        for (size_t i = begin; i < end; ++i)
        {
            oldLength += lines[i].tag != '+' ? 1 : 0;
            newLength += lines[i].tag != '-' ? 1 : 0;
            body += '\n';
            body += lines[i].tag;
            body += lines[i].text;
        }

        output += std::format("\n@@ -{} +{} @@", formatRange(oldStart, oldLength), formatRange(newStart, newLength));
        output += body;
        first = last + 1;
    }
    return output;
}

} // namespace mcprt
