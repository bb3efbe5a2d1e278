// SPDX-License-Identifier: Apache-2.0
#include "SrtParser.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <string>

namespace srtvoice
{

namespace
{

    constexpr auto Utf8Bom = std::string_view { "\xEF\xBB\xBF" };
    constexpr auto Arrow = std::string_view { "-->" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    auto parseNumber(std::string_view text, int& out) -> bool
    {
        if (text.empty())
            return false;
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, out);
        return ec == std::errc {} && ptr == end && out >= 0;
    }

    struct Line
    {
        std::string_view text;
        int number;
    };

    auto splitLines(std::string_view content) -> std::vector<Line>
    {
        auto lines = std::vector<Line> {};
        auto number = 1;
        while (!content.empty())
        {
            auto const newline = content.find('\n');
            auto const line = content.substr(0, newline);
            lines.push_back({ .text = line.ends_with('\r') ? line.substr(0, line.size() - 1) : line,
                              .number = number++ });
            if (newline == std::string_view::npos)
                break;
            content.remove_prefix(newline + 1);
        }
        return lines;
    }

} // namespace

auto parseSrtTimestamp(std::string_view text) -> Result<Milliseconds>
{
    auto const invalid = [&] {
        return makeError(ErrorCode::ParseError, std::format("Invalid SRT timestamp '{}'", text));
    };

    auto const separator = text.find_first_of(",.");
    if (separator == std::string_view::npos)
        return invalid();

    auto clock = text.substr(0, separator);
    auto const fraction = text.substr(separator + 1);

    auto fields = std::array<int, 3> {};
    for (auto i = 0; i < 3; ++i)
    {
        auto const colon = i < 2 ? clock.find(':') : std::string_view::npos;
        if (i < 2 && colon == std::string_view::npos)
            return invalid();
        if (!parseNumber(clock.substr(0, colon), fields[static_cast<std::size_t>(i)]))
            return invalid();
        if (i < 2)
            clock.remove_prefix(colon + 1);
    }

    auto millis = 0;
    if (fraction.empty() || fraction.size() > 3 || !parseNumber(fraction, millis))
        return invalid();
    // "1,5" means 500 ms, not 5 ms.
    for (auto i = fraction.size(); i < 3; ++i)
        millis *= 10;

    auto const [hours, minutes, seconds] = fields;
    if (minutes > 59 || seconds > 59)
        return invalid();

    return Milliseconds { ((static_cast<long long>(hours) * 60 + minutes) * 60 + seconds) * 1000 + millis };
}

auto parseSrt(std::string_view content) -> Result<std::vector<Cue>>
{
    if (content.starts_with(Utf8Bom))
        content.remove_prefix(Utf8Bom.size());

    auto const lines = splitLines(content);
    auto cues = std::vector<Cue> {};

    auto i = std::size_t { 0 };
    while (i < lines.size())
    {
        if (trim(lines[i].text).empty())
        {
            ++i;
            continue;
        }

        auto cue = Cue {};
        cue.index = static_cast<int>(cues.size()) + 1;

        if (lines[i].text.find(Arrow) == std::string_view::npos)
        {
            auto index = 0;
            if (!parseNumber(trim(lines[i].text), index))
                return makeError(ErrorCode::ParseError,
                                 std::format("Line {}: expected cue index, got '{}'", lines[i].number, lines[i].text));
            cue.index = index;
            ++i;
        }

        if (i >= lines.size() || lines[i].text.find(Arrow) == std::string_view::npos)
        {
            auto const lineNumber = i < lines.size() ? lines[i].number : lines.back().number + 1;
            return makeError(ErrorCode::ParseError, std::format("Line {}: expected cue timing", lineNumber));
        }

        auto const timing = lines[i].text;
        auto const arrow = timing.find(Arrow);
        auto endText = trim(timing.substr(arrow + Arrow.size()));
        // Ignore positional coordinates trailing the end timestamp.
        endText = endText.substr(0, endText.find(' '));

        auto start = parseSrtTimestamp(trim(timing.substr(0, arrow)));
        auto end = parseSrtTimestamp(endText);
        if (!start || !end)
            return makeError(ErrorCode::ParseError,
                             std::format("Line {}: {}", lines[i].number, (!start ? start : end).error().message));
        cue.start = *start;
        cue.end = *end;
        ++i;

        auto text = std::string {};
        while (i < lines.size() && !trim(lines[i].text).empty())
        {
            if (!text.empty())
                text += '\n';
            text += lines[i].text;
            ++i;
        }
        cue.text = std::move(text);

        if (cue.end < cue.start)
            log::warning(
                "Cue {} ends before it starts ({} ms > {} ms)", cue.index, cue.start.count(), cue.end.count());

        cues.push_back(std::move(cue));
    }

    std::ranges::stable_sort(cues, {}, &Cue::start);
    return cues;
}

auto loadSrtFile(std::string_view path) -> Result<std::vector<Cue>>
{
    auto file = std::ifstream(std::string(path), std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open subtitle file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto cues = parseSrt(ss.str());
    if (!cues)
        return makeError(cues.error().code, std::format("{}: {}", path, cues.error().message));

    log::info("Loaded {} cues from {}", cues->size(), path);
    return cues;
}

} // namespace srtvoice
