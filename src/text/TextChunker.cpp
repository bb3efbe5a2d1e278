// SPDX-License-Identifier: Apache-2.0
#include "TextChunker.hpp"

#include <algorithm>
#include <format>

namespace srtvoice
{

namespace
{

    constexpr auto isSpace(char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    constexpr auto isContinuationByte(char c) noexcept -> bool
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    /// @brief Returns true if the text before `end` finishes with sentence punctuation.
    auto endsWithSentencePunctuation(std::string_view text, std::size_t end) -> bool
    {
        if (end == 0)
            return false;

        switch (text[end - 1])
        {
            case '.':
            case '!':
            case '?':
            case ';':
            case ':': return true;
            default: break;
        }

        // U+2026 HORIZONTAL ELLIPSIS
        constexpr auto Ellipsis = std::string_view { "\xE2\x80\xA6" };
        return end >= Ellipsis.size() && text.substr(end - Ellipsis.size(), Ellipsis.size()) == Ellipsis;
    }

} // namespace

auto normalizeWhitespace(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pendingSpace = false;
    for (auto const c: text)
    {
        if (isSpace(c))
        {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace)
        {
            result += ' ';
            pendingSpace = false;
        }
        result += c;
    }
    return result;
}

auto codePointCount(std::string_view text) -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(text, [](char c) { return !isContinuationByte(c); }));
}

auto textPreview(std::string_view text, std::size_t maxChars) -> std::string
{
    auto counted = std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        if (isContinuationByte(text[i]))
            continue;
        if (counted == maxChars)
            return std::format("{}...", text.substr(0, i));
        ++counted;
    }
    return std::string(text);
}

TextChunker::TextChunker(std::string_view text, std::size_t maxChars):
    _text(normalizeWhitespace(text)), _maxChars(std::max<std::size_t>(maxChars, 1))
{
}

auto TextChunker::begin() const -> Iterator
{
    if (_text.empty())
        return end();
    return Iterator(this, 0);
}

auto TextChunker::end() const -> Iterator
{
    return Iterator {};
}

auto TextChunker::findBreak(std::size_t position) const -> Break
{
    // Byte offset just past the first maxChars code points starting at position.
    auto limit = position;
    auto counted = std::size_t { 0 };
    while (limit < _text.size())
    {
        if (!isContinuationByte(_text[limit]))
        {
            if (counted == _maxChars)
                break;
            ++counted;
        }
        ++limit;
    }

    if (limit >= _text.size())
        return { .pieceEnd = _text.size(), .next = _text.size() };

    // A space exactly at limit still allows a full-budget piece.
    auto lastSpace = std::string::npos;
    auto lastSentenceBreak = std::string::npos;
    for (auto i = position + 1; i <= limit; ++i)
    {
        if (_text[i] != ' ')
            continue;
        lastSpace = i;
        if (endsWithSentencePunctuation(_text, i))
            lastSentenceBreak = i;
    }

    if (lastSentenceBreak != std::string::npos)
        return { .pieceEnd = lastSentenceBreak, .next = lastSentenceBreak + 1 };
    if (lastSpace != std::string::npos)
        return { .pieceEnd = lastSpace, .next = lastSpace + 1 };

    return { .pieceEnd = limit, .next = limit };
}

TextChunker::Iterator::Iterator(const TextChunker* owner, std::size_t position):
    _owner(owner), _position(position)
{
    advance();
}

void TextChunker::Iterator::advance()
{
    if (!_owner || _position >= _owner->_text.size())
    {
        _position = std::string::npos;
        _piece.clear();
        return;
    }

    auto const [pieceEnd, next] = _owner->findBreak(_position);
    _piece = _owner->_text.substr(_position, pieceEnd - _position);
    _next = next;
}

auto TextChunker::Iterator::operator++() -> Iterator&
{
    _position = _next;
    advance();
    return *this;
}

auto TextChunker::Iterator::operator++(int) -> Iterator
{
    auto copy = *this;
    ++*this;
    return copy;
}

auto chunkText(std::string_view text, std::size_t maxChars) -> std::vector<std::string>
{
    auto const chunker = TextChunker(text, maxChars);
    return { chunker.begin(), chunker.end() };
}

} // namespace srtvoice
