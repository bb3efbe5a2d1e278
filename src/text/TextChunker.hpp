// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace srtvoice
{

/// @brief Collapses whitespace runs (including newlines) to single spaces and trims both ends.
[[nodiscard]] auto normalizeWhitespace(std::string_view text) -> std::string;

/// @brief Returns the number of Unicode code points in a UTF-8 string.
[[nodiscard]] auto codePointCount(std::string_view text) -> std::size_t;

/// @brief Returns at most maxChars code points of text for log and error messages.
///
/// Longer text is cut on a code-point boundary and marked with "...".
[[nodiscard]] auto textPreview(std::string_view text, std::size_t maxChars = 40) -> std::string;

/// @brief Splits text into request-sized pieces of at most a given number of code points.
///
/// The text is whitespace-normalized on construction. Pieces are produced lazily while
/// iterating, in this order of preference for each break:
///  - after the last sentence punctuation (. ! ? ; : …) that is followed by a space,
///  - at the last space,
///  - a hard split at exactly maxChars code points when a single token is too long.
///
/// The space at a soft break is dropped. Iterating the same chunker twice yields the
/// same pieces. Empty or whitespace-only text yields no pieces.
class TextChunker
{
  public:
    /// @brief Forward iterator over the pieces of a TextChunker.
    class Iterator
    {
      public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        Iterator() = default;

        auto operator*() const -> reference { return _piece; }
        auto operator->() const -> pointer { return &_piece; }
        auto operator++() -> Iterator&;
        auto operator++(int) -> Iterator;
        auto operator==(const Iterator& other) const -> bool { return _position == other._position; }

      private:
        friend class TextChunker;

        Iterator(const TextChunker* owner, std::size_t position);

        void advance();

        const TextChunker* _owner = nullptr;
        std::size_t _position = std::string::npos;
        std::size_t _next = std::string::npos;
        std::string _piece;
    };

    /// @brief Constructs a chunker.
    /// @param text The raw cue text.
    /// @param maxChars Maximum code points per piece; values below 1 are treated as 1.
    TextChunker(std::string_view text, std::size_t maxChars);

    [[nodiscard]] auto begin() const -> Iterator;
    [[nodiscard]] auto end() const -> Iterator;

    /// @brief Returns the normalized text being chunked.
    [[nodiscard]] auto text() const noexcept -> const std::string& { return _text; }

    /// @brief Returns the per-piece budget in code points.
    [[nodiscard]] auto maxChars() const noexcept -> std::size_t { return _maxChars; }

  private:
    struct Break
    {
        std::size_t pieceEnd;
        std::size_t next;
    };

    [[nodiscard]] auto findBreak(std::size_t position) const -> Break;

    std::string _text;
    std::size_t _maxChars;
};

/// @brief Collects all pieces of a TextChunker into a vector.
[[nodiscard]] auto chunkText(std::string_view text, std::size_t maxChars) -> std::vector<std::string>;

} // namespace srtvoice
