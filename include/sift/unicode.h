#pragma once

// Name:      unicode.h
// Copyright: The Sift Authors 2025
//
// Grapheme-cluster indexing of UTF-8 text.  Character positions used throughout Sift count extended grapheme
// clusters (user-perceived characters), never bytes or code points.

#include <sift/main.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sift {

//********************************************************************************************************************
// A half-open range [start, end) of character positions.  A group that did not participate in a match has no Span
// at all (std::optional<Span> is empty), which is distinct from an empty Span.

struct Span {
   size_t start = 0;
   size_t end = 0;

   Span() = default;
   constexpr Span(size_t Start, size_t End) : start(Start), end(End) { }

   constexpr size_t length() const { return end - start; }
   constexpr bool empty() const { return start IS end; }
   constexpr bool contains(const Span &Other) const { return (Other.start >= start) and (Other.end <= end) and (Other.start <= Other.end); }

   bool operator==(const Span &) const = default;
};

//********************************************************************************************************************
// Immutable UTF-8 text plus its grapheme cluster boundary table.  Shared read-only by every result derived from it.

class SourceText {
   private:
      std::string content;
      std::vector<size_t> bounds; // Byte offset of each cluster, terminated by content.size()

   public:
      explicit SourceText(std::string Text);

      SourceText(const SourceText &) = delete;
      SourceText & operator=(const SourceText &) = delete;

      static std::shared_ptr<const SourceText> make(std::string_view Text) {
         return std::make_shared<const SourceText>(std::string(Text));
      }

      inline const std::string & str() const { return content; }
      inline size_t bytes() const { return content.size(); }
      inline bool empty() const { return content.empty(); }

      // Total number of grapheme clusters.

      inline size_t length() const { return bounds.size() - 1; }

      inline Span whole() const { return Span(0, length()); }

      // Byte offset of the cluster at character position Index.  Index may equal length().

      size_t offset(size_t Index) const;

      // Character position of the cluster containing byte Offset (floor) or of the first cluster boundary at or
      // after Offset (ceil).

      size_t floor(size_t Offset) const;
      size_t ceil(size_t Offset) const;

      bool is_boundary(size_t Offset) const;

      bool contains(const Span &Range) const { return (Range.start <= Range.end) and (Range.end <= length()); }

      // Returns the text covered by Range.  The Range must be valid for this text.

      std::string_view slice(const Span &Range) const;
};

// UTF-8 helpers

int utf8_char_length(const char *String, size_t Available);
size_t utf8_length(std::string_view String);

} // namespace sift
