#pragma once

// Name:      regex.h
// Copyright: The Sift Authors 2025

#include <sift/main.h>
#include <sift/unicode.h>
#include <sift/lazy_sequence.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sift {

// Optional flags for compiling a Regex.

enum class REGEX : uint32_t {
   NIL = 0,
   ICASE = 0x00000001,
   MULTILINE = 0x00000002,
   DOT_ALL = 0x00000004,
   LITERAL = 0x00000008,
   STICKY = 0x00000010,
};

DEFINE_ENUM_FLAG_OPERATORS(REGEX)

// Optional flags for searching with a compiled Regex.

enum class RMATCH : uint32_t {
   NIL = 0,
   NOT_BEGIN_OF_LINE = 0x00000001,
   NOT_END_OF_LINE = 0x00000002,
   NOT_BEGIN_OF_WORD = 0x00000004,
   NOT_END_OF_WORD = 0x00000008,
   NOT_NULL = 0x00000010,
   ANCHORED = 0x00000020,
   TRANSPARENT_BOUNDS = 0x00000040,
   WITHOUT_ANCHORING_BOUNDS = 0x00000080,
   REPORT_COMPLETION = 0x00000100,
};

DEFINE_ENUM_FLAG_OPERATORS(RMATCH)

// Flags passed to an enumeration callback.

enum class MATCHING : uint32_t {
   NIL = 0,
   COMPLETED = 0x00000001,
   HIT_END = 0x00000002,
};

DEFINE_ENUM_FLAG_OPERATORS(MATCHING)

// Raw result record types.

enum class RESULT : int {
   REGULAR = 0,
   CONTROL = 1,
};

//********************************************************************************************************************
// A single search result as reported by the engine, in character positions.  captures[k] is the span of capturing
// group k + 1, or empty if the group did not participate.

struct RawMatch {
   RESULT type = RESULT::REGULAR;
   Span span;
   std::vector<std::optional<Span>> captures;

   RawMatch() = default;
   RawMatch(Span Range, std::vector<std::optional<Span>> Captures = {}, RESULT Type = RESULT::REGULAR)
      : type(Type), span(Range), captures(std::move(Captures)) { }
};

//********************************************************************************************************************

class Group {
   private:
      Span range;
      std::string content;

   public:
      Group(Span Range, std::string Text) : range(Range), content(std::move(Text)) { }

      inline Span span() const { return range; }
      inline const std::string & text() const { return content; }

      bool operator==(const Group &) const = default;
};

//********************************************************************************************************************
// The capture groups of a Match.  Group 0 always mirrors the Match itself.  Copies share the same lazily populated
// sequence.

class Groups {
   private:
      std::shared_ptr<const LazySequence<Group>> seq;

   public:
      explicit Groups(std::shared_ptr<const LazySequence<Group>> Sequence) : seq(std::move(Sequence)) { }

      inline size_t size() const { return seq->size(); }
      inline size_t start_index() const { return seq->start_index(); }
      inline size_t end_index() const { return seq->end_index(); }
      inline size_t index_after(size_t Index) const { return seq->index_after(Index); }

      inline LazySequence<Group>::ELEMENT get(size_t Index) const { return seq->get(Index); }
      inline std::optional<Group> operator[](size_t Index) const { return (*seq)[Index]; }

      // Checked access.  Indexes beyond the last group throw std::out_of_range; a group that did not participate in
      // the match is returned as std::nullopt.

      inline std::optional<Group> at(size_t Index) const { return seq->at(Index); }

      inline std::vector<Group> as_array() const { return seq->as_array(); }
      std::vector<std::pair<std::optional<Span>, std::string>> as_map() const;

      inline void clear_cache() const { seq->clear_cache(); }
      inline bool cached(size_t Index) const { return seq->cached(Index); }

      inline LazyCursor<Group> cursor() const { return LazyCursor<Group>(seq); }
      inline LazyIterator<Group> begin() const { return LazyIterator<Group>(seq); }
      inline LazyIterator<Group> end() const { return LazyIterator<Group>(); }
};

//********************************************************************************************************************

class Match {
   private:
      Span range;
      std::string content;
      std::shared_ptr<const LazySequence<Group>> group_seq;

      Match(Span Range, std::string Text, std::shared_ptr<const LazySequence<Group>> Sequence)
         : range(Range), content(std::move(Text)), group_seq(std::move(Sequence)) { }

   public:
      // Constructs a Match directly.  Captures lists groups 1..n; group 0 is produced from Range and Text.

      Match(Span Range, std::string Text, std::vector<std::optional<Group>> Captures = {});

      // Derives a Match from a raw engine result.  Returns std::nullopt if the result is not REGULAR or refers to
      // positions outside of the Source.

      static std::optional<Match> from(const RawMatch &Raw, const std::shared_ptr<const SourceText> &Source);

      inline Span span() const { return range; }
      inline const std::string & text() const { return content; }

      inline Groups groups() const { return Groups(group_seq); }
      inline size_t group_count() const { return group_seq->size(); }
      std::optional<Group> group(size_t Index) const;

      bool operator==(const Match &Other) const;
};

//********************************************************************************************************************
// The ordered results of one search over one text.  Matches are materialised on first access and cached per
// position.  Copies of a MatchCollection share the source text, the raw results and the cache.

class MatchCollection {
   private:
      std::shared_ptr<const SourceText> source_text;
      std::shared_ptr<const std::vector<RawMatch>> raw_results;
      std::shared_ptr<const LazySequence<Match>> seq;

   public:
      MatchCollection();
      MatchCollection(std::shared_ptr<const SourceText> Source, std::vector<RawMatch> Results);

      // Builds a collection from caller-supplied results.  Entries that are not REGULAR, or that lie outside of the
      // Text, materialise as std::nullopt without affecting the other positions.

      static MatchCollection from(std::vector<RawMatch> Results, std::string_view Text);

      inline size_t size() const { return seq->size(); }
      inline bool empty() const { return seq->empty(); }
      inline size_t start_index() const { return seq->start_index(); }
      inline size_t end_index() const { return seq->end_index(); }
      inline size_t index_after(size_t Index) const { return seq->index_after(Index); }

      inline LazySequence<Match>::ELEMENT get(size_t Index) const { return seq->get(Index); }
      inline std::optional<Match> operator[](size_t Index) const { return (*seq)[Index]; }
      inline std::optional<Match> at(size_t Index) const { return seq->at(Index); }

      inline std::vector<Match> as_array() const { return seq->as_array(); }

      inline void clear_cache() const { seq->clear_cache(); }
      inline bool cached(size_t Index) const { return seq->cached(Index); }
      inline size_t cached_count() const { return seq->cached_count(); }

      inline LazyCursor<Match> cursor() const { return LazyCursor<Match>(seq); }
      inline LazyIterator<Match> begin() const { return LazyIterator<Match>(seq); }
      inline LazyIterator<Match> end() const { return LazyIterator<Match>(); }

      inline const std::vector<RawMatch> & raw() const { return *raw_results; }
      inline const std::shared_ptr<const SourceText> & source() const { return source_text; }
};

//********************************************************************************************************************
// Return true from an ENUMERATE_CALLBACK to stop the enumeration.

typedef std::function<bool(const std::optional<Match> &, MATCHING)> ENUMERATE_CALLBACK;

class Regex {
   public:
      Regex();
      Regex(Regex &&Other) noexcept;
      Regex & operator=(Regex &&Other) noexcept;
      Regex(const Regex &) = delete;
      Regex & operator=(const Regex &) = delete;
      ~Regex();

      ERR compile(std::string_view Pattern, REGEX Flags = REGEX::NIL);

      bool is_ready() const;
      const std::string & pattern() const;
      REGEX flags() const;
      const std::string & error_message() const;
      size_t capture_count() const;

      ERR search(const SourceText &Text, RMATCH Flags, std::optional<Span> Range, std::vector<RawMatch> *Result) const;
      bool has_match(const SourceText &Text, RMATCH Flags = RMATCH::NIL, std::optional<Span> Range = std::nullopt) const;
      ERR matches(const std::shared_ptr<const SourceText> &Text, RMATCH Flags, std::optional<Span> Range, MatchCollection *Result) const;
      ERR enumerate(const std::shared_ptr<const SourceText> &Text, RMATCH Flags, std::optional<Span> Range, const ENUMERATE_CALLBACK &Callback) const;

   private:
      struct Implementation;
      Implementation *impl;
};

std::string escape_pattern(std::string_view Text);

//********************************************************************************************************************
// Functional shortcuts for one-off use of a pattern.

namespace rx {

ERR Compile(std::string_view Pattern, REGEX Flags, std::string *ErrorMsg, Regex *Result);
ERR HasMatch(std::string_view Pattern, std::string_view Text, REGEX Flags = REGEX::NIL, RMATCH MatchFlags = RMATCH::NIL, std::optional<Span> Range = std::nullopt);
ERR Captures(std::string_view Pattern, std::string_view Text, REGEX Flags, RMATCH MatchFlags, std::optional<Span> Range, std::vector<std::vector<std::string>> *Result);

} // namespace rx

} // namespace sift
