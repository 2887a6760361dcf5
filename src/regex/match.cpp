/*********************************************************************************************************************

-CATEGORY-
Name: Matches
-END-

A Match is one search result: its overall span and text, plus an ordered sequence of capture Groups that is only
realised when the groups are accessed.  Group 0 always mirrors the Match, so a Match that was constructed directly
and one that was derived from an engine result cannot be told apart.

*********************************************************************************************************************/

#include <sift/modules/regex.h>

namespace sift {

//********************************************************************************************************************
// A raw result is usable only if it is REGULAR and every span it refers to lies within the source text.

static bool valid_raw(const RawMatch &Raw, const SourceText &Source)
{
   if (Raw.type != RESULT::REGULAR) return false;
   if (not Source.contains(Raw.span)) return false;
   for (auto &capture : Raw.captures) {
      if ((capture) and (not Source.contains(*capture))) return false;
   }
   return true;
}

/*********************************************************************************************************************

-METHOD-
Match: Constructs a match from its span, text and capture groups.

`Captures` lists capture groups 1 to n in order; an empty entry indicates a group that did not participate in the
match.  Group 0 is produced from `Range` and `Text`.  No validation is performed.

*********************************************************************************************************************/

Match::Match(Span Range, std::string Text, std::vector<std::optional<Group>> Captures)
   : range(Range), content(std::move(Text))
{
   auto captures = std::make_shared<const std::vector<std::optional<Group>>>(std::move(Captures));
   auto size = captures->size() + 1;
   group_seq = std::make_shared<const LazySequence<Group>>(size,
      [Range, text = content, captures](size_t Index) -> std::optional<Group> {
         if (Index IS 0) return Group(Range, text);
         return (*captures)[Index - 1];
      });
}

/*********************************************************************************************************************

-METHOD-
from: Derives a Match from a raw engine result.

Returns `std::nullopt` if `Raw` is not a REGULAR result, or if its span or any of its capture spans are outside of
`Source`.  The text of the match and of each group is sliced from `Source` at the reported spans.  Groups are sliced
on demand; the Source is retained until the last group sequence referring to it is released.

*********************************************************************************************************************/

std::optional<Match> Match::from(const RawMatch &Raw, const std::shared_ptr<const SourceText> &Source)
{
   if (not Source) return std::nullopt;
   if (not valid_raw(Raw, *Source)) return std::nullopt;

   auto range = Raw.span;
   auto captures = std::make_shared<const std::vector<std::optional<Span>>>(Raw.captures);
   auto seq = std::make_shared<const LazySequence<Group>>(captures->size() + 1,
      [range, captures, Source](size_t Index) -> std::optional<Group> {
         if (Index IS 0) return Group(range, std::string(Source->slice(range)));

         auto &span = (*captures)[Index - 1];
         if (not span) return std::nullopt;
         return Group(*span, std::string(Source->slice(*span)));
      });

   return Match(range, std::string(Source->slice(range)), std::move(seq));
}

//********************************************************************************************************************

std::optional<Group> Match::group(size_t Index) const
{
   return group_seq->at(Index);
}

//********************************************************************************************************************
// Two matches are equal if their spans, text and every group agree.  Groups are compared without touching either
// cache.

bool Match::operator==(const Match &Other) const
{
   if ((range != Other.range) or (content != Other.content)) return false;
   if (group_seq IS Other.group_seq) return true;
   if (group_seq->size() != Other.group_seq->size()) return false;

   for (size_t i=0; i < group_seq->size(); i++) {
      if (group_seq->make(i) != Other.group_seq->make(i)) return false;
   }
   return true;
}

/*********************************************************************************************************************

-METHOD-
as_map: Lists the groups as (span, text) pairs.

Each group is converted to a pair of its span and its text.  A group that did not participate in the match yields an
empty span and an empty string, so the result always has one entry per group.  The group cache is not used.

*********************************************************************************************************************/

std::vector<std::pair<std::optional<Span>, std::string>> Groups::as_map() const
{
   std::vector<std::pair<std::optional<Span>, std::string>> result;
   result.reserve(seq->size());
   for (size_t i=0; i < seq->size(); i++) {
      if (auto group = seq->make(i)) result.emplace_back(group->span(), group->text());
      else result.emplace_back(std::nullopt, std::string());
   }
   return result;
}

} // namespace sift
