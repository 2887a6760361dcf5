/*********************************************************************************************************************

-CATEGORY-
Name: Matches
-END-

*********************************************************************************************************************/

#include <sift/modules/regex.h>

namespace sift {

//********************************************************************************************************************

MatchCollection::MatchCollection() : MatchCollection(SourceText::make(""), std::vector<RawMatch>())
{
}

/*********************************************************************************************************************

-METHOD-
MatchCollection: Wraps the raw results of a search over Source.

Nothing is materialised at construction.  Each position is converted with Match::from() on first access and cached,
so a malformed entry only affects its own position.

*********************************************************************************************************************/

MatchCollection::MatchCollection(std::shared_ptr<const SourceText> Source, std::vector<RawMatch> Results)
   : source_text(std::move(Source)),
     raw_results(std::make_shared<const std::vector<RawMatch>>(std::move(Results)))
{
   Log log(__FUNCTION__);

   log.trace("Results: %d, Text: %d clusters", int(raw_results->size()), int(source_text->length()));

   seq = std::make_shared<const LazySequence<Match>>(raw_results->size(),
      [raw = raw_results, source = source_text](size_t Index) -> std::optional<Match> {
         return Match::from((*raw)[Index], source);
      });
}

//********************************************************************************************************************

MatchCollection MatchCollection::from(std::vector<RawMatch> Results, std::string_view Text)
{
   return MatchCollection(SourceText::make(Text), std::move(Results));
}

} // namespace sift
