/*********************************************************************************************************************

-MODULE-
Regex: Compiles regular expressions and searches UTF-8 text with them.

The Regex class wraps the SRELL engine, providing ECMAScript syntax with full Unicode support.  Searches report their
results in grapheme cluster positions (see SourceText), so a match can never split a user-perceived character.  If
the engine reports an offset that falls inside a cluster, the start is moved back and the end is moved forward to the
nearest cluster boundary; empty matches that fall inside a cluster are not reported.

Results can be consumed in three ways:

<list type="bullet">
<li>search() produces the raw spans of every match.</li>
<li>matches() wraps the raw spans in a lazily materialised MatchCollection.</li>
<li>enumerate() delivers each Match to a callback as it is found, and can be stopped early.</li>
</list>

-END-

*********************************************************************************************************************/

#include <sift/modules/regex.h>
#include <srell.hpp>

#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace sift {

static const REGEX VALID_REGEX = REGEX::ICASE|REGEX::MULTILINE|REGEX::DOT_ALL|REGEX::LITERAL|REGEX::STICKY;

//********************************************************************************************************************

static std::string map_error_code(uint32_t ErrorCode)
{
   if (not ErrorCode) return "Okay";

   switch (ErrorCode) {
      case srell::regex_constants::error_collate:    return "Invalid collating element";
      case srell::regex_constants::error_ctype:      return "Invalid character class";
      case srell::regex_constants::error_escape:     return "Invalid escape sequence";
      case srell::regex_constants::error_backref:    return "Invalid back reference";
      case srell::regex_constants::error_brack:      return "Mismatched brackets";
      case srell::regex_constants::error_paren:      return "Mismatched parentheses";
      case srell::regex_constants::error_brace:      return "Mismatched braces";
      case srell::regex_constants::error_badbrace:   return "Invalid range quantifier";
      case srell::regex_constants::error_range:      return "Invalid character range";
      case srell::regex_constants::error_space:      return "Insufficient memory";
      case srell::regex_constants::error_badrepeat:  return "Nothing to repeat";
      case srell::regex_constants::error_complexity: return "Pattern is too complex";
      case srell::regex_constants::error_stack:      return "Stack exhausted";
      case srell::regex_constants::error_utf8:       return "Invalid UTF-8 sequence";
      case srell::regex_constants::error_property:   return "Unknown Unicode property";
      case srell::regex_constants::error_noescape:   return "Escape is required in Unicode set mode for: ( ) [ ] { } / - |";
      case srell::regex_constants::error_operator:   return "Invalid set operator in Unicode set mode";
      case srell::regex_constants::error_complement: return "Invalid complement in Unicode set mode";
      case srell::regex_constants::error_modifier:   return "Duplicated or misplaced inline modifier";
      default: break;
   }

   if (ErrorCode IS srell::regex_constants::error_internal) return "Internal engine failure";

   return std::string("Unknown error: ") + std::to_string(ErrorCode);
}

//********************************************************************************************************************

static srell::regex_constants::syntax_option_type convert_syntax(REGEX Flags)
{
   srell::regex_constants::syntax_option_type native = srell::regex_constants::ECMAScript | srell::regex_constants::unicodesets;
   if ((Flags & REGEX::ICASE) != REGEX::NIL)     native |= srell::regex_constants::icase;
   if ((Flags & REGEX::MULTILINE) != REGEX::NIL) native |= srell::regex_constants::multiline;
   if ((Flags & REGEX::DOT_ALL) != REGEX::NIL)   native |= srell::regex_constants::dotall;
   if ((Flags & REGEX::STICKY) != REGEX::NIL)    native |= srell::regex_constants::sticky;
   return native;
}

//********************************************************************************************************************
// ANCHORED, TRANSPARENT_BOUNDS and WITHOUT_ANCHORING_BOUNDS depend on the search range and are applied by scan().

static srell::regex_constants::match_flag_type convert_match_flags(RMATCH Flags)
{
   unsigned int native = 0;

   if ((Flags & RMATCH::NOT_BEGIN_OF_LINE) != RMATCH::NIL) native |= (unsigned int)srell::regex_constants::match_not_bol;
   if ((Flags & RMATCH::NOT_END_OF_LINE) != RMATCH::NIL)   native |= (unsigned int)srell::regex_constants::match_not_eol;
   if ((Flags & RMATCH::NOT_BEGIN_OF_WORD) != RMATCH::NIL) native |= (unsigned int)srell::regex_constants::match_not_bow;
   if ((Flags & RMATCH::NOT_END_OF_WORD) != RMATCH::NIL)   native |= (unsigned int)srell::regex_constants::match_not_eow;
   if ((Flags & RMATCH::NOT_NULL) != RMATCH::NIL)          native |= (unsigned int)srell::regex_constants::match_not_null;
   if ((Flags & RMATCH::ANCHORED) != RMATCH::NIL)          native |= (unsigned int)srell::regex_constants::match_continuous;

   return (srell::regex_constants::match_flag_type)native;
}

/*********************************************************************************************************************

-FUNCTION-
escape_pattern: Escapes the syntax characters of a string so that it can be compiled as a literal pattern.

-INPUT-
cpp(strview) Text: The literal text.

-RESULT-
cpp(str): A pattern that matches Text exactly.

*********************************************************************************************************************/

std::string escape_pattern(std::string_view Text)
{
   static const std::string_view syntax("^$\\.*+?()[]{}|/");

   std::string result;
   result.reserve(Text.size() * 2);
   for (auto ch : Text) {
      if (syntax.find(ch) != std::string_view::npos) result.push_back('\\');
      result.push_back(ch);
   }
   return result;
}

//********************************************************************************************************************

struct Regex::Implementation {
   srell::u8cregex engine;
   std::string pattern;
   REGEX flags = REGEX::NIL;
   std::string error_message;
   bool ready = false;

   ERR scan(const SourceText &, RMATCH, std::optional<Span>, const std::function<bool(RawMatch &)> &, bool *) const;
};

//********************************************************************************************************************
// Converts engine byte offsets to cluster positions.  Returns std::nullopt for an empty match inside a cluster.

static std::optional<RawMatch> to_raw(const srell::u8ccmatch &Native, const SourceText &Text)
{
   auto base = Text.str().data();
   auto start = size_t(Native[0].first - base);
   auto end = size_t(Native[0].second - base);

   if ((start IS end) and (not Text.is_boundary(start))) return std::nullopt;

   RawMatch raw(Span(Text.floor(start), Text.ceil(end)));
   raw.captures.reserve(Native.size() > 0 ? Native.size() - 1 : 0);

   for (size_t i=1; i < Native.size(); i++) {
      auto &sub = Native[i];
      if (not sub.matched) {
         raw.captures.emplace_back(std::nullopt);
         continue;
      }

      auto cap_start = size_t(sub.first - base);
      auto cap_end = size_t(sub.second - base);
      if (cap_start IS cap_end) {
         auto pos = Text.floor(cap_start);
         raw.captures.emplace_back(Span(pos, pos));
      }
      else raw.captures.emplace_back(Span(Text.floor(cap_start), Text.ceil(cap_end)));
   }

   return raw;
}

//********************************************************************************************************************
// Runs the engine over Range and passes each match to Callback, which returns true to stop the scan.  HitEnd is set
// to true if the scan reached the end of the range.  The loop follows the advancement rules of a standard regex
// iterator.  Every search shares the same limit, so text between the limit and the search position stays visible to
// look-behind and boundary tests.

ERR Regex::Implementation::scan(const SourceText &Text, RMATCH Flags, std::optional<Span> Range,
   const std::function<bool(RawMatch &)> &Callback, bool *HitEnd) const
{
   Log log("Regex");

   if (HitEnd) *HitEnd = false;
   if (not ready) return log.warning(ERR::NotInitialised);

   auto range = Range ? *Range : Text.whole();
   if (not Text.contains(range)) {
      log.warning("Range %d-%d is outside of the %d character text.", int(range.start), int(range.end), int(Text.length()));
      return ERR::OutOfRange;
   }

   if ((Text.empty()) or (range.empty())) {
      if (HitEnd) *HitEnd = true;
      return ERR::Okay;
   }

   auto base  = Text.str().data();
   auto first = base + Text.offset(range.start);
   auto last  = base + Text.offset(range.end);
   auto native = convert_match_flags(Flags);

   // Look-behind, ^ and \b treat the limit as the start of the text.  With transparent bounds the limit is the real
   // start of the text, so the range start is never treated as a line or word edge.

   const char *limit = first;
   if ((range.start > 0) and ((Flags & RMATCH::TRANSPARENT_BOUNDS) != RMATCH::NIL)) limit = base;

   if ((range.start > 0) and (limit IS first) and ((Flags & RMATCH::WITHOUT_ANCHORING_BOUNDS) != RMATCH::NIL)) {
      native |= srell::regex_constants::match_not_bol;
   }

   if ((range.end < Text.length()) and ((Flags & RMATCH::WITHOUT_ANCHORING_BOUNDS) != RMATCH::NIL)) {
      native |= srell::regex_constants::match_not_eol;
   }

   srell::u8ccmatch match;
   bool found = srell::regex_search(first, last, limit, match, engine, native);
   size_t min_start = range.start;
   int total = 0;

   while (found) {
      // A match that was widened to a cluster boundary can overlap the next engine result; overlaps are dropped.

      if (auto raw = to_raw(match, Text); (raw) and (raw->span.start >= min_start)) {
         min_start = raw->span.end;
         total++;
         if (Callback(*raw)) {
            log.trace("Scan stopped by client after %d matches.", total);
            return ERR::Okay;
         }
      }

      auto start = match[0].second;
      if (match[0].first IS start) { // Zero-length match
         if (start IS last) break;

         if (srell::regex_search(start, last, limit, match, engine, native | srell::regex_constants::match_not_null | srell::regex_constants::match_continuous)) {
            continue;
         }

         start += utf8_char_length(start, size_t(last - start));
      }
      else start = base + Text.offset(Text.ceil(size_t(start - base)));

      found = srell::regex_search(start, last, limit, match, engine, native);
   }

   log.trace("Scan complete, %d matches.", total);
   if (HitEnd) *HitEnd = true;
   return ERR::Okay;
}

//********************************************************************************************************************

Regex::Regex() : impl(new Implementation())
{
}

Regex::Regex(Regex &&Other) noexcept : impl(Other.impl)
{
   Other.impl = nullptr;
}

Regex & Regex::operator=(Regex &&Other) noexcept
{
   if (not (this IS &Other)) {
      delete impl;
      impl = Other.impl;
      Other.impl = nullptr;
   }
   return *this;
}

Regex::~Regex()
{
   delete impl;
}

/*********************************************************************************************************************

-METHOD-
compile: Compiles a pattern, replacing any pattern that was previously compiled.

The pattern follows ECMAScript syntax in Unicode sets mode.  If `REGEX::LITERAL` is set, the pattern is treated as
literal text and none of its characters are special.

-INPUT-
cpp(strview) Pattern: The pattern to compile.
int(REGEX) Flags: Optional flags.

-ERRORS-
Okay
InvalidValue: `Flags` contains unknown bits, or combines `LITERAL` with `MULTILINE` or `DOT_ALL`.
Syntax: The pattern is invalid.  Call error_message() for a description.
AllocMemory

*********************************************************************************************************************/

ERR Regex::compile(std::string_view Pattern, REGEX Flags)
{
   Log log("Regex");

   log.traceBranch("Pattern: '%.*s', Flags: $%.8x", int(Pattern.size()), Pattern.data(), int(Flags));

   if (not impl) {
      impl = new (std::nothrow) Implementation();
      if (not impl) return log.warning(ERR::AllocMemory);
   }

   impl->ready = false;
   impl->pattern = Pattern;
   impl->flags = Flags;

   if ((Flags & ~VALID_REGEX) != REGEX::NIL) {
      impl->error_message = "Unrecognised flags";
      log.warning("Unrecognised flags $%.8x", int(Flags & ~VALID_REGEX));
      return ERR::InvalidValue;
   }

   if (((Flags & REGEX::LITERAL) != REGEX::NIL) and ((Flags & (REGEX::MULTILINE|REGEX::DOT_ALL)) != REGEX::NIL)) {
      impl->error_message = "LITERAL cannot be combined with MULTILINE or DOT_ALL";
      log.warning("%s", impl->error_message.c_str());
      return ERR::InvalidValue;
   }

   std::string source;
   if ((Flags & REGEX::LITERAL) != REGEX::NIL) source = escape_pattern(Pattern);
   else source = Pattern;

   impl->engine.assign(source.data(), source.size(), convert_syntax(Flags));

   if (auto err = impl->engine.ecode(); err != 0) {
      impl->error_message = map_error_code(err);
      log.warning("Regex compilation failed: %s", impl->error_message.c_str());
      return ERR::Syntax;
   }

   impl->error_message.clear();
   impl->ready = true;
   return ERR::Okay;
}

//********************************************************************************************************************

bool Regex::is_ready() const
{
   return impl and impl->ready;
}

const std::string & Regex::pattern() const
{
   static const std::string empty;
   return impl ? impl->pattern : empty;
}

REGEX Regex::flags() const
{
   return impl ? impl->flags : REGEX::NIL;
}

const std::string & Regex::error_message() const
{
   static const std::string not_compiled("No pattern has been compiled");
   if ((impl) and ((impl->ready) or (not impl->error_message.empty()))) return impl->error_message;
   return not_compiled;
}

//********************************************************************************************************************
// Total number of capturing groups in the pattern, excluding group 0.

size_t Regex::capture_count() const
{
   if (not is_ready()) return 0;
   auto marks = impl->engine.mark_count();
   return marks;
}

/*********************************************************************************************************************

-METHOD-
search: Finds all matches within a text.

The raw result of every match found in `Range` is appended to `Result` in order.  Positions are grapheme cluster
indexes.  If no `Range` is given, the whole text is searched.  Searching empty text, or an empty range, succeeds with
no results.

-INPUT-
obj(SourceText) Text: The text to search.
int(RMATCH) Flags: Optional match flags.
struct(Span) Range: Optional, limits the search to a region of the text.
&cpp(array(struct(RawMatch))) Result: Receives the matches.

-ERRORS-
Okay
NullArgs
NotInitialised: No pattern has been compiled.
OutOfRange: `Range` is not within the text.

*********************************************************************************************************************/

ERR Regex::search(const SourceText &Text, RMATCH Flags, std::optional<Span> Range, std::vector<RawMatch> *Result) const
{
   Log log("Regex");

   if (not Result) return log.warning(ERR::NullArgs);
   if (not impl) return log.warning(ERR::NotInitialised);

   log.traceBranch("Text: %d chars, Flags: $%.8x", int(Text.length()), int(Flags));

   return impl->scan(Text, Flags, Range, [Result](RawMatch &Raw) {
      Result->push_back(std::move(Raw));
      return false;
   }, nullptr);
}

/*********************************************************************************************************************

-METHOD-
has_match: Returns true if the pattern matches anywhere within the text.

The search stops at the first match and no captures are extracted.  An invalid range or an uncompiled Regex returns
false.

*********************************************************************************************************************/

bool Regex::has_match(const SourceText &Text, RMATCH Flags, std::optional<Span> Range) const
{
   if (not impl) return false;

   bool found = false;
   if (impl->scan(Text, Flags, Range, [&found](RawMatch &) {
      found = true;
      return true;
   }, nullptr) != ERR::Okay) return false;

   return found;
}

/*********************************************************************************************************************

-METHOD-
matches: Searches a text and returns its results as a MatchCollection.

The collection shares ownership of `Text`.  On failure `Result` is reset to an empty collection.

-ERRORS-
Okay
NullArgs
NotInitialised
OutOfRange

*********************************************************************************************************************/

ERR Regex::matches(const std::shared_ptr<const SourceText> &Text, RMATCH Flags, std::optional<Span> Range, MatchCollection *Result) const
{
   Log log("Regex");

   if ((not Text) or (not Result)) return log.warning(ERR::NullArgs);

   std::vector<RawMatch> raw;
   if (auto error = search(*Text, Flags, Range, &raw); error != ERR::Okay) {
      *Result = MatchCollection();
      return error;
   }

   log.trace("Found %d matches.", int(raw.size()));
   *Result = MatchCollection(Text, std::move(raw));
   return ERR::Okay;
}

/*********************************************************************************************************************

-METHOD-
enumerate: Calls a function for every match in a text.

The `Callback` receives each Match in order, together with the MATCHING flags of the report.  Returning true from the
`Callback` stops the enumeration immediately.

If `RMATCH::REPORT_COMPLETION` is set and the enumeration was not stopped, a final report is made with no Match and
the flags `MATCHING::COMPLETED|MATCHING::HIT_END`.

-ERRORS-
Okay
NullArgs
NotInitialised
OutOfRange

*********************************************************************************************************************/

ERR Regex::enumerate(const std::shared_ptr<const SourceText> &Text, RMATCH Flags, std::optional<Span> Range,
   const ENUMERATE_CALLBACK &Callback) const
{
   Log log("Regex");

   if ((not Text) or (not Callback)) return log.warning(ERR::NullArgs);
   if (not impl) return log.warning(ERR::NotInitialised);

   bool hit_end;
   auto error = impl->scan(*Text, Flags, Range, [&Text, &Callback](RawMatch &Raw) {
      return Callback(Match::from(Raw, Text), MATCHING::NIL);
   }, &hit_end);

   if (error != ERR::Okay) return error;

   if ((hit_end) and ((Flags & RMATCH::REPORT_COMPLETION) != RMATCH::NIL)) {
      Callback(std::nullopt, MATCHING::COMPLETED|MATCHING::HIT_END);
   }

   return ERR::Okay;
}

//********************************************************************************************************************

namespace rx {

/*********************************************************************************************************************

-FUNCTION-
Compile: Compiles a regex pattern into an existing Regex.

-INPUT-
cpp(strview) Pattern: A regex pattern string.
flags(REGEX) Flags:  Optional flags.
&cpp(str) ErrorMsg: Optional, receives the error message if compilation fails.
&obj(Regex) Result: The Regex to compile into.

-ERRORS-
Okay
NullArgs
InvalidValue
Syntax

*********************************************************************************************************************/

ERR Compile(std::string_view Pattern, REGEX Flags, std::string *ErrorMsg, Regex *Result)
{
   Log log(__FUNCTION__);

   if (not Result) return log.warning(ERR::NullArgs);

   auto error = Result->compile(Pattern, Flags);
   if ((error != ERR::Okay) and (ErrorMsg)) *ErrorMsg = Result->error_message();
   return error;
}

/*********************************************************************************************************************

-FUNCTION-
HasMatch: Tests a pattern against a text.

If a `Range` is given, only that region of the text is searched.

-ERRORS-
Okay: The pattern matches the text.
Search: The pattern does not match the text.
OutOfRange: `Range` is not within the text.
InvalidValue
Syntax

*********************************************************************************************************************/

ERR HasMatch(std::string_view Pattern, std::string_view Text, REGEX Flags, RMATCH MatchFlags, std::optional<Span> Range)
{
   Regex regex;
   if (auto error = regex.compile(Pattern, Flags); error != ERR::Okay) return error;

   SourceText source{std::string(Text)};
   if ((Range) and (not source.contains(*Range))) return ERR::OutOfRange;
   return regex.has_match(source, MatchFlags, Range) ? ERR::Okay : ERR::Search;
}

/*********************************************************************************************************************

-FUNCTION-
Captures: Returns the text of every group of every match.

Each entry of `Result` corresponds to one match and lists the text of group 0 followed by each capture group that
participated in the match.  Groups that did not participate are omitted.  If a `Range` is given, only that region of
the text is searched.

-ERRORS-
Okay
NullArgs
OutOfRange
InvalidValue
Syntax

*********************************************************************************************************************/

ERR Captures(std::string_view Pattern, std::string_view Text, REGEX Flags, RMATCH MatchFlags, std::optional<Span> Range,
   std::vector<std::vector<std::string>> *Result)
{
   Log log(__FUNCTION__);

   if (not Result) return log.warning(ERR::NullArgs);
   Result->clear();

   Regex regex;
   if (auto error = regex.compile(Pattern, Flags); error != ERR::Okay) return error;

   MatchCollection matches;
   if (auto error = regex.matches(SourceText::make(Text), MatchFlags, Range, &matches); error != ERR::Okay) return error;

   Result->reserve(matches.size());
   for (auto &match : matches.as_array()) {
      std::vector<std::string> groups;
      for (auto &group : match.groups().as_array()) groups.push_back(group.text());
      Result->push_back(std::move(groups));
   }
   return ERR::Okay;
}

} // namespace rx

} // namespace sift
