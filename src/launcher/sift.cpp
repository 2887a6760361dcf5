/*********************************************************************************************************************

This command-line program searches a text with a regular expression and prints the matches and their capture groups.

*********************************************************************************************************************/

#include <sift/main.h>
#include <sift/modules/regex.h>

#include <charconv>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

using namespace sift;

static std::string glPattern = "((\\w+)[\\s.])+";
static std::string glText = "Yes. This dog is very friendly.";
static REGEX glFlags = REGEX::NIL;
static std::optional<size_t> glFrom, glTo;
static bool glModes = false;

static const char glHelp[] = {
"Searches a text with a regular expression and prints every match with its capture groups.\n\
\n\
   sift [options] [pattern] [text]\n\
\n\
With no pattern or text, a sample search is performed.  Positions are in grapheme clusters.\n\
\n\
 --literal       Match the pattern as literal text.\n\
 --icase         Ignore case when matching.\n\
 --from [n]      First position of the search range.\n\
 --to [n]        End position of the search range.\n\
 --modes         Print the results through each access mode.\n\
\n\
 --log-api       Activates run-time log messages at API level.\n\
 --log-info      Activates run-time log messages at INFO level.\n\
 --log-error     Activates run-time log messages at ERROR level.\n"
};

//********************************************************************************************************************

static bool read_position(const std::string &Value, std::optional<size_t> &Result)
{
   size_t number;
   auto [ptr, ec] = std::from_chars(Value.data(), Value.data() + Value.size(), number);
   if ((ec != std::errc()) or (ptr != Value.data() + Value.size())) {
      printf("Invalid position '%s'\n", Value.c_str());
      return false;
   }
   Result = number;
   return true;
}

//********************************************************************************************************************

static ERR process_args(const std::vector<std::string> &Args)
{
   std::vector<std::string> positional;

   for (unsigned i=0; i < Args.size(); i++) {
      if (Args[i] IS "--help") {
         printf("%s", glHelp);
         return ERR::Terminate;
      }
      else if (Args[i] IS "--literal") glFlags |= REGEX::LITERAL;
      else if (Args[i] IS "--icase") glFlags |= REGEX::ICASE;
      else if (Args[i] IS "--modes") glModes = true;
      else if ((Args[i] IS "--from") or (Args[i] IS "--to")) {
         if (i + 1 >= Args.size()) {
            printf("Option %s requires a value.\n", Args[i].c_str());
            return ERR::Args;
         }
         if (not read_position(Args[i+1], (Args[i] IS "--from") ? glFrom : glTo)) return ERR::Args;
         i++;
      }
      else if (Args[i].starts_with("--")) {
         printf("Unrecognised option '%s'\n", Args[i].c_str());
         return ERR::Args;
      }
      else positional.push_back(Args[i]);
   }

   if (positional.size() > 2) {
      printf("%s", glHelp);
      return ERR::Args;
   }

   if (positional.size() > 0) glPattern = positional[0];
   if (positional.size() > 1) glText = positional[1];
   return ERR::Okay;
}

//********************************************************************************************************************

static void print_match(size_t Index, const std::optional<Match> &Result)
{
   if (not Result) {
      printf("%d: <malformed>\n", int(Index));
      return;
   }

   printf("%d: [%d, %d) \"%s\"\n", int(Index), int(Result->span().start), int(Result->span().end), Result->text().c_str());

   auto groups = Result->groups();
   for (size_t g=1; g < groups.size(); g++) {
      if (auto group = groups[g]) {
         printf("   %d: [%d, %d) \"%s\"\n", int(g), int(group->span().start), int(group->span().end), group->text().c_str());
      }
      else printf("   %d: <absent>\n", int(g));
   }
}

//********************************************************************************************************************

static void print_modes(const MatchCollection &Matches)
{
   printf("\nIteration:\n");
   size_t index = 0;
   for (auto &match : Matches) print_match(index++, match);

   printf("\nRandom access:\n");
   for (auto i = Matches.start_index(); i < Matches.end_index(); i = Matches.index_after(i)) {
      print_match(i, Matches[i]);
   }

   printf("\nBulk:\n");
   index = 0;
   for (auto &match : Matches.as_array()) print_match(index++, match);
}

//********************************************************************************************************************

int main(int argc, char **argv)
{
   Log log("Sift");

   OpenInfo info;
   info.Flags    = OPF::ARGS;
   info.ArgCount = argc;
   info.Args     = (CSTRING *)argv;

   std::vector<std::string> args;
   if (OpenCore(info, &args) != ERR::Okay) {
      printf("Failed to process the command-line.\n");
      return -1;
   }

   if (auto error = process_args(args); error != ERR::Okay) {
      return (error IS ERR::Terminate) ? 0 : -1;
   }

   Regex regex;
   if (regex.compile(glPattern, glFlags) != ERR::Okay) {
      printf("Invalid pattern: %s\n", regex.error_message().c_str());
      return -1;
   }

   auto source = SourceText::make(glText);

   std::optional<Span> range;
   if (glFrom or glTo) range = Span(glFrom.value_or(0), glTo.value_or(source->length()));

   MatchCollection matches;
   if (auto error = regex.matches(source, RMATCH::NIL, range, &matches); error != ERR::Okay) {
      printf("Search failed: %s\n", GetErrorMsg(error));
      return -1;
   }

   log.msg("Pattern \"%s\" found %d matches.", glPattern.c_str(), int(matches.size()));

   if (glModes) print_modes(matches);
   else {
      for (auto i = matches.start_index(); i < matches.end_index(); i = matches.index_after(i)) {
         print_match(i, matches[i]);
      }
   }

   return 0;
}
