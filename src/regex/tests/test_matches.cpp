/*********************************************************************************************************************

Tests for the Group, Match and MatchCollection result model.

*********************************************************************************************************************/

#include <sift/modules/regex.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sift;

struct TestContext {
   int total_checks{0};
   int failed_checks{0};

   void expect_true(bool Condition, char const *Message) {
      total_checks += 1;
      if (not Condition) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << '\n';
      }
   }

   template<typename T, typename U>
   void expect_equal(T const &Actual, U const &Expected, char const *Message) {
      total_checks += 1;
      if (not (Actual IS Expected)) {
         failed_checks += 1;
         std::cout << "FAILED: " << Message << " (actual=" << Actual << ", expected=" << Expected << ")\n";
      }
   }

   void summary() const {
      if (failed_checks IS 0) {
         std::cout << "All " << total_checks << " checks passed." << '\n';
      } else {
         std::cout << failed_checks << " of " << total_checks << " checks failed." << '\n';
      }
   }
};

static MatchCollection search_all(std::string_view Pattern, std::string_view Text, std::optional<Span> Range = std::nullopt)
{
   Regex regex;
   MatchCollection result;
   if (regex.compile(Pattern) IS ERR::Okay) {
      if (regex.matches(SourceText::make(Text), RMATCH::NIL, Range, &result) != ERR::Okay) {
         std::cout << "Search failed for " << Pattern << '\n';
      }
   }
   else std::cout << "Compilation failed for " << Pattern << ": " << regex.error_message() << '\n';
   return result;
}

//********************************************************************************************************************

void test_sample_sentence(TestContext &Context) {
   auto matches = search_all("((\\w+)[\\s.])+", "Yes. This dog is very friendly.");

   Context.expect_equal(matches.size(), size_t(2), "Two matches in the sample sentence");
   if (matches.size() != 2) return;

   auto first = matches[0];
   auto second = matches[1];
   Context.expect_true(first.has_value() and second.has_value(), "Both matches are regular");
   if ((not first) or (not second)) return;

   Context.expect_equal(first->text(), std::string("Yes."), "First match text");
   Context.expect_true(first->span() IS Span(0, 4), "First match span");
   Context.expect_equal(first->groups().size(), size_t(3), "Group 0 plus two capture groups");
   Context.expect_equal(first->group(1)->text(), std::string("Yes."), "First match, group 1");
   Context.expect_equal(first->group(2)->text(), std::string("Yes"), "First match, group 2");

   Context.expect_equal(second->text(), std::string("This dog is very friendly."), "Second match text");
   Context.expect_true(second->span() IS Span(5, 31), "Second match span");
   Context.expect_equal(second->group(1)->text(), std::string("friendly."), "Repeated group keeps its last iteration");
   Context.expect_equal(second->group(2)->text(), std::string("friendly"), "Nested group keeps its last iteration");
   Context.expect_true(second->group(2)->span() IS Span(22, 30), "Nested group span");
}

void test_group_zero(TestContext &Context) {
   auto matches = search_all("(\\w+)@(\\w+)", "me@here you@there");

   for (auto &match : matches.as_array()) {
      auto zero = match.groups()[0];
      Context.expect_true(zero.has_value(), "Group 0 is always present");
      if (zero) {
         Context.expect_true(zero->span() IS match.span(), "Group 0 span equals the match span");
         Context.expect_equal(zero->text(), match.text(), "Group 0 text equals the match text");
      }
   }

   Match direct(Span(2, 5), "abc");
   Context.expect_equal(direct.group_count(), size_t(1), "A match without captures has only group 0");
   Context.expect_true(direct.group(0) IS Group(Span(2, 5), "abc"), "Group 0 of a direct match mirrors it");
}

void test_absent_and_empty_groups(TestContext &Context) {
   auto optional_group = search_all("(a)(b)?", "a");
   Context.expect_equal(optional_group.size(), size_t(1), "(a)(b)? matches once");
   if (auto match = optional_group[0]) {
      Context.expect_equal(match->groups().size(), size_t(3), "Absent groups still count");
      Context.expect_true(not match->group(2).has_value(), "Non-participating group is absent");
      Context.expect_true(match->group(1).has_value(), "Participating group is present");
   }

   auto empty_group = search_all("(a)(b*)", "a");
   if (auto match = empty_group[0]) {
      auto group = match->group(2);
      Context.expect_true(group.has_value(), "A group that matched nothing is present");
      if (group) {
         Context.expect_true(group->span() IS Span(1, 1), "Empty group has an empty span");
         Context.expect_equal(group->text(), std::string(""), "Empty group has empty text");
      }
   }
   else Context.expect_true(false, "(a)(b*) matches once");
}

void test_groups_access(TestContext &Context) {
   auto matches = search_all("(a)(b)?(c)", "ac");
   auto match = matches[0];
   if (not match) {
      Context.expect_true(false, "(a)(b)?(c) matches");
      return;
   }

   auto groups = match->groups();

   auto map = groups.as_map();
   Context.expect_equal(map.size(), size_t(4), "as_map() lists every group");
   Context.expect_true(not map[2].first.has_value(), "as_map() gives absent groups no span");
   Context.expect_equal(map[2].second, std::string(""), "as_map() gives absent groups empty text");
   Context.expect_true(map[3].first IS std::optional<Span>(Span(1, 2)), "as_map() keeps group spans");
   Context.expect_true(not groups.cached(3), "as_map() does not populate the cache");

   std::vector<std::optional<Group>> iterated;
   for (auto &group : groups) iterated.push_back(group);
   Context.expect_equal(iterated.size(), size_t(4), "Iteration visits every group");
   Context.expect_true(iterated.size() IS 4 and not iterated[2].has_value(), "Iteration yields absent groups");

   auto array = groups.as_array();
   Context.expect_equal(array.size(), size_t(3), "Bulk conversion lists participating groups");
   Context.expect_equal(array[2].text(), std::string("c"), "Bulk conversion preserves order");

   auto a = groups.get(1);
   auto b = match->groups().get(1);
   Context.expect_true(a.get() IS b.get(), "Groups of a match share one cache");

   bool thrown = false;
   try { match->group(4); }
   catch (const std::out_of_range &) { thrown = true; }
   Context.expect_true(thrown, "Group index past the last group throws");

   auto cursor = groups.cursor();
   size_t steps = 0;
   while (cursor.next()) steps++;
   Context.expect_equal(steps, groups.size(), "A group cursor visits every group");
}

void test_access_modes_agree(TestContext &Context) {
   auto matches = search_all("\\w+", "the quick brown fox");

   std::vector<std::string> iterated;
   for (auto &match : matches) {
      if (match) iterated.push_back(match->text());
   }

   std::vector<std::string> indexed;
   for (auto i = matches.start_index(); i < matches.end_index(); i = matches.index_after(i)) {
      if (auto match = matches[i]) indexed.push_back(match->text());
   }

   std::vector<std::string> bulk;
   for (auto &match : matches.as_array()) bulk.push_back(match.text());

   Context.expect_equal(matches.size(), size_t(4), "Collection size");
   Context.expect_equal(iterated.size(), matches.size(), "Iteration count equals size");
   Context.expect_true(iterated IS indexed, "Iteration agrees with random access");
   Context.expect_true(iterated IS bulk, "Iteration agrees with bulk conversion");

   std::vector<std::string> again;
   for (auto &match : matches) {
      if (match) again.push_back(match->text());
   }
   Context.expect_true(iterated IS again, "Iterating twice yields the same sequence");
}

void test_caching(TestContext &Context) {
   auto matches = search_all("\\d+", "1 22 333");

   Context.expect_equal(matches.cached_count(), size_t(0), "Nothing is cached before access");
   auto bulk = matches.as_array();
   Context.expect_equal(matches.cached_count(), size_t(0), "Bulk conversion does not use the cache");

   auto first = matches.get(1);
   auto second = matches.get(1);
   Context.expect_true(first.get() IS second.get(), "The same position returns the same instance");
   Context.expect_true(matches.cached(1) and not matches.cached(0), "Only the accessed position is cached");

   auto copy = matches;
   Context.expect_true(copy.get(1).get() IS first.get(), "Copies of a collection share the cache");

   matches.clear_cache();
   Context.expect_equal(copy.cached_count(), size_t(0), "Clearing through one copy clears the shared cache");
   auto third = matches.get(1);
   Context.expect_true(third.get() != first.get(), "A new instance is built after clearing");
   Context.expect_true(**third IS **first, "The rebuilt match equals the original");

   matches.get(0);
   BroadcastEvent(EVENT::LOW_MEMORY);
   Context.expect_equal(matches.cached_count(), size_t(0), "The low memory event clears the cache");
   Context.expect_equal(matches.raw().size(), size_t(3), "Raw results survive the low memory event");
   Context.expect_equal(matches[2]->text(), std::string("333"), "Matches are rebuilt after the low memory event");
}

void test_cursor(TestContext &Context) {
   auto matches = search_all("\\d", "1a2");
   auto cursor = matches.cursor();
   Context.expect_true(cursor.state() IS CURSOR::NOT_STARTED, "Cursor starts in the not-started state");

   auto element = cursor.next();
   Context.expect_true(element and (*element)->text() IS "1", "First cursor step yields the first match");
   Context.expect_true(matches.cached(0), "Cursor steps populate the cache");
   cursor.next();
   Context.expect_true(cursor.next() IS nullptr, "Cursor ends after the last match");
   Context.expect_true(cursor.state() IS CURSOR::EXHAUSTED, "Cursor is exhausted");

   auto fresh = matches.cursor();
   Context.expect_true(fresh.state() IS CURSOR::NOT_STARTED, "Each cursor is independent");

   bool thrown = false;
   try { matches.at(2); }
   catch (const std::out_of_range &) { thrown = true; }
   Context.expect_true(thrown, "Checked access past the end throws");
}

void test_empty_text(TestContext &Context) {
   auto matches = search_all("a*", "");
   Context.expect_equal(matches.size(), size_t(0), "Empty text has no matches");
   Context.expect_true(matches.as_array().empty(), "Empty text converts to an empty array");
   Context.expect_true(matches.begin() IS matches.end(), "Empty text iterates nothing");
   Context.expect_equal(matches.end_index(), size_t(0), "End index of an empty collection");
}

void test_sub_range(TestContext &Context) {
   auto matches = search_all("\\w+", "one two three", Span(4, 13));
   auto all = matches.as_array();
   Context.expect_equal(all.size(), size_t(2), "Sub-range search only finds matches in the range");
   if (all.size() IS 2) {
      Context.expect_equal(all[0].text(), std::string("two"), "First match in the range");
      Context.expect_true(all[1].span() IS Span(8, 13), "Spans are measured from the start of the text");
   }

   // "naïve" spelled with a combining diaeresis, then an emoji ZWJ sequence and a word

   std::string text("nai\xCC\x88ve \xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x92\xBB ok");
   auto words = search_all("ok", text, Span(6, 10));
   Context.expect_equal(words.size(), size_t(1), "Ranges are measured in grapheme clusters");
   if (auto match = words[0]) {
      Context.expect_true(match->span() IS Span(8, 10), "Match span is in grapheme clusters");
   }
}

void test_direct_equals_derived(TestContext &Context) {
   Match direct(Span(0, 4), "Yes.", {
      Group(Span(0, 4), "Yes."),
      Group(Span(0, 3), "Yes")
   });

   auto source = SourceText::make("Yes. This dog is very friendly.");
   auto derived = Match::from(RawMatch(Span(0, 4), { Span(0, 4), Span(0, 3) }), source);

   Context.expect_true(derived.has_value(), "A regular raw match converts");
   if (derived) {
      Context.expect_true(*derived IS direct, "Direct and derived matches are equal");
      Context.expect_true(derived->groups()[0] IS direct.groups()[0], "Group 0 is identical for both paths");
   }

   Match with_absent(Span(0, 1), "a", { Group(Span(0, 1), "a"), std::nullopt });
   auto derived_absent = Match::from(RawMatch(Span(0, 1), { Span(0, 1), std::nullopt }), SourceText::make("a"));
   Context.expect_true(derived_absent.has_value() and (*derived_absent IS with_absent), "Absent groups compare equal");

   Match different(Span(0, 4), "Yes.", { Group(Span(0, 4), "Yes."), Group(Span(0, 2), "Ye") });
   Context.expect_true(not (different IS direct), "Matches with different groups are not equal");
}

void test_malformed_results(TestContext &Context) {
   auto source = SourceText::make("abc");

   Context.expect_true(not Match::from(RawMatch(Span(0, 1), {}, RESULT::CONTROL), source).has_value(), "Control records do not convert");
   Context.expect_true(not Match::from(RawMatch(Span(1, 9)), source).has_value(), "Spans outside of the text do not convert");
   Context.expect_true(not Match::from(RawMatch(Span(0, 1), { Span(2, 7) }), source).has_value(), "Captures outside of the text do not convert");

   auto matches = MatchCollection::from({
      RawMatch(Span(0, 1)),
      RawMatch(Span(1, 2), {}, RESULT::CONTROL),
      RawMatch(Span(2, 3)),
      RawMatch(Span(0, 8))
   }, "abc");

   Context.expect_equal(matches.size(), size_t(4), "A collection with malformed entries still constructs");
   Context.expect_true(matches[0].has_value(), "Valid entries materialise");
   Context.expect_true(not matches[1].has_value(), "Malformed entries materialise as no value");
   Context.expect_equal(matches[2]->text(), std::string("c"), "Entries after a malformed one are unaffected");
   Context.expect_true(not matches[3].has_value(), "Out of bounds entries materialise as no value");
   Context.expect_equal(matches.as_array().size(), size_t(2), "Bulk conversion skips malformed entries");
}

int main() {
   TestContext test_context;
   test_sample_sentence(test_context);
   test_group_zero(test_context);
   test_absent_and_empty_groups(test_context);
   test_groups_access(test_context);
   test_access_modes_agree(test_context);
   test_caching(test_context);
   test_cursor(test_context);
   test_empty_text(test_context);
   test_sub_range(test_context);
   test_direct_equals_derived(test_context);
   test_malformed_results(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
