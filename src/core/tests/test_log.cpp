#include <sift/main.h>
#include <cstdio>
#include <functional>
#include <iostream>
#include <string>
#include <unistd.h>

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

   void summary() const {
      if (failed_checks IS 0) {
         std::cout << "All " << total_checks << " checks passed." << '\n';
      } else {
         std::cout << failed_checks << " of " << total_checks << " checks failed." << '\n';
      }
   }
};

// Runs Function with stderr redirected to a temporary file and returns everything that was written.

static std::string capture_log(const std::function<void()> &Function)
{
   std::string result;
   fflush(stderr);

   auto file = std::tmpfile();
   if (not file) return result;

   int saved = dup(fileno(stderr));
   dup2(fileno(file), fileno(stderr));

   Function();

   fflush(stderr);
   dup2(saved, fileno(stderr));
   close(saved);

   rewind(file);
   char buffer[512];
   while (auto len = fread(buffer, 1, sizeof(buffer), file)) result.append(buffer, len);
   fclose(file);
   return result;
}

static bool contains(const std::string &Output, const char *Text)
{
   return Output.find(Text) != std::string::npos;
}

//********************************************************************************************************************

void test_level_filter(TestContext &Context) {
   auto original = GetResource(RES::LOG_LEVEL);

   auto emit = []() {
      Log log("Filter");
      log.msg(VLF::CRITICAL, "critical-line");
      log.warning("warning-line");
      log.msg(VLF::INFO, "info-line");
      log.msg("api-line");
      log.detail("detail-line");
   };

   SetResource(RES::LOG_LEVEL, 0);
   auto output = capture_log(emit);
   Context.expect_true(contains(output, "critical-line"), "Critical messages are always printed");
   Context.expect_true(not contains(output, "warning-line"), "Level 0 hides warnings");

   SetResource(RES::LOG_LEVEL, 1);
   output = capture_log(emit);
   Context.expect_true(not contains(output, "warning-line"), "Level 1 hides warnings");
   Context.expect_true(not contains(output, "api-line"), "Level 1 hides API messages");

   SetResource(RES::LOG_LEVEL, 2);
   output = capture_log(emit);
   Context.expect_true(contains(output, "warning-line"), "Level 2 prints warnings");
   Context.expect_true(not contains(output, "info-line"), "Level 2 hides info messages");

   SetResource(RES::LOG_LEVEL, 4);
   output = capture_log(emit);
   Context.expect_true(contains(output, "info-line"), "Level 4 prints info messages");
   Context.expect_true(not contains(output, "api-line"), "Level 4 hides API messages");

   SetResource(RES::LOG_LEVEL, 5);
   output = capture_log(emit);
   Context.expect_true(contains(output, "api-line"), "Level 5 prints API messages");
   Context.expect_true(not contains(output, "detail-line"), "Level 5 hides detail messages");

   SetResource(RES::LOG_LEVEL, 6);
   output = capture_log(emit);
   Context.expect_true(contains(output, "detail-line"), "Level 6 prints detail messages");

   SetResource(RES::LOG_LEVEL, original);
}

void test_error_codes(TestContext &Context) {
   auto original = GetResource(RES::LOG_LEVEL);
   SetResource(RES::LOG_LEVEL, 2);

   ERR result = ERR::Okay;
   auto output = capture_log([&result]() {
      Log log("Codes");
      result = log.warning(ERR::Search);
   });

   Context.expect_true(result IS ERR::Search, "warning(ERR) returns the code");
   Context.expect_true(contains(output, "A search did not find a match."), "warning(ERR) prints the error message");
   Context.expect_true(contains(output, "Codes"), "The header is printed");

   SetResource(RES::LOG_LEVEL, 1);
   output = capture_log([]() {
      Log log("Codes");
      log.warning(ERR::Search);
   });
   Context.expect_true(output.empty(), "Error codes are not printed at level 1");

   SetResource(RES::LOG_LEVEL, original);
}

void test_branches(TestContext &Context) {
   auto original = GetResource(RES::LOG_LEVEL);
   auto original_depth = GetResource(RES::MAX_DEPTH);
   SetResource(RES::LOG_LEVEL, 5);

   auto emit = []() {
      {
         Log outer("Outer");
         outer.msg(VLF::API|VLF::BRANCH, "outer-line");
         Log inner("Inner");
         inner.msg("inner-line");
      }
      Log after("After");
      after.msg("after-line");
   };

   auto output = capture_log(emit);
   Context.expect_true(contains(output, "\n Inner"), "Messages within a branch are indented");
   Context.expect_true(contains(output, "\nAfter"), "The branch ends when its Log leaves scope");

   SetResource(RES::MAX_DEPTH, 1);
   output = capture_log(emit);
   Context.expect_true(contains(output, "outer-line"), "Messages above the maximum depth are printed");
   Context.expect_true(not contains(output, "inner-line"), "Messages below the maximum depth are hidden");
   Context.expect_true(contains(output, "after-line"), "Depth is restored after the branch");

   SetResource(RES::MAX_DEPTH, original_depth);
   SetResource(RES::LOG_LEVEL, original);
}

void test_base_line(TestContext &Context) {
   auto original = GetResource(RES::LOG_LEVEL);
   SetResource(RES::LOG_LEVEL, 5);

   auto output = capture_log([]() {
      Log log("Quiet");
      LogLevel quiet(1);
      log.msg("quiet-line");
   });
   Context.expect_true(not contains(output, "quiet-line"), "Raising the base-line hides API messages");

   output = capture_log([]() {
      Log log("Loud");
      log.msg("loud-line");
   });
   Context.expect_true(contains(output, "loud-line"), "The base-line is restored when LogLevel leaves scope");

   SetResource(RES::LOG_LEVEL, original);
}

int main() {
   TestContext test_context;
   test_level_filter(test_context);
   test_error_codes(test_context);
   test_branches(test_context);
   test_base_line(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
