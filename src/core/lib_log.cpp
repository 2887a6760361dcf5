/*********************************************************************************************************************

-CATEGORY-
Name: Logging
-END-

This file contains all logging functions.

Log levels are:

0  CRITICAL Display the message irrespective of the log level.
1  ERROR Major errors that should be displayed to the user (default).
2  WARN Any error suitable for display to a developer or technically minded user.
3  Application log message, level 1
4  INFO Application log message, level 2
5  API Top-level API messages, e.g. function entry points
6  DETAIL Detailed API messages.  For messages within functions, and entry-points for minor functions.
8  TRACE Extremely detailed API messages suitable for intensive debugging only.
9  Noisy debug messages that will appear frequently, e.g. being used in inner loops.

*********************************************************************************************************************/

#include <stdio.h>
#include <stdarg.h>
#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "defs.h"

namespace sift {

static const int COLUMN1 = 30;

enum { MS_NONE, MS_FUNCTION, MS_MSG };

static void fmsg(CSTRING, STRING, int8_t);

namespace {

struct PreparedLogLine {
   std::array<char, COLUMN1+1> Header{};
   std::string Message;
   int Level = 0;
   VLF Flags = VLF::NIL;
   bool Highlight = false;
   bool PrintThread = false;
   int ThreadId = 0;
};

static const std::array<VLF, 10> LOG_LEVELS = {
   VLF::CRITICAL,
   VLF::ERROR|VLF::CRITICAL,
   VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL
};

static void print_line(const PreparedLogLine &Line)
{
   if (Line.PrintThread) fprintf(stderr, "%.4d ", Line.ThreadId);

   if (Line.Highlight) fprintf(stderr, "\033[1m");

   fprintf(stderr, "%s%s", Line.Header.data(), Line.Message.c_str());

   if (Line.Highlight) fprintf(stderr, "\033[0m");

   fprintf(stderr, "\n");
}

static std::string format_message(CSTRING Message, va_list Args)
{
   if (not Message) return std::string();

   va_list copy;
   va_copy(copy, Args);
   int required = vsnprintf(nullptr, 0, Message, copy);
   va_end(copy);

   if (required <= 0) return std::string();

   std::string buffer;
   buffer.resize(required);
   va_copy(copy, Args);
   vsnprintf(buffer.data(), buffer.size()+1, Message, copy);
   va_end(copy);

   return buffer;
}

static PreparedLogLine prepare_line(detail::LogRecord &Record, int Level, int16_t LogSetting)
{
   PreparedLogLine line;
   line.Flags = Record.Flags;
   line.Level = Level;
   line.Message = std::move(Record.Message);
   line.PrintThread = glLogThreads.load(std::memory_order_relaxed);
   if (line.PrintThread) line.ThreadId = get_thread_id();

   bool highlight = (LogSetting > 2) and ((Record.Flags & (VLF::ERROR|VLF::WARNING)) != VLF::NIL);
   if ((Record.Flags & VLF::CRITICAL) != VLF::NIL) highlight = true;
   line.Highlight = highlight;

   auto header = Record.Header;
   if ((header) and (not *header)) header = nullptr;
   if (not header) header = "App";

   auto msgstate = ((Record.Flags & VLF::BRANCH) != VLF::NIL) ? MS_FUNCTION : MS_MSG;

   if (LogSetting > 2) fmsg(header, line.Header.data(), msgstate);
   else {
      size_t len;
      for (len=0; (header[len]) and (len < line.Header.size()-2); len++) line.Header[len] = header[len];
      line.Header[len++] = ' ';
      line.Header[len] = 0;
   }

   return line;
}

} // namespace

/*********************************************************************************************************************

-FUNCTION-
AdjustLogLevel: Adjusts the base-line of all log messages.

This function adjusts the detail level of all outgoing log messages for the calling thread.  To illustrate, setting
the `Delta` value to 1 would result in level 5 (API) log messages being bumped to level 6.  If the user's maximum log
level output is 5, no further API messages will be output until the base-line is reduced to normal.

Adjustments to the base-line are accumulative.  To revert logging to the previous base-line, call this function again
with a negation of the previously passed value, or use the scope managed `LogLevel` class.

-INPUT-
int Delta: The level of adjustment to make to new log messages.  Zero is no change.  The maximum level is +/- 6.

-RESULT-
int: Returns the absolute base-line value that was active prior to calling this function.

*********************************************************************************************************************/

int AdjustLogLevel(int Delta)
{
   if (glLogLevel.load(std::memory_order_relaxed) >= 9) return tlBaseLine; // Do nothing if trace logging is active.
   int old_level = tlBaseLine;
   if ((Delta >= -6) and (Delta <= 6)) tlBaseLine += Delta;
   return old_level;
}

/*********************************************************************************************************************

-FUNCTION-
VLogF: Sends formatted messages to the standard log.
Status: Internal

This function manages the output of log messages by sending them through a log filter.  If the message does not pass
the filter, the function does nothing.  Log message formatting follows the same guidelines as the `printf()` function.

-INPUT-
int(VLF) Flags: Optional flags
cstr Header: A short name for the first column.  Typically function names are placed here, so that the origin of the message is obvious.
cstr Message: A formatted message to print.
va_list Args: A `va_list` corresponding to the arguments referenced in `Message`.
-END-

*********************************************************************************************************************/

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args)
{
   if (detail::ShouldSkipLog(Flags)) return;

   detail::LogRecord record;
   record.Flags   = Flags;
   record.Header  = Header;
   record.Message = format_message(Message ? Message : "", Args);

   detail::SubmitLogRecord(std::move(record));
}

/*********************************************************************************************************************

-FUNCTION-
FuncError: Sends basic error messages to the log.
Status: Internal

This function outputs the message associated with an error code to the log, at warning level.  For instance
`FuncError("Search", ERR::OutOfRange)` would print `Search: A value or range is out of bounds.`

-INPUT-
cstr Header: A short string that names the function that is making the call.
error Error: An error code from the `system/errors.h` include file.

-RESULT-
error: Returns the same code that was specified in the `Error` parameter.

*********************************************************************************************************************/

ERR FuncError(CSTRING Header, ERR Code)
{
   if (tlLogStatus <= 0) return Code;
   if (glLogLevel.load(std::memory_order_relaxed) < 2) return Code;
   if (tlDepth >= glMaxDepth.load(std::memory_order_relaxed)) return Code;

   if (not Header) Header = "Function";

   char msgheader[COLUMN1+1];
   CSTRING histart = "", hiend = "";

   if (glLogLevel.load(std::memory_order_relaxed) > 2) {
      histart = "\033[1m";
      hiend = "\033[0m";
   }

   std::lock_guard lock(glmPrint);
   fmsg(Header, msgheader, MS_MSG);
   fprintf(stderr, "%s%s%s%s\n", histart, msgheader, GetErrorMsg(Code), hiend);

   return Code;
}

/*********************************************************************************************************************

-FUNCTION-
LogReturn: Revert to the previous branch in the logging tree.
Status: Internal

Use LogReturn() to reverse any previous log message that created an indented branch.  This function is considered
internal, and clients must use the scope-managed `Log` class for branched log output.

-END-

*********************************************************************************************************************/

void LogReturn(void)
{
   if (tlLogStatus <= 0) return;
   if ((--tlDepth) < 0) tlDepth = 0;
}

namespace detail {

bool ShouldSkipLog(VLF Flags)
{
   if (tlLogStatus <= 0) {
      if ((Flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
      return true;
   }
   return false;
}

void SubmitLogRecord(LogRecord &&Record)
{
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);
   auto flags = Record.Flags;

   auto dispatch_record = [&](int level) {
      std::lock_guard lock(glmPrint);
      auto prepared = prepare_line(Record, level, log_setting);
      print_line(prepared);
   };

   if ((flags & VLF::CRITICAL) != VLF::NIL) {
      dispatch_record(0);
      if ((flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
      return;
   }

   int level = log_setting - tlBaseLine;
   if (level > 9) level = 9;
   else if (level < 0) level = 0;

   bool should_log = ((LOG_LEVELS[level] & flags) != VLF::NIL);
   if ((not should_log) and (log_setting > 1) and ((flags & (VLF::WARNING|VLF::ERROR|VLF::CRITICAL)) != VLF::NIL)) should_log = true;

   if ((should_log) and (tlDepth < glMaxDepth.load(std::memory_order_relaxed))) {
      dispatch_record(level);
      fflush(stderr);
   }

   if ((flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
}

} // namespace detail

//********************************************************************************************************************
// Buffer must be COLUMN1+1 in size

static void fmsg(CSTRING Header, STRING Buffer, int8_t Colon)
{
   if (not Header) Header = "";

   int16_t pos = 0;
   int16_t depth;
   int16_t col = COLUMN1;

   if (glLogLevel.load(std::memory_order_relaxed) < 3) depth = 0;
   else if (tlDepth > col) depth = col;
   else depth = tlDepth;

   if (glLogLevel.load(std::memory_order_relaxed) >= 3) {
      while ((depth > 0) and (pos < col)) {
         Buffer[pos++] = ' ';
         depth--;
      }
   }

   if ((pos < col) and (Header[0])) { // Print as many function letters as possible.
      int16_t len;
      for (len=0; (Header[len]) and (pos < col); len++) Buffer[pos++] = Header[len];
      if (Colon IS MS_MSG) {
         if ((Header[len-1] != ':') and (Header[len-1] != ')') and (pos < col)) Buffer[pos++] = ':';
      }
      else if (Colon IS MS_FUNCTION) {
         if ((Header[len-1] != ':') and (Header[len-1] != ')') and (pos < col-1)) {
            Buffer[pos++] = '(';
            Buffer[pos++] = ')';
         }
      }
   }

   if (glLogLevel.load(std::memory_order_relaxed) >= 3) while (pos < col) Buffer[pos++] = ' '; // Add any extra spaces
   else if (pos < col) Buffer[pos++] = ' ';

   Buffer[pos] = 0; // NB: Buffer is col + 1, so there is always room for the null byte.
}

} // namespace sift
