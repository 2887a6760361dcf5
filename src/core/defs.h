#pragma once

// Private definitions shared by the Core source files.

#include <sift/main.h>

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#define THREADVAR thread_local

namespace sift {

//********************************************************************************************************************

extern const CSTRING glMessages[];
extern const int glTotalMessages;

extern std::mutex glmPrint;                  // For message logging only.
extern std::recursive_mutex glmEvents;       // For the event subscription list.

extern std::atomic<int16_t> glLogLevel;
extern std::atomic<int16_t> glMaxDepth;
extern std::atomic<bool> glLogThreads;

//********************************************************************************************************************
// Thread specific variables - these do not require locks.

extern THREADVAR int16_t tlDepth;
extern THREADVAR int16_t tlLogStatus;
extern THREADVAR int tlBaseLine;
extern THREADVAR int tlThreadID;

//********************************************************************************************************************

[[nodiscard]] int get_thread_id(void);
[[nodiscard]] int count_subscribers(void);

namespace detail {

struct LogRecord {
   VLF Flags = VLF::NIL;
   CSTRING Header = nullptr;
   std::string Message;
};

bool ShouldSkipLog(VLF Flags);
void SubmitLogRecord(LogRecord &&Record);

} // namespace detail

[[nodiscard]] inline bool iequals(const std::string_view lhs, const std::string_view rhs) noexcept
{
   if (lhs.size() != rhs.size()) return false;
   for (size_t i=0; i < lhs.size(); i++) {
      auto a = (lhs[i] >= 'A' and lhs[i] <= 'Z') ? lhs[i] + 0x20 : lhs[i];
      auto b = (rhs[i] >= 'A' and rhs[i] <= 'Z') ? rhs[i] + 0x20 : rhs[i];
      if (a != b) return false;
   }
   return true;
}

} // namespace sift
