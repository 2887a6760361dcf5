#pragma once

// Name:      core.h
// Copyright: The Sift Authors 2025

#include <sift/system/types.h>
#include <sift/system/errors.h>

#include <stdarg.h>
#include <inttypes.h>

#ifdef __cplusplus
#include <functional>
#include <string>
#include <vector>
#endif

namespace sift {

// Flags for VLogF()

enum class VLF : uint32_t {
   NIL = 0,
   BRANCH = 0x00000001,
   ERROR = 0x00000002,
   WARNING = 0x00000004,
   CRITICAL = 0x00000008,
   INFO = 0x00000010,
   API = 0x00000020,
   DETAIL = 0x00000040,
   TRACE = 0x00000080,
};

DEFINE_ENUM_FLAG_OPERATORS(VLF)

// Flags for the OpenInfo structure passed to OpenCore()

enum class OPF : uint32_t {
   NIL = 0,
   DETAIL = 0x00000001,
   MAX_DEPTH = 0x00000002,
   ARGS = 0x00000004,
   LOG_THREADS = 0x00000008,
};

DEFINE_ENUM_FLAG_OPERATORS(OPF)

// Resources that can be read with GetResource() and changed with SetResource()

enum class RES : int {
   NIL = 0,
   LOG_LEVEL = 1,
   LOG_DEPTH = 2,
   MAX_DEPTH = 3,
   LOG_THREADS = 4,
   THREAD_ID = 5,
   SUBSCRIBERS = 6,
   END
};

// System events that can be subscribed to with SubscribeEvent()

enum class EVENT : int {
   NIL = 0,
   LOW_MEMORY = 1,   // The host is short of memory; lazily built caches should be released.
   END
};

struct OpenInfo {
   OPF   Flags = OPF::NIL;   // Indicates the fields that have been set
   int   Detail = 0;         // OPF::DETAIL: The log level, from 0 (critical only) to 9 (trace)
   int   MaxDepth = 0;       // OPF::MAX_DEPTH: Limits the branch depth of printed log messages
   int   ArgCount = 0;       // OPF::ARGS: Total number of entries in Args
   CSTRING *Args = nullptr;  // OPF::ARGS: Command-line arguments; Sift options are removed and the rest are returned
};

typedef std::function<void(EVENT)> EVENT_CALLBACK;

// Core functions

ERR OpenCore(const OpenInfo &Info, std::vector<std::string> *Arguments = nullptr);
int64_t GetResource(RES Resource);
int64_t SetResource(RES Resource, int64_t Value);
CSTRING GetErrorMsg(ERR Code);

// Logging functions.  Clients should use the scope managed Log class rather than calling these directly.

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args);
ERR FuncError(CSTRING Header, ERR Code);
void LogReturn(void);
int AdjustLogLevel(int Delta);

// Event functions

ERR SubscribeEvent(EVENT Event, EVENT_CALLBACK Callback, APTR *Handle);
void UnsubscribeEvent(APTR Handle);
ERR BroadcastEvent(EVENT Event);

//********************************************************************************************************************
// For extremely verbose debug logs, run cmake with -DSIFT_VLOG=ON

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-zero-length"

class Log { // C++ wrapper for Sift's log functionality
   private:
      int branches;
      CSTRING header;

   public:
      Log() : branches(0), header(nullptr) { }
      Log(CSTRING Header) : branches(0), header(Header) { }

      ~Log() {
         while (branches > 0) { branches--; LogReturn(); }
      }

      #ifdef SIFT_VLOG
      void traceBranch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::TRACE|VLF::BRANCH, header, Message, arg);
         va_end(arg);
         branches++;
      }
      #else
      void traceBranch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) { }
      #endif

      void msg(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) { // Defaults to API level, recommended for library code
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::API, header, Message, arg);
         va_end(arg);
      }

      void msg(VLF Flags, CSTRING Message, ...) __attribute__((format(printf, 3, 4))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(Flags, header, Message, arg);
         va_end(arg);
         if ((Flags & VLF::BRANCH) != VLF::NIL) branches++;
      }

      void detail(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) { // Detailed API message
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::DETAIL, header, Message, arg);
         va_end(arg);
      }

      void warning(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::WARNING, header, Message, arg);
         va_end(arg);
      }

      inline ERR warning(ERR Code) {
         FuncError(header, Code);
         return Code;
      }

      void trace(CSTRING Message, ...) {
         #ifdef SIFT_VLOG
            va_list arg;
            va_start(arg, Message);
            VLogF(VLF::TRACE, header, Message, arg);
            va_end(arg);
         #endif
      }
};

#pragma GCC diagnostic pop

class LogLevel {
   private:
      int level;
   public:
      LogLevel(int Level) : level(Level) {
         AdjustLogLevel(Level);
      }

      ~LogLevel() {
         AdjustLogLevel(-level);
      }
};

} // namespace sift
