/*********************************************************************************************************************

Global data shared by the Core source files.

*********************************************************************************************************************/

#include "defs.h"

namespace sift {

const CSTRING glMessages[] = {
   "Operation successful.",                         // Okay
   "Required arguments were not specified.",        // NullArgs
   "Invalid arguments passed to function.",         // Args
   "Memory allocation failed.",                     // AllocMemory
   "Syntax error.",                                 // Syntax
   "Invalid value.",                                // InvalidValue
   "A value or range is out of bounds.",            // OutOfRange
   "The object has not been initialised.",          // NotInitialised
   "A search did not find a match.",                // Search
   "The requested feature is not supported.",       // NoSupport
   "The operation was terminated by the client."    // Terminate
};

const int glTotalMessages = int(sizeof(glMessages) / sizeof(glMessages[0]));

static_assert(sizeof(glMessages) / sizeof(glMessages[0]) IS size_t(ERR::END), "Error table is out of sync with ERR");

std::mutex glmPrint;
std::recursive_mutex glmEvents;

#ifdef SIFT_VLOG
   std::atomic<int16_t> glLogLevel = int16_t(8);
#else
   std::atomic<int16_t> glLogLevel = int16_t(1); // Errors only by default; raise with --log-api or OpenCore()
#endif
std::atomic<int16_t> glMaxDepth = int16_t(20);
std::atomic<bool> glLogThreads = false;

thread_local int16_t tlDepth     = 0;
thread_local int16_t tlLogStatus = 1;
thread_local int tlBaseLine      = 0;
thread_local int tlThreadID      = 0;

} // namespace sift
