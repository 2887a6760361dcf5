/*********************************************************************************************************************

-CATEGORY-
Name: System
-END-

*********************************************************************************************************************/

#include "defs.h"

namespace sift {

static std::atomic<int> glThreadIDCount = 0;

//********************************************************************************************************************

int get_thread_id(void)
{
   if (tlThreadID) return tlThreadID;
   tlThreadID = ++glThreadIDCount;
   return tlThreadID;
}

/*********************************************************************************************************************

-FUNCTION-
GetErrorMsg: Translates error codes into human readable strings.
Category: Logging

The GetErrorMsg() function converts error codes into human readable strings.  If the `Error` is invalid, a string of
"Unknown error code" is returned.

-INPUT-
error Error: The error code to lookup.

-RESULT-
cstr: A human readable string for the error code is returned.

*********************************************************************************************************************/

CSTRING GetErrorMsg(ERR Code)
{
   if ((int(Code) < glTotalMessages) and (int(Code) > 0)) {
      return glMessages[int(Code)];
   }
   else if (Code IS ERR::Okay) return glMessages[0];
   else return "Unknown error code.";
}

/*********************************************************************************************************************

-FUNCTION-
GetResource: Retrieve miscellaneous resource identifiers.

The GetResource() function is used to retrieve miscellaneous resource values from the Core.  The following resources
are available:

<types lookup="RES"/>

-INPUT-
int(RES) Resource: The ID of the resource that you want to obtain.

-RESULT-
large: Returns the value of the resource that you have requested.  If the resource ID is not known by the Core, `0` is returned.

*********************************************************************************************************************/

int64_t GetResource(RES Resource)
{
   switch(Resource) {
      case RES::LOG_LEVEL:   return glLogLevel.load(std::memory_order_relaxed);
      case RES::LOG_DEPTH:   return tlDepth;
      case RES::MAX_DEPTH:   return glMaxDepth.load(std::memory_order_relaxed);
      case RES::LOG_THREADS: return glLogThreads.load(std::memory_order_relaxed);
      case RES::THREAD_ID:   return get_thread_id();
      case RES::SUBSCRIBERS: return count_subscribers();
      default: break;
   }

   return 0;
}

/*********************************************************************************************************************

-FUNCTION-
SetResource: Sets miscellaneous resource identifiers.

The SetResource() function is used to change Core settings at run-time.  The following resources can be changed:

<types type="Resource" lookup="RES">
<type name="LOG_LEVEL">Adjusts the current log level.  Valid values are in the range 0 - 9.</>
<type name="MAX_DEPTH">The maximum branch depth at which log messages are still printed.</>
<type name="LOG_THREADS">Set to `1` to prefix log messages with the thread ID.</>
</types>

-INPUT-
int(RES) Resource: The ID of the resource to be set.
large Value:       The new value to set for the resource.

-RESULT-
large: Returns the previous value used for the resource that you have set.  If the resource ID is invalid, `0` is returned.

*********************************************************************************************************************/

int64_t SetResource(RES Resource, int64_t Value)
{
   Log log(__FUNCTION__);

   int64_t oldvalue = 0;

   switch(Resource) {
      case RES::LOG_LEVEL:
         oldvalue = glLogLevel.load(std::memory_order_relaxed);
         if ((Value >= 0) and (Value <= 9)) glLogLevel = int16_t(Value);
         break;

      case RES::MAX_DEPTH:
         oldvalue = glMaxDepth.load(std::memory_order_relaxed);
         if ((Value > 0) and (Value <= 100)) glMaxDepth = int16_t(Value);
         break;

      case RES::LOG_THREADS:
         oldvalue = glLogThreads.load(std::memory_order_relaxed);
         glLogThreads = Value != 0;
         break;

      default:
         log.warning("Unrecognised resource ID: %d, Value: %" PRId64, int(Resource), Value);
   }

   return oldvalue;
}

} // namespace sift
