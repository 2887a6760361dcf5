#pragma once

//  errors.h
//
//  Error codes returned by Sift functions.  Use GetErrorMsg() to translate a code into a readable message.

namespace sift {

enum class ERR : int {
   Okay = 0,
   NullArgs,
   Args,
   AllocMemory,
   Syntax,
   InvalidValue,
   OutOfRange,
   NotInitialised,
   Search,
   NoSupport,
   Terminate,
   END
};

} // namespace sift
