/*********************************************************************************************************************

-MODULE-
Core: The core library provides logging, error reporting, configuration and event services.

Programs that use Sift are not required to call OpenCore(), but doing so allows the user to control logging from the
command-line with the `--log-*` options.

-END-

*********************************************************************************************************************/

#include <sstream>

#include "defs.h"

namespace sift {

/*********************************************************************************************************************

-FUNCTION-
OpenCore: Configures the Core at start-up.

OpenCore() applies the settings in an OpenInfo structure.  Only the fields indicated by `Info.Flags` are read:

<types lookup="OPF"/>

If `OPF::ARGS` is set, `Info.Args` is scanned for Core options and every argument that is not recognised is copied to
`Arguments`, excluding the program name at index zero.  Recognised options are `--log-none`, `--log-error`,
`--log-warn`, `--log-warning`, `--log-info`, `--log-api`, `--log-extapi`, `--log-debug`, `--log-trace`, `--log-all`
and `--log-threads`.  Options on the command-line take precedence over `Info.Detail`.

-INPUT-
struct(OpenInfo) Info: Start-up settings.
&cpp(array(cpp(str))) Arguments: Optional, receives the arguments that were not consumed by the Core.

-ERRORS-
Okay
Args: `Info.Detail` or `Info.MaxDepth` is out of range.
NullArgs: `OPF::ARGS` was set without providing `Info.Args`.

*********************************************************************************************************************/

ERR OpenCore(const OpenInfo &Info, std::vector<std::string> *Arguments)
{
   Log log(__FUNCTION__);

   if ((Info.Flags & OPF::DETAIL) != OPF::NIL) {
      if ((Info.Detail < 0) or (Info.Detail > 9)) return log.warning(ERR::Args);
      glLogLevel = int16_t(Info.Detail);
   }

   if ((Info.Flags & OPF::MAX_DEPTH) != OPF::NIL) {
      if ((Info.MaxDepth < 1) or (Info.MaxDepth > 100)) return log.warning(ERR::Args);
      glMaxDepth = int16_t(Info.MaxDepth);
   }

   if ((Info.Flags & OPF::LOG_THREADS) != OPF::NIL) glLogThreads = true;

   if (Arguments) Arguments->clear();

   if ((Info.Flags & OPF::ARGS) != OPF::NIL) {
      if ((not Info.Args) and (Info.ArgCount > 0)) return log.warning(ERR::NullArgs);

      for (int i=1; i < Info.ArgCount; i++) {
         std::string_view arg(Info.Args[i] ? Info.Args[i] : "");
         if (not arg.starts_with("--")) {
            if (Arguments) Arguments->emplace_back(arg);
            continue;
         }
         arg.remove_prefix(2); // Skip '--' as this prepends all Core arguments

         if (iequals(arg, "log-threads"))      glLogThreads = true;
         else if (iequals(arg, "log-none"))    glLogLevel = 0;
         else if (iequals(arg, "log-error"))   glLogLevel = 1;
         else if (iequals(arg, "log-warn"))    glLogLevel = 2;
         else if (iequals(arg, "log-warning")) glLogLevel = 2;
         else if (iequals(arg, "log-info"))    glLogLevel = 4; // Levels 3/4 are for applications (no internal detail)
         else if (iequals(arg, "log-api"))     glLogLevel = 5; // Default level for API messages
         else if (iequals(arg, "log-extapi"))  glLogLevel = 6;
         else if (iequals(arg, "log-debug"))   glLogLevel = 7;
         else if (iequals(arg, "log-trace"))   glLogLevel = 9;
         else if (iequals(arg, "log-all"))     glLogLevel = 9; // 9 is the absolute maximum
         else if (Arguments) Arguments->emplace_back(Info.Args[i]);
      }

      if (glLogLevel > 2) {
         std::ostringstream cmdline;
         for (int i=0; i < Info.ArgCount; i++) {
            if (i > 0) cmdline << ' ';
            if (Info.Args[i]) cmdline << Info.Args[i];
         }
         log.msg("Parameters: %s", cmdline.str().c_str());
      }
   }

   log.detail("Log level: %d, Max depth: %d", int(glLogLevel), int(glMaxDepth));
   return ERR::Okay;
}

} // namespace sift
