#include "mc/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace {

constexpr char LevelLetter(mc::Log::Level lvl)
{
   switch (lvl) {
   case mc::Log::Level::DEBUG:
      return 'D';
   case mc::Log::Level::INFO:
      return 'I';
   case mc::Log::Level::WARNING:
      return 'W';
   case mc::Log::Level::ERROR:
      return 'E';
   case mc::Log::Level::FATAL:
      return 'F';
   }
   return '?';
}

void StdLog(mc::Log::Level lvl, const char * tag, const char * text)
{
   char timeBuf[64];
   const std::time_t t = std::time(nullptr);
   std::tm utc{};
   gmtime_r(&t, &utc);
   if (std::strftime(timeBuf, sizeof(timeBuf), "%F %T", &utc) == 0)
      timeBuf[0] = '\0';

   FILE * file = lvl >= mc::Log::Level::WARNING ? stderr : stdout;
   std::fprintf(file, "%s %c/%s: %s\n", timeBuf, LevelLetter(lvl), tag, text);
}

} // namespace

namespace mc {

void Log::Write(Level lvl, const char * tag, const char * text)
{
   if (!Enabled(lvl))
      return;
   if (Handler handler = s_handlers[static_cast<size_t>(lvl)])
      handler(tag, text);
   else
      StdLog(lvl, tag, text);
}

void Log::Fatal(const char * tag, const char * text)
{
   Write(Level::FATAL, tag, text);
   std::abort();
}

} // namespace mc
