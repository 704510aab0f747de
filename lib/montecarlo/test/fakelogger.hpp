#ifndef TESTS_FAKELOGGER_HPP
#define TESTS_FAKELOGGER_HPP

#include "mc/log.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

class FakeLogger
{
public:
   using Level = mc::Log::Level;

   struct LogLine
   {
      Level lvl;
      std::string tag;
      std::string text;
   };

   FakeLogger()
   {
      s_lines.clear();
      mc::Log::SetHandler(Level::DEBUG, LogDebug);
      mc::Log::SetHandler(Level::INFO, LogInfo);
      mc::Log::SetHandler(Level::WARNING, LogWarning);
      mc::Log::SetHandler(Level::ERROR, LogError);
      mc::Log::SetHandler(Level::FATAL, LogFatal);
   }
   ~FakeLogger()
   {
      s_lines.clear();
      mc::Log::ResetHandlers();
      mc::Log::SetLevel(Level::DEBUG);
   }

   std::vector<LogLine> GetEntries() const { return s_lines; }
   bool Empty() const { return s_lines.empty(); }
   void Clear() { s_lines.clear(); }
   bool Contains(Level lvl, std::string_view fragment) const
   {
      return std::any_of(s_lines.cbegin(), s_lines.cend(), [&](const LogLine & line) {
         return line.lvl == lvl && line.text.find(fragment) != std::string::npos;
      });
   }
   bool NoWarningsOrErrors() const
   {
      return std::none_of(s_lines.cbegin(), s_lines.cend(), [](const LogLine & line) {
         return line.lvl >= Level::WARNING;
      });
   }

private:
   static inline std::vector<LogLine> s_lines;

   static void LogDebug(const char * tag, const char * text)
   {
      s_lines.emplace_back(LogLine{Level::DEBUG, tag, text});
   }
   static void LogInfo(const char * tag, const char * text)
   {
      s_lines.emplace_back(LogLine{Level::INFO, tag, text});
   }
   static void LogWarning(const char * tag, const char * text)
   {
      s_lines.emplace_back(LogLine{Level::WARNING, tag, text});
   }
   static void LogError(const char * tag, const char * text)
   {
      s_lines.emplace_back(LogLine{Level::ERROR, tag, text});
   }
   static void LogFatal(const char * tag, const char * text)
   {
      s_lines.emplace_back(LogLine{Level::FATAL, tag, text});
   }
};

#endif // TESTS_FAKELOGGER_HPP
