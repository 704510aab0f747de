#ifndef MC_LOG_HPP
#define MC_LOG_HPP

#include "mc/format.hpp"

#include <array>
#include <concepts>
#include <cstdint>
#include <string_view>

namespace mc {

namespace internal {

template <typename... Ts>
concept NonEmpty = sizeof...(Ts) > 0;

} // namespace internal

struct Log final
{
   enum class Level : uint8_t
   {
      DEBUG,
      INFO,
      WARNING,
      ERROR,
      FATAL
   };

   static void Debug(const char * tag, const char * text) { Write(Level::DEBUG, tag, text); }
   static void Info(const char * tag, const char * text) { Write(Level::INFO, tag, text); }
   static void Warning(const char * tag, const char * text) { Write(Level::WARNING, tag, text); }
   static void Error(const char * tag, const char * text) { Write(Level::ERROR, tag, text); }
   [[noreturn]] static void Fatal(const char * tag, const char * text);

   // clang-format off
   template <typename... Ts> requires internal::NonEmpty<Ts...>
   static void Debug(const char * tag, std::string_view fmt, Ts &&... args)
   {
      WriteFormatted(Level::DEBUG, tag, fmt, std::forward<Ts>(args)...);
   }
   template <typename... Ts> requires internal::NonEmpty<Ts...>
   static void Info(const char * tag, std::string_view fmt, Ts &&... args)
   {
      WriteFormatted(Level::INFO, tag, fmt, std::forward<Ts>(args)...);
   }
   template <typename... Ts> requires internal::NonEmpty<Ts...>
   static void Warning(const char * tag, std::string_view fmt, Ts &&... args)
   {
      WriteFormatted(Level::WARNING, tag, fmt, std::forward<Ts>(args)...);
   }
   template <typename... Ts> requires internal::NonEmpty<Ts...>
   static void Error(const char * tag, std::string_view fmt, Ts &&... args)
   {
      WriteFormatted(Level::ERROR, tag, fmt, std::forward<Ts>(args)...);
   }
   template <typename... Ts> requires internal::NonEmpty<Ts...>
   [[noreturn]] static void Fatal(const char * tag, std::string_view fmt, Ts &&... args)
   {
      auto formatted = FormatArgs(fmt, std::forward<Ts>(args)...);
      Fatal(tag, formatted.data());
   }
   // clang-format on

   // Messages below this level are dropped before formatting. FATAL is never dropped.
   static void SetLevel(Level lvl) noexcept { s_minLevel = lvl; }
   static Level GetLevel() noexcept { return s_minLevel; }
   static bool Enabled(Level lvl) noexcept { return lvl >= s_minLevel || lvl == Level::FATAL; }

   using Handler = void (*)(const char *, const char *);

   // nullptr restores the default stdout/stderr sink for that level
   static void SetHandler(Level lvl, Handler handler) noexcept
   {
      s_handlers[static_cast<size_t>(lvl)] = handler;
   }
   static void ResetHandlers() noexcept { s_handlers.fill(nullptr); }

   static constexpr size_t MAX_LINE_LENGTH = 511;

private:
   static_assert((MAX_LINE_LENGTH + 1) % 64 == 0);

   static void Write(Level lvl, const char * tag, const char * text);

   template <typename... Ts>
   static void WriteFormatted(Level lvl, const char * tag, std::string_view fmt, Ts &&... args)
   {
      if (!Enabled(lvl))
         return;
      auto formatted = FormatArgs(fmt, std::forward<Ts>(args)...);
      Write(lvl, tag, formatted.data());
   }

   template <typename... Ts>
   static auto FormatArgs(std::string_view fmt, Ts &&... args)
   {
      std::array<char, MAX_LINE_LENGTH + 1> buffer;
      auto rest = text::Format({buffer.data(), MAX_LINE_LENGTH}, fmt, std::forward<Ts>(args)...);
      buffer[MAX_LINE_LENGTH - rest.size()] = '\0';
      return buffer;
   }

   static inline std::array<Handler, 5> s_handlers{};
   static inline Level s_minLevel = Level::DEBUG;
};

} // namespace mc

#endif // MC_LOG_HPP
