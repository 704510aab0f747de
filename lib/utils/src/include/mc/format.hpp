#ifndef MC_FORMAT_HPP
#define MC_FORMAT_HPP

#include <array>
#include <cassert>
#include <charconv>
#include <concepts>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <tuple>

namespace mc::text {
namespace internal {

template <typename T>
concept Arithmetic =
   std::is_arithmetic_v<std::decay_t<T>> && !std::is_same_v<std::decay_t<T>, bool> &&
   !std::is_same_v<std::decay_t<T>, char>;

template <Arithmetic T>
std::span<char> WriteAsText(T arg, std::span<char> dest)
{
   assert(!dest.empty());
   const auto [last, ec] = std::to_chars(dest.data(), dest.data() + dest.size(), arg);
   if (ec != std::errc{})
      return dest.subspan(dest.size());
   return dest.subspan(static_cast<size_t>(last - dest.data()));
}
std::span<char> WriteAsText(std::string_view arg, std::span<char> dest);
std::span<char> WriteAsText(const char * arg, std::span<char> dest);
std::span<char> WriteAsText(const std::string & arg, std::span<char> dest);

// clang-format off
template <typename T>
concept Writable = requires(T && arg, std::span<char> buf) {
   { WriteAsText(std::forward<T>(arg), buf) } -> std::same_as<std::span<char>>;
};
// clang-format on

size_t ParsePlaceholder(std::string_view from);
std::tuple<std::string_view, std::span<char>> CopyUntilPlaceholder(std::string_view src,
                                                                   std::span<char> dest);

} // namespace internal

template <typename T>
concept Formattable = internal::Writable<T>;

// Substitutes each "{}" in fmt with the next argument. Output is truncated when the buffer runs
// out; superfluous arguments are appended, missing ones leave the rest of fmt unwritten.
// Returns the unused tail of buffer.
template <Formattable... Ts>
std::span<char> Format(std::span<char> buffer, std::string_view fmt, Ts &&... args)
{
   using namespace internal;
   auto ProcessArg = [&](auto && arg) {
      std::tie(fmt, buffer) = CopyUntilPlaceholder(fmt, buffer);
      if (!buffer.empty())
         buffer = WriteAsText(std::forward<decltype(arg)>(arg), buffer);
      return !buffer.empty();
   };
   (... && ProcessArg(std::forward<Ts>(args)));
   std::tie(fmt, buffer) = CopyUntilPlaceholder(fmt, buffer);
   return buffer;
}

template <size_t Capacity = 256, Formattable... Ts>
std::string FormatToString(std::string_view fmt, Ts &&... args)
{
   std::array<char, Capacity> buffer;
   auto rest = Format(buffer, fmt, std::forward<Ts>(args)...);
   return std::string(buffer.data(), buffer.size() - rest.size());
}

} // namespace mc::text

#endif // MC_FORMAT_HPP
