#include "mc/value.hpp"
#include "mc/errors.hpp"
#include "mc/format.hpp"

#include <cmath>
#include <ostream>
#include <type_traits>

namespace mc {

bool IsNumeric(const Value & value) noexcept
{
   return !std::holds_alternative<std::string>(value);
}

bool IsNaN(const Value & value) noexcept
{
   const auto * d = std::get_if<double>(&value);
   return d && std::isnan(*d);
}

double ToDouble(const Value & value)
{
   return value.Apply([](const auto & v) -> double {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::string>)
         throw TypeError("ToDouble(): Value '" + v + "' is not numeric");
      else
         return static_cast<double>(v);
   });
}

std::string ToString(const Value & value)
{
   if (const auto * s = std::get_if<std::string>(&value))
      return *s;
   return text::FormatToString("{}", value);
}

std::span<char> WriteAsText(const Value & value, std::span<char> dest)
{
   return value.Apply([dest](const auto & v) { return text::Format(dest, "{}", v); });
}

std::ostream & operator<<(std::ostream & os, const Value & value)
{
   return os << ToString(value);
}

} // namespace mc
