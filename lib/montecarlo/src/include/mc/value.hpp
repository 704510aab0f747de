#ifndef MC_VALUE_HPP
#define MC_VALUE_HPP

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <utility>
#include <variant>

namespace mc {

struct Value : std::variant<int64_t, double, std::string>
{
   using Base = std::variant<int64_t, double, std::string>;

   using Base::variant;

   template <typename V>
   decltype(auto) Apply(V && visitor) const
   {
      return std::visit(std::forward<V>(visitor), static_cast<const Base &>(*this));
   }

   // Alternatives compare by index first, so 1 < 1.0 < "1" and 1 != 1.0.
   // NaN has no place in this order; see IsNaN().
   friend bool operator==(const Value & lhs, const Value & rhs)
   {
      return static_cast<const Base &>(lhs) == static_cast<const Base &>(rhs);
   }
   friend bool operator<(const Value & lhs, const Value & rhs)
   {
      return static_cast<const Base &>(lhs) < static_cast<const Base &>(rhs);
   }
};

using Face = Value;

bool IsNumeric(const Value & value) noexcept;
bool IsNaN(const Value & value) noexcept;

// Throws TypeError for string values
double ToDouble(const Value & value);

std::string ToString(const Value & value);

std::span<char> WriteAsText(const Value & value, std::span<char> dest);

std::ostream & operator<<(std::ostream & os, const Value & value);

} // namespace mc

#endif // MC_VALUE_HPP
