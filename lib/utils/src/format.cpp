#include "mc/format.hpp"

#include <algorithm>

namespace mc::text::internal {

std::span<char> WriteAsText(std::string_view arg, std::span<char> dest)
{
   const size_t length = std::min(arg.size(), dest.size());
   std::copy_n(arg.cbegin(), length, dest.begin());
   return dest.subspan(length);
}

std::span<char> WriteAsText(const char * arg, std::span<char> dest)
{
   return WriteAsText(std::string_view(arg ? arg : "(null)"), dest);
}

std::span<char> WriteAsText(const std::string & arg, std::span<char> dest)
{
   return WriteAsText(std::string_view(arg), dest);
}


size_t ParsePlaceholder(std::string_view from)
{
   static constexpr std::string_view placeholder = "{}";
   return from.starts_with(placeholder) ? placeholder.size() : 0;
}

std::tuple<std::string_view, std::span<char>> CopyUntilPlaceholder(std::string_view src,
                                                                   std::span<char> dest)
{
   size_t srcPos = 0;
   size_t destPos = 0;
   while (srcPos < src.size() && destPos < dest.size()) {
      const size_t placeholderLength = ParsePlaceholder(src.substr(srcPos));
      if (placeholderLength > 0) {
         srcPos += placeholderLength;
         break;
      }
      dest[destPos++] = src[srcPos++];
   }
   return {src.substr(srcPos), dest.subspan(destPos)};
}

} // namespace mc::text::internal
