#ifndef MC_ERRORS_HPP
#define MC_ERRORS_HPP

#include <stdexcept>

namespace mc {

// Argument of the wrong kind, e.g. mixed face types or a non-numeric weight
struct TypeError : std::invalid_argument
{
   using std::invalid_argument::invalid_argument;
};

// Argument of the right kind but with an unacceptable value
struct ValueError : std::invalid_argument
{
   using std::invalid_argument::invalid_argument;
};

// Key not present, e.g. a face that the die does not have
struct LookupError : std::out_of_range
{
   using std::out_of_range::out_of_range;
};

} // namespace mc

#endif // MC_ERRORS_HPP
