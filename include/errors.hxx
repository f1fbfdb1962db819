#ifndef GREENHAUL_ERRORS
#define GREENHAUL_ERRORS

#include <stdexcept>

namespace greenhaul {

/// Caller supplied data the engine cannot work with.
class InputError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

}

#endif
