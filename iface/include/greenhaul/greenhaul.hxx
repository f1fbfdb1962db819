#ifndef GREENHAUL_GREENHAUL_HXX
#define GREENHAUL_GREENHAUL_HXX

#include <string>

namespace greenhaul {

auto
project() -> const char*;

auto
version() -> const char*;

auto
usage() -> std::string;

}

#endif
