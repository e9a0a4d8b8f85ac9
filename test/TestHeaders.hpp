#ifndef __TVH_TEST_HEADERS__
#define __TVH_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __TVH_TEST_HEADERS__
