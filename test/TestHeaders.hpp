#ifndef __TH_TEST_HEADERS__
#define __TH_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __TH_TEST_HEADERS__
