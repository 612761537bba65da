#ifndef __WT_TEST_HEADERS__
#define __WT_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch_all.hpp>

#endif  // __WT_TEST_HEADERS__
