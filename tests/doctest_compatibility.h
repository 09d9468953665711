#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

#define DOCTEST_THREAD_LOCAL  // enable single-threaded builds on XCode
#include <doctest/doctest.h>

// Catch -> doctest
#define SECTION(name) DOCTEST_SUBCASE(name)

#endif  // DOCTEST_COMPATIBILITY_H
