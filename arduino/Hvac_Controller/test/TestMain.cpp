// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "HvacCore.hpp"

#include <cstdio>
#include <cstdlib>

// DEBUG_PRINTF goes to stderr when HVAC_TEST_LOGGING is set, otherwise nowhere
static void __debugLoggerTest (const char *format, ...) {
    va_list args;
    va_start (args, format);
    vfprintf (stderr, format, args);
    va_end (args);
}

int main (int argc, char **argv) {
    ::testing::InitGoogleTest (&argc, argv);
    if (getenv ("HVAC_TEST_LOGGING") != nullptr)
        __debugLoggerSet (__debugLoggerTest);
    return RUN_ALL_TESTS ();
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
