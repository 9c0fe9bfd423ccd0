#pragma once

#include "sdcp/log/Log.hpp"

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { sdcp::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { sdcp::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

inline int reportResult(const char* suite) {
    if (g_failures) {
        sdcp::logError(suite, " tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    sdcp::logInfo(suite, " tests passed.\n");
    return 0;
}
