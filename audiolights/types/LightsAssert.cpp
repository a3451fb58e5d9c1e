#include "LightsAssert.h"
#include <stdio.h>

namespace LightsAssert {
    std::atomic<uint32_t> failCount(0);

    void onFail(const char* msg, const char* file, int line) {
        failCount++;
        fprintf(stderr, "[ASSERT] %s (%s:%d)\n", msg, file, line);
    }
}
