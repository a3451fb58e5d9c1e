#include "DebugLog.h"

namespace DebugLog {
    bool verbose = false;
}
