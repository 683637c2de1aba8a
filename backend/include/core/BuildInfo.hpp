#pragma once

#include <string>

namespace tickflow::buildinfo {

inline std::string version() {
#ifdef TICKFLOW_VERSION
    return std::string(TICKFLOW_VERSION);
#else
    return "1.0.0";
#endif
}

inline std::string git_commit() {
#ifdef TICKFLOW_GIT_COMMIT
    return std::string(TICKFLOW_GIT_COMMIT);
#else
    return "unknown";
#endif
}

} // namespace tickflow::buildinfo
