#pragma once

#include <fnmatch.h>

#include <algorithm>
#include <string>
#include <vector>

namespace ts::util {

inline bool matchesAny(const std::string& baseName, const std::vector<std::string>& patterns) {
    return std::ranges::any_of(patterns, [&](const std::string& p) {
        return fnmatch(p.c_str(), baseName.c_str(), 0) == 0;
    });
}

}
