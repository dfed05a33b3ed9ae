#include "../../include/random_utils.hpp"
#include <cstdio>

namespace RandomUtils {

    unsigned long long next_u64() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        return rng();
    }

    std::string random_suffix() {
        char buf[9];
        std::snprintf(buf, sizeof(buf), "%08llx", next_u64() & 0xffffffffULL);
        return buf;
    }

} // namespace RandomUtils
