#include "clock.hpp"
#include "util.hpp"
#include <chrono>
#include <cstdio>

namespace npcmem {

int64_t SystemClock::now_ticks() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
    return static_cast<int64_t>(ns / 100);
}

std::string RandomIdGenerator::next_id() {
    // Short ids keep prompts and logs readable
    return generate_id().substr(0, 8);
}

std::string SequentialIdGenerator::next_id() {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%06llu", static_cast<unsigned long long>(++counter_));
    return prefix_ + buf;
}

Clock& system_clock() {
    static SystemClock clock;
    return clock;
}

IdGenerator& random_id_generator() {
    static RandomIdGenerator gen;
    return gen;
}

} // namespace npcmem
