#pragma once
#include <string>
#include <cstdint>
#include <utility>

namespace npcmem {

// Ticks are 100 ns units since the Unix epoch.
constexpr int64_t TICKS_PER_SECOND = 10000000;

// Time source for entry timestamps. Injected so tests get fixed timestamps.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ticks() = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ticks() override;
};

// Returns a fixed value, optionally advancing by `step` after every read.
class FixedClock : public Clock {
public:
    explicit FixedClock(int64_t ticks, int64_t step = 0) : ticks_(ticks), step_(step) {}

    int64_t now_ticks() override {
        int64_t t = ticks_;
        ticks_ += step_;
        return t;
    }

    void set(int64_t ticks) { ticks_ = ticks; }

private:
    int64_t ticks_;
    int64_t step_;
};

// Id source for entries created without an explicit id.
class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual std::string next_id() = 0;
};

class RandomIdGenerator : public IdGenerator {
public:
    std::string next_id() override;
};

// "<prefix>1", "<prefix>2", ... Zero-padded so ordinal order matches numeric order.
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "id_") : prefix_(std::move(prefix)) {}
    std::string next_id() override;

private:
    std::string prefix_;
    uint64_t counter_ = 0;
};

// Process-wide defaults used by MemoryStore's default constructor.
Clock& system_clock();
IdGenerator& random_id_generator();

} // namespace npcmem
