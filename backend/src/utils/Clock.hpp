#pragma once
#include <ctime>

// Source of wall-clock time for timestamps, lockout expiry and session idle checks.
// All engine times are seconds since epoch, the same representation User uses.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::time_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::time_t now() const override { return std::time(nullptr); }
};
