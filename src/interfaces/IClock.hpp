#ifndef ICLOCK_HPP
#define ICLOCK_HPP

#include <chrono>

using TimePoint = std::chrono::steady_clock::time_point;

// Monotonic time source. Injected so TTL checks can be driven from tests.
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

#endif // ICLOCK_HPP
