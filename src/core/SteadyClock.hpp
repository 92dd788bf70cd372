#ifndef STEADYCLOCK_HPP
#define STEADYCLOCK_HPP

#include <chrono>

#include "../interfaces/IClock.hpp"

class SteadyClock : public IClock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

#endif // STEADYCLOCK_HPP
