#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace slsession::adapters::secondary {

/**
 * @brief Системные часы (std::chrono::system_clock)
 */
class SystemClock : public ports::output::IClock {
public:
    int64_t now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

} // namespace slsession::adapters::secondary
