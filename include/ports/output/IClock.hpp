#pragma once

#include <cstdint>

namespace slsession::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Output Port, чтобы окна iat/exp и sliding refresh можно было тестировать
 * на фиксированном времени.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Текущее время, Unix timestamp в секундах
     */
    virtual int64_t now() const = 0;
};

} // namespace slsession::ports::output
