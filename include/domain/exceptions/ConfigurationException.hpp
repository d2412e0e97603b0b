#pragma once

#include <stdexcept>
#include <string>

namespace slsession::domain {

/**
 * @brief Ошибка конфигурации сессий
 *
 * Выбрасывается только при конструировании (ключи, настройки cookie, ttl).
 * Во время обработки запросов не используется.
 */
class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace slsession::domain
