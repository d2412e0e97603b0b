#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>

namespace slsession::domain {

/**
 * @brief Claims из session token
 *
 * Заполняется только для токена, прошедшего проверку подписи и времени.
 */
struct SessionTokenClaims {
    int64_t issuedAt = 0;       ///< Unix timestamp выпуска (iat claim)
    int64_t expiresAt = 0;      ///< Unix timestamp истечения (exp claim)
    nlohmann::json sessionData = nlohmann::json::object();  ///< Содержимое сессии (session-data claim)

    /**
     * @brief Длина окна жизни токена в секундах
     */
    int64_t lifetimeSeconds() const {
        return expiresAt - issuedAt;
    }
};

} // namespace slsession::domain
