#pragma once

#include "domain/SessionData.hpp"
#include "domain/SessionTokenClaims.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace slsession::ports::output {

/**
 * @brief Причина отклонения токена
 *
 * Только для диагностики (логи, тесты). Логика обработки запроса
 * все причины обрабатывает одинаково.
 */
enum class TokenRejection {
    NONE,
    MALFORMED,           ///< Не три сегмента, невалидный base64url или JSON
    ALGORITHM_MISMATCH,  ///< alg в заголовке не совпадает с настроенным (в т.ч. "none")
    BAD_SIGNATURE,       ///< Подпись не сходится с verification key
    MISSING_CLAIM,       ///< Нет iat/exp или claim неверного типа
    EXPIRED,             ///< now > exp
    NOT_YET_VALID        ///< now < iat
};

inline std::string toString(TokenRejection reason) {
    switch (reason) {
        case TokenRejection::NONE:               return "none";
        case TokenRejection::MALFORMED:          return "malformed";
        case TokenRejection::ALGORITHM_MISMATCH: return "algorithm mismatch";
        case TokenRejection::BAD_SIGNATURE:      return "bad signature";
        case TokenRejection::MISSING_CLAIM:      return "missing claim";
        case TokenRejection::EXPIRED:            return "expired";
        case TokenRejection::NOT_YET_VALID:      return "not yet valid";
    }
    return "unknown";
}

/**
 * @brief Результат проверки токена
 */
struct TokenValidationResult {
    std::optional<domain::SessionTokenClaims> claims;
    TokenRejection rejection = TokenRejection::NONE;

    bool valid() const { return claims.has_value(); }

    static TokenValidationResult accepted(domain::SessionTokenClaims claims) {
        return {std::move(claims), TokenRejection::NONE};
    }

    static TokenValidationResult rejected(TokenRejection reason) {
        return {std::nullopt, reason};
    }
};

/**
 * @brief Интерфейс кодека session token
 *
 * Output Port для выпуска и проверки подписанных токенов.
 *
 * Реализации:
 * - JwtTokenCodec — compact JWS (HS256 / RS256) на OpenSSL
 */
class ITokenCodec {
public:
    virtual ~ITokenCodec() = default;

    /**
     * @brief Выпустить подписанный токен
     *
     * @param session Данные сессии (попадут в claim session-data)
     * @param issuedAt Время выпуска (iat)
     * @param ttlSeconds Время жизни, exp = issuedAt + ttlSeconds
     * @return Строка токена
     */
    virtual std::string createToken(
        const domain::SessionData& session,
        int64_t issuedAt,
        int64_t ttlSeconds
    ) const = 0;

    /**
     * @brief Разобрать и проверить токен с указанием причины отказа
     */
    virtual TokenValidationResult validate(const std::string& token) const = 0;

    /**
     * @brief Разобрать и проверить токен
     *
     * @return Claims или nullopt если токен:
     *   - синтаксически невалиден
     *   - подписан другим ключом или не подписан
     *   - истёк или выпущен в будущем
     *   - не содержит обязательных claims
     */
    std::optional<domain::SessionTokenClaims> parseAndValidate(const std::string& token) const {
        return validate(token).claims;
    }
};

} // namespace slsession::ports::output
