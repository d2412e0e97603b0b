#pragma once

#include <string>
#include <stdexcept>

namespace slsession::domain {

/**
 * @brief Алгоритм подписи session token
 *
 * - HS256 — симметричный HMAC-SHA256 (один ключ для подписи и проверки)
 * - RS256 — асимметричный RSA-SHA256 (private key подписывает, public key проверяет)
 */
enum class SignatureAlgorithm {
    HS256,
    RS256
};

/**
 * @brief Значение для поля "alg" в заголовке JWT
 */
inline std::string toString(SignatureAlgorithm algorithm) {
    switch (algorithm) {
        case SignatureAlgorithm::HS256: return "HS256";
        case SignatureAlgorithm::RS256: return "RS256";
    }
    return "unknown";
}

/**
 * @brief Создать SignatureAlgorithm из строки
 *
 * @param str "HS256" или "RS256"
 * @throws std::invalid_argument если строка не распознана
 */
inline SignatureAlgorithm signatureAlgorithmFromString(const std::string& str) {
    if (str == "HS256") return SignatureAlgorithm::HS256;
    if (str == "RS256") return SignatureAlgorithm::RS256;
    throw std::invalid_argument("Unknown SignatureAlgorithm: " + str);
}

} // namespace slsession::domain
