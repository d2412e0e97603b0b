#pragma once

#include "domain/enums/SignatureAlgorithm.hpp"
#include <string>

namespace slsession::domain {

/**
 * @brief Ключи для подписи и проверки токенов
 *
 * Для HS256 signingKey == verificationKey (общий секрет).
 * Для RS256 signingKey — PEM private key, verificationKey — PEM public key.
 */
struct KeyMaterial {
    SignatureAlgorithm algorithm = SignatureAlgorithm::HS256;
    std::string signingKey;
    std::string verificationKey;

    KeyMaterial() = default;

    KeyMaterial(SignatureAlgorithm algorithm,
                std::string signingKey,
                std::string verificationKey)
        : algorithm(algorithm)
        , signingKey(std::move(signingKey))
        , verificationKey(std::move(verificationKey))
    {}

    static KeyMaterial symmetric(const std::string& key) {
        return KeyMaterial(SignatureAlgorithm::HS256, key, key);
    }

    static KeyMaterial asymmetric(const std::string& privateKeyPem, const std::string& publicKeyPem) {
        return KeyMaterial(SignatureAlgorithm::RS256, privateKeyPem, publicKeyPem);
    }
};

} // namespace slsession::domain
