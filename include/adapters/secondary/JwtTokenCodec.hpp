#pragma once

#include "ports/output/ITokenCodec.hpp"
#include "ports/output/IClock.hpp"
#include "domain/KeyMaterial.hpp"
#include <openssl/evp.h>
#include <memory>
#include <string>

namespace slsession::adapters::secondary {

/**
 * @brief Кодек session token в формате compact JWS
 *
 * Формат: base64url(header) "." base64url(claims) "." base64url(signature)
 *
 *   header: {"alg":"HS256"|"RS256","typ":"JWT"}
 *   claims: {"exp":<unix_sec>,"iat":<unix_sec>,"session-data":{...}}
 *
 * Подпись покрывает header и claims. HS256 — HMAC-SHA256,
 * RS256 — RSASSA-PKCS1-v1_5 + SHA-256 (OpenSSL EVP).
 *
 * Только целостность и подлинность: claims не шифруются и видны клиенту.
 *
 * @note После конструирования объект только читается, его можно
 *       использовать из нескольких потоков без блокировок.
 */
class JwtTokenCodec : public ports::output::ITokenCodec {
public:
    static constexpr const char* SESSION_CLAIM = "session-data";

    /**
     * @param keys Алгоритм и ключи (для RS256 в PEM)
     * @param clock Источник текущего времени для проверки iat/exp
     * @throws domain::ConfigurationException если ключи невалидны
     */
    JwtTokenCodec(domain::KeyMaterial keys, std::shared_ptr<ports::output::IClock> clock);

    std::string createToken(
        const domain::SessionData& session,
        int64_t issuedAt,
        int64_t ttlSeconds
    ) const override;

    ports::output::TokenValidationResult validate(const std::string& token) const override;

    domain::SignatureAlgorithm getAlgorithm() const { return keys_.algorithm; }

private:
    struct PKeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };
    using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

    domain::KeyMaterial keys_;
    std::shared_ptr<ports::output::IClock> clock_;
    PKeyPtr privateKey_;
    PKeyPtr publicKey_;
    std::string headerSegment_;

    std::string sign(const std::string& signingInput) const;
    bool verify(const std::string& signingInput, const std::string& signature) const;

    static PKeyPtr loadPrivateKey(const std::string& pem);
    static PKeyPtr loadPublicKey(const std::string& pem);
};

} // namespace slsession::adapters::secondary
