#include "adapters/secondary/JwtTokenCodec.hpp"
#include "domain/exceptions/ConfigurationException.hpp"
#include "utils/Base64Url.hpp"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace slsession::adapters::secondary {

using ports::output::TokenRejection;
using ports::output::TokenValidationResult;
using utils::Base64Url;

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// 9999-12-31T23:59:59Z: с запасом для любых cookie, и (now - iat) * 100 не переполняется
constexpr int64_t MAX_NUMERIC_DATE = 253402300799;

/**
 * @brief NumericDate claim (iat/exp) в секундах
 *
 * Целое или дробное число (дробная часть отбрасывается вниз) в диапазоне
 * [0, MAX_NUMERIC_DATE]. Иначе nullopt.
 */
std::optional<int64_t> numericDateClaim(const nlohmann::json& claims, const char* name) {
    auto it = claims.find(name);
    if (it == claims.end()) {
        return std::nullopt;
    }

    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(MAX_NUMERIC_DATE)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        auto value = it->get<int64_t>();
        if (value < 0 || value > MAX_NUMERIC_DATE) {
            return std::nullopt;
        }
        return value;
    }
    if (it->is_number_float()) {
        double value = std::floor(it->get<double>());
        if (!std::isfinite(value) || value < 0.0 || value > static_cast<double>(MAX_NUMERIC_DATE)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    return std::nullopt;
}

} // namespace

JwtTokenCodec::JwtTokenCodec(domain::KeyMaterial keys, std::shared_ptr<ports::output::IClock> clock)
    : keys_(std::move(keys))
    , clock_(std::move(clock))
{
    if (!clock_) {
        throw domain::ConfigurationException("JwtTokenCodec requires a clock");
    }

    switch (keys_.algorithm) {
        case domain::SignatureAlgorithm::HS256:
            if (keys_.signingKey.empty() || keys_.verificationKey.empty()) {
                throw domain::ConfigurationException("HS256 requires a non-empty symmetric key");
            }
            break;

        case domain::SignatureAlgorithm::RS256:
            privateKey_ = loadPrivateKey(keys_.signingKey);
            publicKey_ = loadPublicKey(keys_.verificationKey);
            break;
    }

    nlohmann::json header;
    header["alg"] = domain::toString(keys_.algorithm);
    header["typ"] = "JWT";
    headerSegment_ = Base64Url::encode(header.dump());

    std::cout << "[JwtTokenCodec] Created (alg=" << domain::toString(keys_.algorithm) << ")" << std::endl;
}

std::string JwtTokenCodec::createToken(
    const domain::SessionData& session,
    int64_t issuedAt,
    int64_t ttlSeconds) const
{
    nlohmann::json claims;
    claims["iat"] = issuedAt;
    claims["exp"] = issuedAt + ttlSeconds;
    claims[SESSION_CLAIM] = session.toJson();

    // Невалидный UTF-8 в значениях сессии заменяется на U+FFFD, а не роняет запрос
    std::string payload = claims.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string signingInput = headerSegment_ + "." + Base64Url::encode(payload);
    return signingInput + "." + Base64Url::encode(sign(signingInput));
}

TokenValidationResult JwtTokenCodec::validate(const std::string& token) const
{
    // Ровно три сегмента
    auto first = token.find('.');
    if (first == std::string::npos) {
        return TokenValidationResult::rejected(TokenRejection::MALFORMED);
    }
    auto second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return TokenValidationResult::rejected(TokenRejection::MALFORMED);
    }

    std::string headerPart = token.substr(0, first);
    std::string claimsPart = token.substr(first + 1, second - first - 1);
    std::string signaturePart = token.substr(second + 1);

    auto headerJson = Base64Url::decode(headerPart);
    auto claimsJson = Base64Url::decode(claimsPart);
    auto signature = Base64Url::decode(signaturePart);
    if (!headerJson || !claimsJson || !signature) {
        return TokenValidationResult::rejected(TokenRejection::MALFORMED);
    }

    // parse без исключений: при ошибке возвращается discarded
    auto header = nlohmann::json::parse(*headerJson, nullptr, false);
    if (header.is_discarded() || !header.is_object()) {
        return TokenValidationResult::rejected(TokenRejection::MALFORMED);
    }

    auto alg = header.find("alg");
    if (alg == header.end() || !alg->is_string()
        || alg->get<std::string>() != domain::toString(keys_.algorithm)) {
        return TokenValidationResult::rejected(TokenRejection::ALGORITHM_MISMATCH);
    }

    if (!verify(headerPart + "." + claimsPart, *signature)) {
        return TokenValidationResult::rejected(TokenRejection::BAD_SIGNATURE);
    }

    auto claims = nlohmann::json::parse(*claimsJson, nullptr, false);
    if (claims.is_discarded() || !claims.is_object()) {
        return TokenValidationResult::rejected(TokenRejection::MALFORMED);
    }

    auto issuedAt = numericDateClaim(claims, "iat");
    auto expiresAt = numericDateClaim(claims, "exp");
    if (!issuedAt || !expiresAt) {
        return TokenValidationResult::rejected(TokenRejection::MISSING_CLAIM);
    }

    domain::SessionTokenClaims result;
    result.issuedAt = *issuedAt;
    result.expiresAt = *expiresAt;

    auto data = claims.find(SESSION_CLAIM);
    if (data != claims.end()) {
        if (!data->is_object()) {
            return TokenValidationResult::rejected(TokenRejection::MISSING_CLAIM);
        }
        result.sessionData = *data;
    }

    int64_t now = clock_->now();
    if (now < result.issuedAt) {
        return TokenValidationResult::rejected(TokenRejection::NOT_YET_VALID);
    }
    if (now > result.expiresAt) {
        return TokenValidationResult::rejected(TokenRejection::EXPIRED);
    }

    return TokenValidationResult::accepted(std::move(result));
}

std::string JwtTokenCodec::sign(const std::string& signingInput) const
{
    const auto* data = reinterpret_cast<const unsigned char*>(signingInput.data());

    if (keys_.algorithm == domain::SignatureAlgorithm::HS256) {
        unsigned char mac[EVP_MAX_MD_SIZE];
        unsigned int macLength = 0;
        if (HMAC(EVP_sha256(),
                 keys_.signingKey.data(), static_cast<int>(keys_.signingKey.size()),
                 data, signingInput.size(),
                 mac, &macLength) == nullptr) {
            ERR_clear_error();
            throw std::runtime_error("HMAC-SHA256 signing failed");
        }
        return std::string(reinterpret_cast<const char*>(mac), macLength);
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    size_t length = 0;
    if (!ctx
        || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, privateKey_.get()) != 1
        || EVP_DigestSign(ctx.get(), nullptr, &length, data, signingInput.size()) != 1) {
        ERR_clear_error();
        throw std::runtime_error("RSA-SHA256 signing failed");
    }

    std::string signature(length, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(&signature[0]), &length,
                       data, signingInput.size()) != 1) {
        ERR_clear_error();
        throw std::runtime_error("RSA-SHA256 signing failed");
    }
    signature.resize(length);
    return signature;
}

bool JwtTokenCodec::verify(const std::string& signingInput, const std::string& signature) const
{
    if (keys_.algorithm == domain::SignatureAlgorithm::HS256) {
        const auto* data = reinterpret_cast<const unsigned char*>(signingInput.data());
        unsigned char expected[EVP_MAX_MD_SIZE];
        unsigned int expectedLength = 0;
        if (HMAC(EVP_sha256(),
                 keys_.verificationKey.data(), static_cast<int>(keys_.verificationKey.size()),
                 data, signingInput.size(),
                 expected, &expectedLength) == nullptr) {
            ERR_clear_error();
            return false;
        }
        return signature.size() == expectedLength
            && CRYPTO_memcmp(expected, signature.data(), expectedLength) == 0;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    bool ok = ctx
        && EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, publicKey_.get()) == 1
        && EVP_DigestVerify(ctx.get(),
                            reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                            reinterpret_cast<const unsigned char*>(signingInput.data()), signingInput.size()) == 1;
    if (!ok) {
        ERR_clear_error();
    }
    return ok;
}

JwtTokenCodec::PKeyPtr JwtTokenCodec::loadPrivateKey(const std::string& pem)
{
    if (pem.empty()) {
        throw domain::ConfigurationException("RS256 requires a private key");
    }

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    PKeyPtr key(bio ? PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        ERR_clear_error();
        throw domain::ConfigurationException("Invalid RSA private key (PEM expected)");
    }
    return key;
}

JwtTokenCodec::PKeyPtr JwtTokenCodec::loadPublicKey(const std::string& pem)
{
    if (pem.empty()) {
        throw domain::ConfigurationException("RS256 requires a public key");
    }

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    PKeyPtr key(bio ? PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        ERR_clear_error();
        throw domain::ConfigurationException("Invalid RSA public key (PEM expected)");
    }
    return key;
}

} // namespace slsession::adapters::secondary
