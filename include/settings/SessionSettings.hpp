#pragma once

#include "settings/ISessionSettings.hpp"
#include "domain/exceptions/ConfigurationException.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace slsession::settings {

/**
 * @brief Настройки сессий из ENV
 *
 * Читает:
 * - SESSION_ALGORITHM (default: "HS256")
 * - SESSION_SIGNING_KEY / SESSION_SIGNING_KEY_FILE (обязательно одно из двух)
 * - SESSION_VERIFICATION_KEY / SESSION_VERIFICATION_KEY_FILE
 *   (для HS256 по умолчанию равен signing key, для RS256 обязателен)
 * - SESSION_EXPIRATION_SECONDS (default: 1200)
 * - SESSION_REFRESH_PERCENT (default: 10)
 * - SESSION_COOKIE_NAME (default: "slsession")
 * - SESSION_COOKIE_DOMAIN (default: "")
 * - SESSION_COOKIE_PATH (default: "/")
 * - SESSION_COOKIE_SECURE (default: true)
 * - SESSION_COOKIE_HTTP_ONLY (default: true)
 * - SESSION_COOKIE_MAX_AGE (default: не задан)
 * - SESSION_DEBUG (default: false)
 *
 * @throws domain::ConfigurationException при отсутствии ключей или неверных числах
 */
class SessionSettings : public ISessionSettings {
public:
    static constexpr const char* DEFAULT_COOKIE_NAME = "slsession";

    SessionSettings() {
        auto algorithm = getEnvOrDefault("SESSION_ALGORITHM", "HS256");
        try {
            keys_.algorithm = domain::signatureAlgorithmFromString(algorithm);
        } catch (const std::invalid_argument& e) {
            throw domain::ConfigurationException(e.what());
        }

        keys_.signingKey = readKey("SESSION_SIGNING_KEY", "SESSION_SIGNING_KEY_FILE").value_or("");
        if (keys_.signingKey.empty()) {
            throw domain::ConfigurationException(
                "Required env variable not set: SESSION_SIGNING_KEY or SESSION_SIGNING_KEY_FILE");
        }

        auto verificationKey = readKey("SESSION_VERIFICATION_KEY", "SESSION_VERIFICATION_KEY_FILE");
        if (verificationKey) {
            keys_.verificationKey = *verificationKey;
        } else if (keys_.algorithm == domain::SignatureAlgorithm::HS256) {
            keys_.verificationKey = keys_.signingKey;
        } else {
            throw domain::ConfigurationException(
                "Required env variable not set: SESSION_VERIFICATION_KEY or SESSION_VERIFICATION_KEY_FILE");
        }

        expirationSeconds_ = parseInt("SESSION_EXPIRATION_SECONDS", "1200");
        refreshPercent_ = parseInt("SESSION_REFRESH_PERCENT", "10");

        cookieName_ = getEnvOrDefault("SESSION_COOKIE_NAME", DEFAULT_COOKIE_NAME);
        cookieDomain_ = getEnvOrDefault("SESSION_COOKIE_DOMAIN", "");
        cookiePath_ = getEnvOrDefault("SESSION_COOKIE_PATH", "/");
        cookieSecure_ = parseBool(getEnvOrDefault("SESSION_COOKIE_SECURE", "true"));
        cookieHttpOnly_ = parseBool(getEnvOrDefault("SESSION_COOKIE_HTTP_ONLY", "true"));
        if (std::getenv("SESSION_COOKIE_MAX_AGE")) {
            cookieMaxAge_ = parseInt("SESSION_COOKIE_MAX_AGE", "0");
        }
        debugLogging_ = parseBool(getEnvOrDefault("SESSION_DEBUG", "false"));
    }

    domain::KeyMaterial getKeyMaterial() const override { return keys_; }

    domain::SetCookie getDefaultCookie() const override {
        return domain::SetCookie::create(cookieName_)
            .withDomain(cookieDomain_)
            .withPath(cookiePath_)
            .withSecure(cookieSecure_)
            .withHttpOnly(cookieHttpOnly_)
            .withMaxAge(cookieMaxAge_);
    }

    int getExpirationSeconds() const override { return expirationSeconds_; }
    int getRefreshPercent() const override { return refreshPercent_; }
    bool isDebugLogging() const override { return debugLogging_; }

private:
    domain::KeyMaterial keys_;
    int expirationSeconds_ = 1200;
    int refreshPercent_ = 10;
    std::string cookieName_;
    std::string cookieDomain_;
    std::string cookiePath_;
    bool cookieSecure_ = true;
    bool cookieHttpOnly_ = true;
    std::optional<int64_t> cookieMaxAge_;
    bool debugLogging_ = false;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    // *_FILE имеет приоритет над значением в самой переменной (PEM удобнее держать в файле)
    static std::optional<std::string> readKey(const char* valueName, const char* fileName) {
        if (const char* path = std::getenv(fileName)) {
            std::ifstream file(path);
            if (!file) {
                throw domain::ConfigurationException(std::string("Cannot read key file: ") + path);
            }
            std::ostringstream content;
            content << file.rdbuf();
            return content.str();
        }
        if (const char* value = std::getenv(valueName)) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static int parseInt(const char* name, const std::string& defaultValue) {
        auto value = getEnvOrDefault(name, defaultValue);
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            throw domain::ConfigurationException(
                std::string("Invalid integer in ") + name + ": " + value);
        }
    }

    static bool parseBool(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value == "true" || value == "1" || value == "yes";
    }
};

} // namespace slsession::settings
