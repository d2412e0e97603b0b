#pragma once

#include "domain/SetCookie.hpp"
#include <cstdint>
#include <string>

namespace slsession::application {

/**
 * @brief Политика исходящей session cookie
 *
 * Хранит шаблон cookie (name, domain, path, secure, http-only, max-age).
 * Для каждого запроса шаблон копируется и получает свои value/expires,
 * сам шаблон не меняется.
 */
class CookiePolicy {
public:
    static constexpr int64_t EXPIRATION_COOKIE_AGE_SECONDS = 30 * 24 * 60 * 60;

    explicit CookiePolicy(domain::SetCookie cookieTemplate)
        : template_(std::move(cookieTemplate)) {}

    const std::string& getCookieName() const { return template_.getName(); }

    const domain::SetCookie& getTemplate() const { return template_; }

    /**
     * @brief Cookie с новым токеном
     *
     * @param token Подписанный токен
     * @param expires Unix timestamp истечения (совпадает с exp токена)
     */
    domain::SetCookie issue(const std::string& token, int64_t expires) const {
        return template_
            .withValue(token)
            .withExpires(expires);
    }

    /**
     * @brief Cookie, которая удаляет сессию у клиента
     *
     * Пустое значение, expires на 30 дней в прошлом.
     */
    domain::SetCookie expire(int64_t now) const {
        return template_
            .withValue("")
            .withExpires(now - EXPIRATION_COOKIE_AGE_SECONDS);
    }

private:
    const domain::SetCookie template_;
};

} // namespace slsession::application
