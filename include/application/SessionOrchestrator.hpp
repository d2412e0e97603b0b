#pragma once

#include "ports/input/ISessionService.hpp"
#include "ports/output/ITokenCodec.hpp"
#include "ports/output/IClock.hpp"
#include "application/CookiePolicy.hpp"
#include "settings/ISessionSettings.hpp"
#include <memory>
#include <optional>
#include <string>

namespace slsession::application {

/**
 * @brief Stateless-сессии поверх подписанного токена в cookie
 *
 * На каждый запрос:
 * 1. Нет cookie → пустая сессия.
 * 2. Токен не прошёл проверку (формат, подпись, iat/exp) → пустая сессия,
 *    клиент неотличим от нового посетителя.
 * 3. Токен валиден → сессия из claim session-data; если прошло не меньше
 *    (100 - refreshPercent)% окна [iat, exp], токен будет перевыпущен
 *    даже без изменений (sliding refresh).
 * 4. Downstream handler работает с сессией.
 * 5. Решение по cookie:
 *    - пустая и изменённая сессия → cookie-удаление (expires на 30 дней назад);
 *    - не менялась и refresh не нужен → ответ не трогаем;
 *    - иначе → новый токен, iat = now, exp = now + ttl.
 *
 * Ошибки конфигурации бросаются только в конструкторе (ConfigurationException).
 * Один экземпляр обслуживает все запросы: после конструирования все поля
 * только читаются, состояние запроса передаётся через RequestSession.
 */
class SessionOrchestrator : public ports::input::ISessionService {
public:
    static constexpr const char* DEFAULT_COOKIE = "slsession";
    static constexpr int DEFAULT_REFRESH_PERCENT = 10;

    /**
     * @param codec Кодек токенов
     * @param clock Источник текущего времени
     * @param defaultCookie Шаблон исходящей cookie (копируется)
     * @param expirationSeconds Время жизни токена, > 0
     * @param refreshPercent Доля окна в процентах для sliding refresh, [0, 100]
     * @param debugLogging Логировать причины отклонения токенов
     * @throws domain::ConfigurationException
     */
    SessionOrchestrator(
        std::shared_ptr<ports::output::ITokenCodec> codec,
        std::shared_ptr<ports::output::IClock> clock,
        const domain::SetCookie& defaultCookie,
        int expirationSeconds,
        int refreshPercent = DEFAULT_REFRESH_PERCENT,
        bool debugLogging = false
    );

    /**
     * @brief HMAC-SHA256, cookie "slsession" с Secure и HttpOnly (нужен HTTPS!)
     */
    static std::shared_ptr<SessionOrchestrator> fromSymmetricKeyDefaults(
        const std::string& symmetricKey,
        int expirationSeconds,
        std::shared_ptr<ports::output::IClock> clock = nullptr
    );

    /**
     * @brief RSA-SHA256, cookie "slsession" с Secure и HttpOnly (нужен HTTPS!)
     *
     * @param privateRsaKey PEM private key (подпись)
     * @param publicRsaKey PEM public key (проверка)
     */
    static std::shared_ptr<SessionOrchestrator> fromAsymmetricKeyDefaults(
        const std::string& privateRsaKey,
        const std::string& publicRsaKey,
        int expirationSeconds,
        std::shared_ptr<ports::output::IClock> clock = nullptr
    );

    static std::shared_ptr<SessionOrchestrator> fromSettings(
        const settings::ISessionSettings& settings,
        std::shared_ptr<ports::output::IClock> clock = nullptr
    );

    const std::string& getCookieName() const override;

    ports::input::RequestSession openSession(const std::optional<std::string>& cookieValue) const override;

    std::optional<domain::SetCookie> closeSession(const ports::input::RequestSession& requestSession) const override;

    std::optional<domain::SetCookie> handle(
        const std::optional<std::string>& cookieValue,
        const ports::input::SessionCallback& next
    ) const override;

    /**
     * @brief Пора ли перевыпустить токен
     *
     * (now - iat) / (exp - iat) >= 1 - refreshPercent / 100,
     * в целых числах, без деления. Окно нулевой длины: пора всегда.
     */
    bool isRefreshDue(const domain::SessionTokenClaims& claims, int64_t now) const;

    int getExpirationSeconds() const { return expirationSeconds_; }
    int getRefreshPercent() const { return refreshPercent_; }

private:
    const std::shared_ptr<ports::output::ITokenCodec> codec_;
    const std::shared_ptr<ports::output::IClock> clock_;
    const CookiePolicy cookiePolicy_;
    const int expirationSeconds_;
    const int refreshPercent_;
    const bool debugLogging_;
};

} // namespace slsession::application
