#pragma once

#include "domain/SessionData.hpp"
#include "domain/SetCookie.hpp"
#include <functional>
#include <optional>
#include <string>

namespace slsession::ports::input {

/**
 * @brief Состояние сессии в рамках одного запроса
 *
 * Живёт на стеке обработчика запроса, в сервисе не хранится.
 */
struct RequestSession {
    domain::SessionData session;    ///< Контейнер, который получит downstream handler
    bool refreshRequired = false;   ///< Токен близок к истечению, перевыпустить даже без изменений
};

/**
 * @brief Downstream обработчик: получает сессию и может её менять
 */
using SessionCallback = std::function<void(domain::SessionData&)>;

/**
 * @brief Сервис stateless-сессий
 *
 * Input Port: по значению входящей cookie строит сессию для запроса
 * и решает, какую cookie (если вообще) вернуть клиенту.
 */
class ISessionService {
public:
    virtual ~ISessionService() = default;

    /**
     * @brief Имя cookie, в которой лежит токен
     */
    virtual const std::string& getCookieName() const = 0;

    /**
     * @brief Извлечь сессию из значения cookie
     *
     * @param cookieValue Значение cookie или nullopt если её нет в запросе
     * @return Сессия из токена, либо пустая сессия если токена нет или он отклонён.
     *         Никогда не бросает исключений из-за содержимого cookie.
     */
    virtual RequestSession openSession(const std::optional<std::string>& cookieValue) const = 0;

    /**
     * @brief Решить, что отправить клиенту
     *
     * @return - cookie с пустым значением и expires в прошлом, если сессию очистили
     *         - nullopt, если сессия не менялась и refresh не нужен (ответ не трогаем)
     *         - cookie с новым токеном в остальных случаях
     */
    virtual std::optional<domain::SetCookie> closeSession(const RequestSession& requestSession) const = 0;

    /**
     * @brief Полный цикл запроса: openSession → next → closeSession
     *
     * @param cookieValue Значение входящей cookie
     * @param next Downstream обработчик (может быть пустым)
     */
    virtual std::optional<domain::SetCookie> handle(
        const std::optional<std::string>& cookieValue,
        const SessionCallback& next
    ) const = 0;
};

} // namespace slsession::ports::input
