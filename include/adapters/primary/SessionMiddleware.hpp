#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/ISessionHandler.hpp"
#include "ports/input/ISessionService.hpp"
#include "utils/CookieHeader.hpp"
#include <memory>
#include <optional>
#include <string>

namespace slsession::adapters::primary {

/**
 * @brief Middleware stateless-сессий
 *
 * Берёт session cookie из заголовка Cookie, отдаёт сессию inner handler'у
 * и выставляет Set-Cookie по решению ISessionService.
 *
 * Если сессия не менялась и refresh не нужен, ответ не трогается вообще:
 * ни одного вызова setHeader. Клиент с битым или чужим токеном
 * получает ровно то же, что и новый посетитель.
 */
class SessionMiddleware : public IHttpHandler {
public:
    /**
     * @param sessionService Общий на все запросы сервис сессий
     * @param inner Downstream handler (может быть nullptr)
     */
    SessionMiddleware(
        std::shared_ptr<ports::input::ISessionService> sessionService,
        std::shared_ptr<ISessionHandler> inner = nullptr
    ) : sessionService_(std::move(sessionService))
      , inner_(std::move(inner))
    {}

    void handle(IRequest& req, IResponse& res) override {
        std::optional<std::string> cookieValue;
        auto cookieHeader = req.getHeader("Cookie");
        if (cookieHeader) {
            cookieValue = utils::CookieHeader::find(*cookieHeader, sessionService_->getCookieName());
        }

        ports::input::SessionCallback next;
        if (inner_) {
            next = [this, &req, &res](domain::SessionData& session) {
                inner_->handle(req, res, session);
            };
        }

        auto cookie = sessionService_->handle(cookieValue, next);
        if (cookie) {
            res.setHeader("Set-Cookie", cookie->toHeaderValue());
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
    std::shared_ptr<ISessionHandler> inner_;
};

} // namespace slsession::adapters::primary
