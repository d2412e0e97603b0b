#pragma once

#include "adapters/primary/ISessionHandler.hpp"

namespace slsession::adapters::primary {

/**
 * @brief DELETE /api/v1/session — выход: очистить сессию
 *
 * Очистка пустой изменённой сессии приводит к cookie-удалению.
 */
class SessionClearHandler : public ISessionHandler {
public:
    void handle(IRequest& req, IResponse& res, domain::SessionData& session) override {
        session.clear();

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(R"({"cleared": true})");
    }
};

} // namespace slsession::adapters::primary
