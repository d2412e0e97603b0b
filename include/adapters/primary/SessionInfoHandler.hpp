#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include <nlohmann/json.hpp>

namespace slsession::adapters::primary {

/**
 * @brief GET /api/v1/session — текущее содержимое сессии
 *
 * Response (200 OK):
 * {
 *   "session": {"cart": [1, 2]},
 *   "empty": false
 * }
 */
class SessionInfoHandler : public ISessionHandler {
public:
    void handle(IRequest& req, IResponse& res, domain::SessionData& session) override {
        nlohmann::json response;
        response["session"] = session.toJson();
        response["empty"] = session.isEmpty();

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
};

} // namespace slsession::adapters::primary
