#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace slsession::adapters::primary {

/**
 * @brief PUT /api/v1/session — записать ключи в сессию
 *
 * Request body: JSON объект, каждый ключ записывается в сессию,
 * значение null удаляет ключ.
 *
 * Response (200 OK): {"session": {...}}
 * Response (400): {"error": "..."}, сессия не меняется
 */
class SessionWriteHandler : public ISessionHandler {
public:
    void handle(IRequest& req, IResponse& res, domain::SessionData& session) override {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.getBody());
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[SessionWriteHandler] Invalid JSON: " << e.what() << std::endl;
            sendError(res, 400, "Invalid JSON body");
            return;
        }

        if (!body.is_object()) {
            sendError(res, 400, "JSON object expected");
            return;
        }

        for (auto it = body.begin(); it != body.end(); ++it) {
            if (it.value().is_null()) {
                session.remove(it.key());
            } else {
                session.set(it.key(), it.value());
            }
        }

        nlohmann::json response;
        response["session"] = session.toJson();

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

private:
    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setStatus(status);
        res.setHeader("Content-Type", "application/json");
        res.setBody(error.dump());
    }
};

} // namespace slsession::adapters::primary
