#pragma once

#include <IHttpHandler.hpp>
#include "settings/ISessionSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace slsession::adapters::primary {

/**
 * @brief Health check handler
 *
 * GET /health
 *
 * Кроме статуса отдаёт публичную часть конфигурации сессий (без ключей).
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::ISessionSettings> settings)
        : settings_(std::move(settings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "session-service";
        response["version"] = "1.0.0";

        if (settings_) {
            response["session"] = {
                {"algorithm", domain::toString(settings_->getKeyMaterial().algorithm)},
                {"cookie", settings_->getDefaultCookie().getName()},
                {"expiration_seconds", settings_->getExpirationSeconds()},
                {"refresh_percent", settings_->getRefreshPercent()}
            };
        }

        res.setStatus(200);
        res.setHeader("Content-Type", "application/json");
        res.setBody(response.dump());
    }

private:
    std::shared_ptr<settings::ISessionSettings> settings_;
};

} // namespace slsession::adapters::primary
