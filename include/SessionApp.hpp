#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <memory>

namespace slsession {

/**
 * @class SessionApp
 * @brief Демо-сервис stateless-сессий
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка окружения
 * 2. configureInjection() - сборка сервиса сессий и регистрация handlers через Boost.DI
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Endpoints:
 * - GET    /health
 * - GET    /api/v1/session   → содержимое сессии
 * - PUT    /api/v1/session   → записать ключи (JSON объект)
 * - DELETE /api/v1/session   → очистить сессию (cookie-удаление)
 */
class SessionApp : public BoostBeastApplication {
public:
    SessionApp();
    ~SessionApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;
    void configureInjection() override;
};

} // namespace slsession
