#include "SessionApp.hpp"

#include "settings/SessionSettings.hpp"
#include "ports/input/ISessionService.hpp"
#include "ports/output/IClock.hpp"
#include "application/SessionOrchestrator.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SessionMiddleware.hpp"
#include "adapters/primary/SessionInfoHandler.hpp"
#include "adapters/primary/SessionWriteHandler.hpp"
#include "adapters/primary/SessionClearHandler.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

namespace slsession {

SessionApp::SessionApp()
{
    std::cout << "[SessionApp] Application created" << std::endl;
}

SessionApp::~SessionApp()
{
    std::cout << "[SessionApp] Application destroyed" << std::endl;
}

void SessionApp::loadEnvironment(int argc, char* argv[])
{
    BoostBeastApplication::loadEnvironment(argc, argv);
    std::cout << "[SessionApp] Environment loaded" << std::endl;
}

void SessionApp::configureInjection()
{
    std::cout << "[SessionApp] Configuring Boost.DI injection..." << std::endl;

    // Ключи и ttl проверяются здесь: ошибка конфигурации роняет старт, а не запросы
    auto settings = std::make_shared<settings::SessionSettings>();
    auto clock = std::make_shared<adapters::secondary::SystemClock>();
    auto sessionService = application::SessionOrchestrator::fromSettings(*settings, clock);

    auto injector = di::make_injector(
        di::bind<settings::ISessionSettings>().to(settings),
        di::bind<ports::output::IClock>().to(clock),
        di::bind<ports::input::ISessionService>().to(sessionService)
    );

    {
        auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
        registerEndpoint("GET", "/health", handler);
        std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
    }

    {
        auto handler = std::make_shared<adapters::primary::SessionMiddleware>(
            injector.create<std::shared_ptr<ports::input::ISessionService>>(),
            injector.create<std::shared_ptr<adapters::primary::SessionInfoHandler>>());
        registerEndpoint("GET", "/api/v1/session", handler);
        std::cout << "  ✓ SessionInfoHandler: GET /api/v1/session" << std::endl;
    }

    {
        auto handler = std::make_shared<adapters::primary::SessionMiddleware>(
            injector.create<std::shared_ptr<ports::input::ISessionService>>(),
            injector.create<std::shared_ptr<adapters::primary::SessionWriteHandler>>());
        registerEndpoint("PUT", "/api/v1/session", handler);
        std::cout << "  ✓ SessionWriteHandler: PUT /api/v1/session" << std::endl;
    }

    {
        auto handler = std::make_shared<adapters::primary::SessionMiddleware>(
            injector.create<std::shared_ptr<ports::input::ISessionService>>(),
            injector.create<std::shared_ptr<adapters::primary::SessionClearHandler>>());
        registerEndpoint("DELETE", "/api/v1/session", handler);
        std::cout << "  ✓ SessionClearHandler: DELETE /api/v1/session" << std::endl;
    }

    std::cout << "[SessionApp] Configuration complete! 4 handlers registered." << std::endl;
}

} // namespace slsession
