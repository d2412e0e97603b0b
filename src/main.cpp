#include "SessionApp.hpp"
#include "domain/exceptions/ConfigurationException.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
slsession::SessionApp* g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        slsession::SessionApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Session Service Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Session Service Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const slsession::domain::ConfigurationException& e)
    {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        std::cerr << "[main] Check SESSION_* environment variables" << std::endl;
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
