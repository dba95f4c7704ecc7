#include "BookkeepingApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
BookkeepingApp* g_app = nullptr;

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
        BookkeepingApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Дата запуска: аргумент YYYY-MM-DD или сегодня
        auto today = argc > 1
            ? bookkeeping::domain::Date::fromString(argv[1])
            : bookkeeping::domain::Date::today();

        std::cout << "========================================" << std::endl;
        std::cout << "  Bookkeeping batch for " << today.toString() << std::endl;
        std::cout << "========================================" << std::endl;

        app.configureInjection();
        int failures = app.runBatch(today);
        g_app = nullptr;

        std::cout << "========================================" << std::endl;
        std::cout << "  Bookkeeping batch finished"
                  << (failures ? " with " + std::to_string(failures) + " failed step(s)" : "") << std::endl;
        std::cout << "========================================" << std::endl;

        return failures == 0 ? 0 : 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
