#include "LedgerFlowApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        LedgerFlowApp app;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. execute()
        return app.run(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
