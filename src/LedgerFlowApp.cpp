#include "LedgerFlowApp.hpp"

// Command Handlers (Primary Adapters)
#include "adapters/primary/CommandRouter.hpp"
#include "adapters/primary/LogHoursHandler.hpp"
#include "adapters/primary/StartPeriodHandler.hpp"
#include "adapters/primary/StatusHandler.hpp"
#include "adapters/primary/EntriesHandler.hpp"
#include "adapters/primary/RateConfigHandler.hpp"
#include "adapters/primary/ExportHandler.hpp"
#include "adapters/primary/ClearDataHandler.hpp"

// Application Services
#include "application/LedgerService.hpp"

// Secondary Adapters
#include "adapters/secondary/clock/SystemClock.hpp"
#include "adapters/secondary/persistence/InMemoryPersistenceGateway.hpp"
#include "adapters/secondary/persistence/JsonFilePersistenceGateway.hpp"
#include "adapters/secondary/persistence/PostgresPersistenceGateway.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/StorageSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

using namespace ledgerflow;

// ============================================================================
// LedgerFlowApp Implementation
// ============================================================================

LedgerFlowApp::LedgerFlowApp()
    : stdoutBuffer_(std::cout.rdbuf())
    , out_(stdoutBuffer_)
{
}

LedgerFlowApp::~LedgerFlowApp()
{
    std::cout.rdbuf(stdoutBuffer_);
}

int LedgerFlowApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return execute();
}

void LedgerFlowApp::loadEnvironment(int argc, char* argv[])
{
    ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
    storageSettings_ = std::make_shared<settings::StorageSettings>();

    // stdout остаётся за выводом команд
    if (ledgerSettings_->isQuiet()) {
        std::cout.rdbuf(nullptr);
    } else {
        std::cout.rdbuf(std::cerr.rdbuf());
    }

    std::cout << "[LedgerFlowApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }

    std::cout << "[LedgerFlowApp] Target hours: " << ledgerSettings_->getTargetHours()
              << ", recent limit: " << ledgerSettings_->getRecentLimit() << std::endl;
}

std::shared_ptr<ports::output::IPersistenceGateway> LedgerFlowApp::createGateway() const
{
    switch (storageSettings_->getKind()) {
        case settings::StorageKind::MEMORY:
            std::cout << "[LedgerFlowApp] Storage: in-memory" << std::endl;
            return std::make_shared<adapters::secondary::InMemoryPersistenceGateway>();

        case settings::StorageKind::POSTGRES:
            std::cout << "[LedgerFlowApp] Storage: PostgreSQL" << std::endl;
            return std::make_shared<adapters::secondary::PostgresPersistenceGateway>(
                std::make_shared<settings::DbSettings>());

        case settings::StorageKind::JSON:
        default:
            std::cout << "[LedgerFlowApp] Storage: JSON files" << std::endl;
            return std::make_shared<adapters::secondary::JsonFilePersistenceGateway>(
                storageSettings_->getDataDir());
    }
}

void LedgerFlowApp::configureInjection()
{
    std::cout << "[LedgerFlowApp] Configuring Boost.DI injection..." << std::endl;

    auto gateway = createGateway();

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<ports::output::IPersistenceGateway>().to(gateway),

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<settings::LedgerSettings>().to(ledgerSettings_),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::ILedgerService>()
            .to<application::LedgerService>()
            .in(di::singleton));

    // ========================================================================
    // Layer 3: Primary Adapters (Command Handlers)
    // ========================================================================

    router_ = std::make_unique<adapters::primary::CommandRouter>();

    router_->registerHandler("log",
        injector.create<std::shared_ptr<adapters::primary::LogHoursHandler>>());
    router_->registerHandler("new-period",
        injector.create<std::shared_ptr<adapters::primary::StartPeriodHandler>>());
    router_->registerHandler("status",
        injector.create<std::shared_ptr<adapters::primary::StatusHandler>>());
    router_->registerHandler("entries",
        injector.create<std::shared_ptr<adapters::primary::EntriesHandler>>());
    router_->registerHandler("rate",
        injector.create<std::shared_ptr<adapters::primary::RateConfigHandler>>());
    router_->registerHandler("export",
        injector.create<std::shared_ptr<adapters::primary::ExportHandler>>());
    router_->registerHandler("clear",
        injector.create<std::shared_ptr<adapters::primary::ClearDataHandler>>());

    std::cout << "[LedgerFlowApp] DI configuration completed - "
              << router_->size() << " commands registered" << std::endl;
}

int LedgerFlowApp::execute()
{
    return router_->run(args_, out_, std::cerr);
}
