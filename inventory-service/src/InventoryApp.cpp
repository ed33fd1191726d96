#include "InventoryApp.hpp"

// Application Services
#include "application/OrderService.hpp"
#include "application/InventoryService.hpp"
#include "application/CartService.hpp"
#include "application/ReportingService.hpp"

// Secondary Adapters
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/catalog/JsonCatalogLoader.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/InMemoryCartRepository.hpp"
#include "adapters/secondary/persistence/InMemoryStockMovementRepository.hpp"
#include "adapters/secondary/persistence/PostgresInventoryRepository.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresCartRepository.hpp"
#include "adapters/secondary/persistence/PostgresStockMovementRepository.hpp"

#include "settings/InventorySettings.hpp"
#include "settings/DbSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

using namespace omnitrack;

namespace
{

/**
 * @brief Сервисы и политика, общие для всех хранилищ
 */
auto coreModule(const std::shared_ptr<settings::InventorySettings>& inventorySettings)
{
    return di::make_injector(
        di::bind<settings::InventorySettings>().to(inventorySettings),

        // IEventBus ← InMemoryEventBus (синхронная доставка)
        di::bind<ports::output::IEventBus>()
            .to<adapters::secondary::InMemoryEventBus>()
            .in(di::singleton),

        // Граница согласованности: один экземпляр на всё ядро
        di::bind<application::ConsistencyLock>().in(di::singleton),

        di::bind<application::CancellationCoordinator>().in(di::singleton),
        di::bind<application::OrderLifecycle>().in(di::singleton),
        di::bind<application::CheckoutCoordinator>().in(di::singleton),
        di::bind<application::StockMovementJournal>().in(di::singleton),

        di::bind<ports::input::IOrderService>()
            .to<application::OrderService>()
            .in(di::singleton),

        di::bind<ports::input::IInventoryService>()
            .to<application::InventoryService>()
            .in(di::singleton),

        di::bind<ports::input::ICartService>()
            .to<application::CartService>()
            .in(di::singleton),

        di::bind<ports::input::IReportingService>()
            .to<application::ReportingService>()
            .in(di::singleton));
}

/**
 * @brief In-memory хранилища
 *
 * Один экземпляр InMemoryInventoryRepository обслуживает и каталог,
 * и складской учёт.
 */
auto memoryStorageModule()
{
    auto inventory = std::make_shared<adapters::secondary::InMemoryInventoryRepository>();

    return di::make_injector(
        di::bind<ports::output::IProductRepository>().to(inventory),
        di::bind<ports::output::IStockLedger>().to(inventory),

        di::bind<ports::output::IOrderRepository>()
            .to(std::make_shared<adapters::secondary::InMemoryOrderRepository>()),

        di::bind<ports::output::ICartRepository>()
            .to(std::make_shared<adapters::secondary::InMemoryCartRepository>()),

        di::bind<ports::output::IStockMovementRepository>()
            .to(std::make_shared<adapters::secondary::InMemoryStockMovementRepository>()));
}

auto postgresStorageModule(const settings::DbSettings& db)
{
    auto inventory = std::make_shared<adapters::secondary::PostgresInventoryRepository>(
        db.getConnectionString());

    return di::make_injector(
        di::bind<ports::output::IProductRepository>().to(inventory),
        di::bind<ports::output::IStockLedger>().to(inventory),

        di::bind<ports::output::IOrderRepository>()
            .to(std::make_shared<adapters::secondary::PostgresOrderRepository>(
                db.getConnectionString())),

        di::bind<ports::output::ICartRepository>()
            .to(std::make_shared<adapters::secondary::PostgresCartRepository>(
                db.getConnectionString())),

        di::bind<ports::output::IStockMovementRepository>()
            .to(std::make_shared<adapters::secondary::PostgresStockMovementRepository>(
                db.getConnectionString())));
}

} // namespace

// ============================================================================
// InventoryApp Implementation
// ============================================================================

InventoryApp::InventoryApp()
{
    std::cout << "[InventoryApp] Application created" << std::endl;
}

InventoryApp::~InventoryApp()
{
    std::cout << "[InventoryApp] Application destroyed" << std::endl;
}

void InventoryApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void InventoryApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[InventoryApp] Loading environment..." << std::endl;

    settings_ = std::make_shared<settings::InventorySettings>();
    seedFile_ = settings_->getSeedFile();
    if (argc > 1 && argv[1] != nullptr)
    {
        seedFile_ = argv[1];
    }

    std::cout << "[InventoryApp] Storage: " << settings_->getStorage()
              << ", currency: " << settings_->getCurrency()
              << ", default low stock threshold: " << settings_->getDefaultLowStockThreshold()
              << std::endl;
}

template <typename Injector>
void InventoryApp::resolveServices(Injector& injector)
{
    orderService_ = injector.template create<std::shared_ptr<ports::input::IOrderService>>();
    inventoryService_ = injector.template create<std::shared_ptr<ports::input::IInventoryService>>();
    cartService_ = injector.template create<std::shared_ptr<ports::input::ICartService>>();
    reportingService_ = injector.template create<std::shared_ptr<ports::input::IReportingService>>();
    eventBus_ = injector.template create<std::shared_ptr<ports::output::IEventBus>>();
}

void InventoryApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[InventoryApp] Configuring Boost.DI injection..." << std::endl;

    if (settings_->usePostgres())
    {
        settings::DbSettings db;
        std::cout << "[InventoryApp] PostgreSQL: " << db.getHost() << ":" << db.getPort()
                  << "/" << db.getName() << std::endl;

        auto injector = di::make_injector(coreModule(settings_), postgresStorageModule(db));
        resolveServices(injector);
    }
    else
    {
        auto injector = di::make_injector(coreModule(settings_), memoryStorageModule());
        resolveServices(injector);
    }

    // Журнал событий склада
    eventBus_->subscribe("stock.low", [](const domain::DomainEvent& event) {
        std::cout << "[InventoryApp] " << event.toJson() << std::endl;
    });
    eventBus_->subscribe("stock.restocked", [](const domain::DomainEvent& event) {
        std::cout << "[InventoryApp] " << event.toJson() << std::endl;
    });

    std::cout << "[InventoryApp] DI configuration completed" << std::endl;
}

void InventoryApp::start()
{
    seedCatalog();

    auto snapshot = reportingService_->dashboard();
    std::cout << "[InventoryApp] Products: " << snapshot.productCount
              << ", low stock: " << snapshot.lowStockProducts.size()
              << ", pending orders: " << snapshot.metrics.pendingCount() << std::endl;
    std::cout << "[InventoryApp] Dashboard: " << snapshot.toJson() << std::endl;
}

void InventoryApp::seedCatalog()
{
    if (seedFile_.empty())
    {
        return;
    }

    std::cout << "[InventoryApp] Seeding catalog from " << seedFile_ << std::endl;

    adapters::secondary::JsonCatalogLoader loader(
        settings_->getDefaultLowStockThreshold(),
        settings_->getCurrency());
    auto products = loader.loadFromFile(seedFile_);

    domain::RequestContext system("system", domain::UserRole::ADMIN);
    size_t added = 0;
    for (const auto& product : products)
    {
        auto result = inventoryService_->addProduct(system, product);
        if (result.success)
        {
            ++added;
        }
        else
        {
            std::cerr << "[InventoryApp] Skipped catalog entry '" << product.name
                      << "': " << result.message << std::endl;
        }
    }

    std::cout << "[InventoryApp] Catalog seeded: " << added << "/" << products.size()
              << " products" << std::endl;
}

void InventoryApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║        OmniTrack - Inventory Consistency Core        ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Storage:      in-memory / PostgreSQL (libpqxx)      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
