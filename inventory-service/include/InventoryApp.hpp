#pragma once

#include <memory>
#include <string>

// Forward declarations - Ports
namespace omnitrack::ports::input {
    class IOrderService;
    class IInventoryService;
    class ICartService;
    class IReportingService;
}

namespace omnitrack::ports::output {
    class IEventBus;
}

namespace omnitrack::settings {
    class InventorySettings;
}

/**
 * @class InventoryApp
 * @brief Композиционный корень складского ядра
 *
 * Template Method:
 * 1. loadEnvironment() - чтение настроек из ENV и аргументов
 * 2. configureInjection() - настройка Boost.DI и сборка сервисов
 * 3. start() - загрузка каталога и вывод сводки
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Input Ports: IOrderService, IInventoryService, ICartService, IReportingService
 * - Secondary Adapters: InMemory* или Postgres* (INVENTORY_STORAGE)
 *
 * Сетевого интерфейса нет: встраивающий код получает сервисы через аксессоры.
 */
class InventoryApp
{
public:
    InventoryApp();
    virtual ~InventoryApp();

    /**
     * @brief Запустить приложение
     *
     * @param argc, argv Первый аргумент (если есть) - путь к JSON каталогу,
     *        перекрывает INVENTORY_SEED_FILE
     */
    void run(int argc, char* argv[]);

    std::shared_ptr<omnitrack::ports::input::IOrderService> orderService() const { return orderService_; }
    std::shared_ptr<omnitrack::ports::input::IInventoryService> inventoryService() const { return inventoryService_; }
    std::shared_ptr<omnitrack::ports::input::ICartService> cartService() const { return cartService_; }
    std::shared_ptr<omnitrack::ports::input::IReportingService> reportingService() const { return reportingService_; }
    std::shared_ptr<omnitrack::ports::output::IEventBus> eventBus() const { return eventBus_; }

protected:
    virtual void loadEnvironment(int argc, char* argv[]);
    virtual void configureInjection();
    virtual void start();

private:
    std::shared_ptr<omnitrack::settings::InventorySettings> settings_;
    std::string seedFile_;

    std::shared_ptr<omnitrack::ports::input::IOrderService> orderService_;
    std::shared_ptr<omnitrack::ports::input::IInventoryService> inventoryService_;
    std::shared_ptr<omnitrack::ports::input::ICartService> cartService_;
    std::shared_ptr<omnitrack::ports::input::IReportingService> reportingService_;
    std::shared_ptr<omnitrack::ports::output::IEventBus> eventBus_;

    template <typename Injector>
    void resolveServices(Injector& injector);

    void seedCatalog();
    void printStartupBanner();
};
