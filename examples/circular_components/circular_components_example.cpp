/**
 * @file circular_components_example.cpp
 * @brief 组件容器使用示例
 *
 * 这个示例演示了：
 * - 两个单例组件相互引用时的解析
 * - 按依赖关系逆序销毁组件
 * - 从JSON配置初始化容器和日志
 */

#include "atlas/core/lifecycle/component_container.h"
#include "atlas/common/spdlog/atlas_log_manager.h"
#include <iostream>

using namespace atlas::core::lifecycle;

namespace {

struct OrderService;

struct PaymentService {
    std::shared_ptr<OrderService> orders;

    void Close() {
        std::cout << "PaymentService closed" << std::endl;
        orders.reset();
    }
};

struct OrderService {
    std::shared_ptr<PaymentService> payments;

    void Close() {
        std::cout << "OrderService closed" << std::endl;
        payments.reset();
    }
};

bool RegisterServices(ComponentContainer& container) {
    ComponentDescriptor orders = MakeDescriptor<OrderService>("orders");
    orders.dependencies.push_back(MakeDependency<OrderService, PaymentService>("payments", "payments",
        [](OrderService& service, std::shared_ptr<PaymentService> payments) { service.payments = payments; }));
    orders.destroy_method = MakeCallback<OrderService>("Close", [](OrderService& service) { service.Close(); });

    ComponentDescriptor payments = MakeDescriptor<PaymentService>("payments");
    payments.dependencies.push_back(MakeDependency<PaymentService, OrderService>("orders", "orders",
        [](PaymentService& service, std::shared_ptr<OrderService> orders) { service.orders = orders; }));
    payments.destroy_method = MakeCallback<PaymentService>("Close", [](PaymentService& service) { service.Close(); });

    return container.RegisterDescriptor(orders) && container.RegisterDescriptor(payments);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    RegistryConfigLoader loader;
    bool loaded = argc > 1 ? loader.LoadFromFile(argv[1])
                           : loader.LoadFromString(RegistryConfigLoader::GenerateDefaultConfig().dump());
    if (!loaded) {
        std::cerr << "Failed to load registry configuration" << std::endl;
        return 1;
    }

    ComponentContainer container;
    if (!container.ApplyConfig(loader)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    if (!RegisterServices(container)) {
        std::cerr << "Failed to register services" << std::endl;
        return 1;
    }

    try {
        auto orders = container.GetComponent<OrderService>("orders");
        auto payments = container.GetComponent<PaymentService>("payments");

        std::cout << "orders -> payments resolved: " << (orders->payments == payments ? "yes" : "no") << std::endl;
        std::cout << "payments -> orders resolved: " << (payments->orders == orders ? "yes" : "no") << std::endl;
    } catch (const LifecycleException& e) {
        std::cerr << "Component creation failed: " << e.what() << std::endl;
        return 1;
    }

    container.Shutdown();
    ATLAS_LOG_MANAGER().Shutdown();
    return 0;
}
