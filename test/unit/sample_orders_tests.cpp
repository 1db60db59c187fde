// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the sample order module running through the mediator

#include <catch2/catch_test_macros.hpp>
#include "dispatch_test_support.hpp"
#include "dispatch/errors.hpp"
#include "sample/orders.hpp"

using namespace courier::dispatch;
using namespace courier::sample;
using courier::test::TestConfig;

namespace {

struct OrderFixture {
    explicit OrderFixture(int inventory_failures = 0,
                          PublishStrategy strategy = PublishStrategy::Parallel) {
        AddOrderServices(services, inventory_failures);
        HandlerRegistry::Builder builder;
        AddOrderHandlers(builder);
        mediator = std::make_unique<Mediator>(builder.Build(), services, TestConfig(strategy));
    }

    std::shared_ptr<AuditLog> audit() { return RequireService<AuditLog>(services); }
    std::shared_ptr<OrderRepository> orders() { return RequireService<OrderRepository>(services); }
    std::shared_ptr<InventoryService> inventory() {
        return RequireService<InventoryService>(services);
    }

    ServiceProvider services;
    std::unique_ptr<Mediator> mediator;
};

} // namespace

TEST_CASE("Sample - ping", "[sample]") {
    OrderFixture f;
    REQUIRE(f.mediator->Invoke<std::string>(Ping{"x"}) == "Pong: x");
    REQUIRE(f.mediator->InvokeAsync<std::string>(Ping{"y"}).get() == "Pong: y");
}

TEST_CASE("Sample - creating an order", "[sample]") {
    OrderFixture f;

    SECTION("Created result with cascaded notifications") {
        auto result = f.mediator->Invoke<Result<Order>>(CreateOrder{"alice", "widget", 2});
        REQUIRE(result.status() == ResultStatus::Created);
        REQUIRE(result.value().customer == "alice");
        REQUIRE(result.location() == "/orders/" + std::to_string(result.value().id));

        std::string id = std::to_string(result.value().id);
        // Email first (order 1), audit through the OrderEvent ancestor (order 2)
        REQUIRE(f.audit()->Entries() == std::vector<std::string>{"email:" + id, "audit:" + id});
        REQUIRE(f.orders()->size() == 1);
    }

    SECTION("Asynchronous invocation completes the cascade first") {
        Order order = f.mediator->InvokeAsync<Order>(CreateOrder{"carol", "gadget", 1}).get();
        std::string id = std::to_string(order.id);
        REQUIRE(f.audit()->Count("email:" + id) == 1);
        REQUIRE(f.audit()->Count("audit:" + id) == 1);
    }

    SECTION("Payload requested directly") {
        Order order = f.mediator->Invoke<Order>(CreateOrder{"dave", "bolt", 5});
        REQUIRE(order.sku == "bolt");
        REQUIRE(order.quantity == 5);
    }
}

TEST_CASE("Sample - validation short-circuits", "[sample]") {
    OrderFixture f;

    auto result = f.mediator->Invoke<Result<Order>>(CreateOrder{"bob", "", 0});
    REQUIRE(result.status() == ResultStatus::Invalid);
    REQUIRE_FALSE(result.HasValue());
    REQUIRE(result.validation_errors().size() == 2);
    REQUIRE(result.validation_errors()[0].identifier == "sku");
    REQUIRE(result.validation_errors()[1].identifier == "quantity");

    // Handler never ran, nothing cascaded
    REQUIRE(f.orders()->size() == 0);
    REQUIRE(f.audit()->Entries().empty());
    REQUIRE(f.inventory()->attempts() == 0);

    REQUIRE_THROWS_AS(f.mediator->Invoke<Order>(CreateOrder{"", "", 0}), ResponseTypeMismatchError);
}

TEST_CASE("Sample - transient inventory failures are retried", "[sample]") {
    SECTION("Recovered within the attempt limit") {
        OrderFixture f(2);
        auto result = f.mediator->Invoke<Result<Order>>(CreateOrder{"erin", "widget", 1});
        REQUIRE(result.IsSuccess());
        REQUIRE(f.inventory()->attempts() == 3);
        REQUIRE(f.orders()->size() == 1);
        REQUIRE(f.audit()->Entries().size() == 2);
    }

    SECTION("Gives up after the attempt limit") {
        OrderFixture f(RetryMiddleware::kMaxAttempts);
        REQUIRE_THROWS_AS(f.mediator->Invoke<Result<Order>>(CreateOrder{"erin", "widget", 1}),
                          TransientError);
        REQUIRE(f.inventory()->attempts() == RetryMiddleware::kMaxAttempts);
        REQUIRE(f.orders()->size() == 0);
        REQUIRE(f.audit()->Entries().empty());
    }
}

TEST_CASE("Sample - asynchronous order lookup", "[sample]") {
    OrderFixture f;
    Order created = f.mediator->Invoke<Order>(CreateOrder{"frank", "nut", 3});
    auto scope = f.services.CreateScope();

    SECTION("Synchronous invocation is rejected") {
        REQUIRE_THROWS_AS(f.mediator->Invoke<Result<Order>>(GetOrder{created.id}, *scope),
                          SyncPipelineViolationError);
    }

    SECTION("Found") {
        auto result = f.mediator->InvokeAsync<Result<Order>>(GetOrder{created.id}, *scope).get();
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value().customer == "frank");
    }

    SECTION("Missing") {
        auto result = f.mediator->InvokeAsync<Result<Order>>(GetOrder{created.id + 100}, *scope).get();
        REQUIRE(result.status() == ResultStatus::NotFound);
        REQUIRE_THROWS_AS(f.mediator->InvokeAsync<Order>(GetOrder{created.id + 100}, *scope).get(),
                          ResponseTypeMismatchError);
    }
}

TEST_CASE("Sample - registrations", "[sample]") {
    OrderFixture f;
    const auto& registry = f.mediator->registry();
    REQUIRE(registry.handler_count() == 5);
    REQUIRE(registry.middleware_count() == 3);
    REQUIRE_NOTHROW(f.mediator->ShowRegisteredHandlers());

    // Retry is opted into by the CreateOrder handler only
    const auto& create = *registry.Lookup(TypeInfo::Get<CreateOrder>()).front();
    auto names = registry.MiddlewareFor(create, TypeInfo::Get<CreateOrder>());
    REQUIRE(names.size() == 3);
    const auto& ping = *registry.Lookup(TypeInfo::Get<Ping>()).front();
    REQUIRE(registry.MiddlewareFor(ping, TypeInfo::Get<Ping>()).size() == 1);
}
