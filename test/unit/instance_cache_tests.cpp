// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for handler and middleware instance acquisition

#include <catch2/catch_test_macros.hpp>
#include "dispatch/descriptors.hpp"
#include "dispatch/errors.hpp"
#include "dispatch/instance_cache.hpp"
#include "dispatch/service_scope.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace courier::dispatch;

namespace {

struct Worker {
    int generation = 0;
};

struct Command {};

HandlerDescriptor MakeHandler(Lifetime lifetime, InstanceFactory factory, size_t slot = 0) {
    HandlerDescriptor descriptor;
    descriptor.message_type = &TypeInfo::Get<Command>();
    descriptor.handler_type = &TypeInfo::Get<Worker>();
    descriptor.name = "Worker";
    descriptor.invoke = [](void*, CallContext&) { return Value(); };
    descriptor.lifetime = lifetime;
    descriptor.factory = std::move(factory);
    descriptor.slot = slot;
    return descriptor;
}

} // namespace

TEST_CASE("InstanceCache - cached once", "[dispatch][instance_cache]") {
    ServiceProvider services;
    InstanceCache cache(2);
    std::atomic<int> built{0};

    auto handler = MakeHandler(Lifetime::Default, [&built](Scope&) -> std::shared_ptr<void> {
        return std::make_shared<Worker>(Worker{++built});
    });
    REQUIRE(handler.activation() == ActivationKind::CachedOnce);

    SECTION("Constructed on first use and reused") {
        REQUIRE_FALSE(cache.IsCached(0));
        auto first = cache.AcquireHandler(handler, services);
        auto second = cache.AcquireHandler(handler, services);
        REQUIRE(first == second);
        REQUIRE(built.load() == 1);
        REQUIRE(cache.IsCached(0));
        REQUIRE_FALSE(cache.IsCached(1));
    }

    SECTION("Concurrent first use constructs once") {
        std::vector<std::shared_ptr<void>> seen(8);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < seen.size(); ++i) {
            threads.emplace_back([&, i] { seen[i] = cache.AcquireHandler(handler, services); });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(built.load() == 1);
        for (const auto& instance : seen) {
            REQUIRE(instance == seen.front());
        }
    }
}

TEST_CASE("InstanceCache - construction failures", "[dispatch][instance_cache]") {
    ServiceProvider services;
    InstanceCache cache(1);

    SECTION("A throwing factory caches nothing and is retried") {
        int calls = 0;
        auto handler = MakeHandler(Lifetime::Default, [&calls](Scope&) -> std::shared_ptr<void> {
            if (++calls == 1) {
                throw std::runtime_error("database not ready");
            }
            return std::make_shared<Worker>();
        });

        try {
            cache.AcquireHandler(handler, services);
            FAIL("expected ConstructionError");
        } catch (const ConstructionError& e) {
            REQUIRE(e.component() == "Worker");
            REQUIRE(e.cause() != nullptr);
            REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), std::runtime_error);
            REQUIRE(std::string(e.what()).find("database not ready") != std::string::npos);
        }
        REQUIRE_FALSE(cache.IsCached(0));

        REQUIRE(cache.AcquireHandler(handler, services) != nullptr);
        REQUIRE(calls == 2);
        REQUIRE(cache.IsCached(0));
    }

    SECTION("A factory returning null is an error") {
        auto handler = MakeHandler(Lifetime::Default,
                                   [](Scope&) -> std::shared_ptr<void> { return nullptr; });
        REQUIRE_THROWS_AS(cache.AcquireHandler(handler, services), ConstructionError);
        REQUIRE_FALSE(cache.IsCached(0));
    }

    SECTION("Missing factory") {
        auto handler = MakeHandler(Lifetime::Default, nullptr);
        REQUIRE_THROWS_AS(cache.AcquireHandler(handler, services), ConstructionError);
    }
}

TEST_CASE("InstanceCache - resolved from the active scope", "[dispatch][instance_cache]") {
    ServiceProvider services;
    InstanceCache cache(1);
    std::atomic<int> built{0};
    services.AddScoped<Worker>([&built](Scope&) { return std::make_shared<Worker>(Worker{++built}); });

    auto handler = MakeHandler(Lifetime::Scoped, nullptr);
    REQUIRE(handler.activation() == ActivationKind::ResolveEveryCall);

    SECTION("The scope decides reuse") {
        auto first = services.CreateScope();
        auto second = services.CreateScope();
        auto a1 = cache.AcquireHandler(handler, *first);
        auto a2 = cache.AcquireHandler(handler, *first);
        auto b = cache.AcquireHandler(handler, *second);
        REQUIRE(a1 == a2);
        REQUIRE(a1 != b);
        REQUIRE(built.load() == 2);
        REQUIRE_FALSE(cache.IsCached(0));
    }

    SECTION("Unregistered service") {
        ServiceProvider empty;
        REQUIRE_THROWS_AS(cache.AcquireHandler(handler, empty), ConstructionError);
    }

    SECTION("Scope failures are wrapped") {
        ServiceProvider failing;
        failing.AddTransient<Worker>([](Scope&) -> std::shared_ptr<Worker> {
            throw std::runtime_error("no workers");
        });
        REQUIRE_THROWS_AS(cache.AcquireHandler(handler, failing), ConstructionError);
    }
}

TEST_CASE("InstanceCache - function handlers get no instance", "[dispatch][instance_cache]") {
    ServiceProvider services;
    InstanceCache cache(1);
    auto handler = MakeHandler(Lifetime::Default, nullptr);
    handler.handler_type = nullptr;

    REQUIRE(handler.activation() == ActivationKind::None);
    REQUIRE(cache.AcquireHandler(handler, services) == nullptr);
    REQUIRE(std::string(ActivationKindName(ActivationKind::None)) == "none");
}
