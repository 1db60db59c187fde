// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for notification fan-out (Publish, PublishAsync)

#include <catch2/catch_test_macros.hpp>
#include "dispatch_test_support.hpp"
#include "dispatch/errors.hpp"
#include <future>
#include <stdexcept>
#include <string>
#include <tuple>

using namespace courier::dispatch;
using courier::test::TestConfig;
using courier::test::Trace;
using courier::test::TracedFactory;

namespace {

struct Event {
    virtual ~Event() = default;
};

struct Alert : Event {
    using BaseTypes = TypeList<Event>;
    explicit Alert(std::string text = {}) : text(std::move(text)) {}
    std::string text;
};

struct Quiet {};

struct Raise {
    std::string text;
};

// Returns its event through a base pointer
struct RaiseHandler {
    std::tuple<std::string, std::shared_ptr<Event>> Handle(const Raise& raise) {
        return {"raised", std::make_shared<Alert>(raise.text)};
    }
};

template <int N, bool Fails> class Listener {
public:
    explicit Listener(std::shared_ptr<Trace> trace) : trace_(std::move(trace)) {}

    void Handle(const Alert& alert) {
        trace_->Add("listener" + std::to_string(N) + ":" + alert.text);
        if constexpr (Fails) {
            throw std::runtime_error("listener" + std::to_string(N) + " failed");
        }
    }

private:
    std::shared_ptr<Trace> trace_;
};

class EventListener {
public:
    explicit EventListener(std::shared_ptr<Trace> trace) : trace_(std::move(trace)) {}
    void Handle(const Event&) { trace_->Add("event"); }

private:
    std::shared_ptr<Trace> trace_;
};

class AsyncListener {
public:
    explicit AsyncListener(std::shared_ptr<Trace> trace) : trace_(std::move(trace)) {}

    std::future<void> Handle(const Alert&, CallContext&) {
        trace_->Add("async");
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

private:
    std::shared_ptr<Trace> trace_;
};

template <typename H>
void AddListener(HandlerRegistry::Builder& builder, const std::shared_ptr<Trace>& trace,
                 int order = kDefaultHandlerOrder) {
    HandlerOptions options;
    options.order = order;
    options.factory = TracedFactory<H>(trace);
    builder.AddHandler(&H::Handle, options);
}

} // namespace

TEST_CASE("Publish - every handler runs despite failures", "[dispatch][publish]") {
    auto trace = std::make_shared<Trace>();
    ServiceProvider services;
    HandlerRegistry::Builder builder;
    AddListener<Listener<1, false>>(builder, trace);
    AddListener<Listener<2, true>>(builder, trace);
    AddListener<Listener<3, true>>(builder, trace);

    auto check = [&trace](const AggregatedHandlerErrors& e) {
        REQUIRE(e.size() == 2);
        REQUIRE(trace->Count("listener1:x") == 1);
        REQUIRE(trace->Count("listener2:x") == 1);
        REQUIRE(trace->Count("listener3:x") == 1);
    };

    SECTION("Synchronous publish") {
        Mediator mediator(builder.Build(), services, TestConfig());
        try {
            mediator.Publish(Alert("x"));
            FAIL("expected AggregatedHandlerErrors");
        } catch (const AggregatedHandlerErrors& e) {
            check(e);
            // Handler order is preserved
            REQUIRE(DescribeException(e.errors()[0]) == "listener2 failed");
            REQUIRE(DescribeException(e.errors()[1]) == "listener3 failed");
        }
    }

    SECTION("Parallel publish") {
        Mediator mediator(builder.Build(), services, TestConfig(PublishStrategy::Parallel));
        try {
            mediator.PublishAsync(Alert("x")).get();
            FAIL("expected AggregatedHandlerErrors");
        } catch (const AggregatedHandlerErrors& e) {
            check(e);
        }
    }

    SECTION("Sequential publish") {
        Mediator mediator(builder.Build(), services, TestConfig(PublishStrategy::Sequential));
        try {
            mediator.PublishAsync(Alert("x")).get();
            FAIL("expected AggregatedHandlerErrors");
        } catch (const AggregatedHandlerErrors& e) {
            check(e);
        }
    }
}

TEST_CASE("Publish - a single failure propagates unchanged", "[dispatch][publish]") {
    auto trace = std::make_shared<Trace>();
    ServiceProvider services;
    HandlerRegistry::Builder builder;
    AddListener<Listener<1, false>>(builder, trace);
    AddListener<Listener<2, true>>(builder, trace);
    Mediator mediator(builder.Build(), services, TestConfig());

    REQUIRE_THROWS_AS(mediator.Publish(Alert("a")), std::runtime_error);
    REQUIRE_THROWS_AS(mediator.PublishAsync(Alert("b")).get(), std::runtime_error);
    REQUIRE(trace->Count("listener1:a") == 1);
    REQUIRE(trace->Count("listener1:b") == 1);

    try {
        mediator.Publish(Alert("c"));
        FAIL("expected runtime_error");
    } catch (const AggregatedHandlerErrors&) {
        FAIL("a single failure must not be aggregated");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "listener2 failed");
    }
}

TEST_CASE("Publish - ordering and ancestors", "[dispatch][publish]") {
    auto trace = std::make_shared<Trace>();
    ServiceProvider services;
    HandlerRegistry::Builder builder;
    AddListener<Listener<3, false>>(builder, trace, 30);
    AddListener<Listener<1, false>>(builder, trace, 10);
    AddListener<EventListener>(builder, trace, 20);
    AddListener<Listener<2, false>>(builder, trace, 20);
    Mediator mediator(builder.Build(), services, TestConfig(PublishStrategy::Sequential));

    SECTION("Sequential runs ascending by order") {
        mediator.Publish(Alert("x"));
        REQUIRE(trace->Events() ==
                std::vector<std::string>{"listener1:x", "event", "listener2:x", "listener3:x"});

        mediator.PublishAsync(Alert("y"), services, {}, PublishStrategy::Sequential).get();
        REQUIRE(trace->Events().size() == 8);
        REQUIRE(trace->Events()[4] == "listener1:y");
        REQUIRE(trace->Events()[7] == "listener3:y");
    }

    SECTION("Parallel runs every handler once") {
        mediator.PublishAsync(Alert("p"), services, {}, PublishStrategy::Parallel).get();
        REQUIRE(trace->Events().size() == 4);
        REQUIRE(trace->Count("event") == 1);
    }

    SECTION("Ancestor handlers do not see unrelated messages") {
        REQUIRE_NOTHROW(mediator.Publish(Quiet{}));
        REQUIRE_NOTHROW(mediator.PublishAsync(Quiet{}).get());
        REQUIRE(trace->Events().empty());
    }
}

TEST_CASE("Publish - asynchronous handlers", "[dispatch][publish]") {
    auto trace = std::make_shared<Trace>();
    ServiceProvider services;
    HandlerRegistry::Builder builder;
    AddListener<Listener<1, false>>(builder, trace);
    AddListener<AsyncListener>(builder, trace);
    Mediator mediator(builder.Build(), services, TestConfig());

    SECTION("Synchronous publish refuses before running anything") {
        REQUIRE_THROWS_AS(mediator.Publish(Alert("x")), SyncPipelineViolationError);
        REQUIRE(trace->Events().empty());
    }

    SECTION("Asynchronous publish runs them") {
        mediator.PublishAsync(Alert("x")).get();
        REQUIRE(trace->Count("async") == 1);
        REQUIRE(trace->Count("listener1:x") == 1);
    }
}

TEST_CASE("Publish - invalid input and cancellation", "[dispatch][publish]") {
    auto trace = std::make_shared<Trace>();
    ServiceProvider services;
    HandlerRegistry::Builder builder;
    AddListener<Listener<1, false>>(builder, trace);
    Mediator mediator(builder.Build(), services, TestConfig());

    SECTION("Empty messages") {
        REQUIRE_THROWS_AS(mediator.Publish(std::optional<Alert>()), std::invalid_argument);
        REQUIRE_THROWS_AS(mediator.PublishAsync(std::optional<Alert>()), std::invalid_argument);
    }

    SECTION("Cancelled before dispatch") {
        CancellationSource source;
        source.Cancel();
        REQUIRE_THROWS_AS(mediator.Publish(Alert("x"), services, source.Token()),
                          CancellationError);
        REQUIRE_THROWS_AS(mediator.PublishAsync(Alert("x"), services, source.Token()).get(),
                          CancellationError);
        REQUIRE(trace->Events().empty());
    }
}

TEST_CASE("Publish - base pointers dispatch on the runtime type", "[dispatch][publish]") {
    auto trace = std::make_shared<Trace>();
    ServiceProvider services;
    HandlerRegistry::Builder builder;
    AddListener<Listener<1, false>>(builder, trace, 10);
    AddListener<EventListener>(builder, trace, 20);
    builder.AddHandler(&RaiseHandler::Handle);
    Mediator mediator(builder.Build(), services, TestConfig(PublishStrategy::Sequential));

    SECTION("Direct publish") {
        std::shared_ptr<Event> event = std::make_shared<Alert>("x");
        mediator.Publish(event);
        REQUIRE(trace->Events() == std::vector<std::string>{"listener1:x", "event"});

        mediator.PublishAsync(std::shared_ptr<const Event>(std::make_shared<Alert>("y"))).get();
        REQUIRE(trace->Count("listener1:y") == 1);
        REQUIRE(trace->Count("event") == 2);
    }

    SECTION("Cascaded element") {
        REQUIRE(mediator.Invoke<std::string>(Raise{"c"}) == "raised");
        REQUIRE(trace->Events() == std::vector<std::string>{"listener1:c", "event"});

        REQUIRE(mediator.InvokeAsync<std::string>(Raise{"d"}).get() == "raised");
        REQUIRE(trace->Count("listener1:d") == 1);
    }

    SECTION("A plain base object reaches only base handlers") {
        struct Bare : Event {};
        mediator.Publish(std::shared_ptr<Event>(std::make_shared<Bare>()));
        REQUIRE(trace->Events() == std::vector<std::string>{"event"});
    }
}
