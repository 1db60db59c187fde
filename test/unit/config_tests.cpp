// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for mediator configuration parsing

#include <catch2/catch_test_macros.hpp>
#include "dispatch/config.hpp"
#include <filesystem>
#include <fstream>

using namespace courier::dispatch;
using json = nlohmann::json;

namespace {

// Temporary file removed on scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("Config - publish strategy names", "[dispatch][config]") {
    REQUIRE(ParsePublishStrategy("sequential") == PublishStrategy::Sequential);
    REQUIRE(ParsePublishStrategy("parallel") == PublishStrategy::Parallel);
    REQUIRE_FALSE(ParsePublishStrategy("Parallel").has_value());
    REQUIRE_FALSE(ParsePublishStrategy("").has_value());
    REQUIRE(std::string(PublishStrategyName(PublishStrategy::Sequential)) == "sequential");
}

TEST_CASE("Config - parsing", "[dispatch][config]") {
    std::string error;

    SECTION("Empty object gives defaults") {
        auto config = ParseMediatorConfig(json::object(), &error);
        REQUIRE(config.has_value());
        REQUIRE(config->publish_strategy == PublishStrategy::Parallel);
        REQUIRE(config->worker_threads == 0);
        REQUIRE(config->max_queue_size == 0);
        REQUIRE(config->log_level == "info");
        REQUIRE_FALSE(config->log_registrations);
    }

    SECTION("Every key") {
        auto config = ParseMediatorConfig(json{{"publish_strategy", "sequential"},
                                               {"worker_threads", 3},
                                               {"max_queue_size", 64},
                                               {"log_level", "debug"},
                                               {"log_registrations", true},
                                               {"unknown", "ignored"}},
                                          &error);
        REQUIRE(config.has_value());
        REQUIRE(config->publish_strategy == PublishStrategy::Sequential);
        REQUIRE(config->worker_threads == 3);
        REQUIRE(config->max_queue_size == 64);
        REQUIRE(config->log_level == "debug");
        REQUIRE(config->log_registrations);
    }

    SECTION("Malformed values") {
        REQUIRE_FALSE(ParseMediatorConfig(json::array(), &error));
        REQUIRE(error == "configuration must be a JSON object");

        REQUIRE_FALSE(ParseMediatorConfig(json{{"publish_strategy", "random"}}, &error));
        REQUIRE(error.find("publish_strategy") != std::string::npos);

        REQUIRE_FALSE(ParseMediatorConfig(json{{"worker_threads", -1}}, &error));
        REQUIRE(error.find("worker_threads") != std::string::npos);

        REQUIRE_FALSE(ParseMediatorConfig(json{{"max_queue_size", 1.5}}, &error));
        REQUIRE(error.find("max_queue_size") != std::string::npos);

        REQUIRE_FALSE(ParseMediatorConfig(json{{"log_level", "loud"}}, &error));
        REQUIRE(error.find("log_level") != std::string::npos);

        REQUIRE_FALSE(ParseMediatorConfig(json{{"log_registrations", "yes"}}, &error));
        REQUIRE(error.find("log_registrations") != std::string::npos);
    }

    SECTION("Error output is optional") {
        REQUIRE_FALSE(ParseMediatorConfig(json{{"worker_threads", "four"}}));
    }
}

TEST_CASE("Config - files", "[dispatch][config]") {
    std::string error;

    SECTION("Valid file") {
        TempFile file("courier_config_valid.json",
                      R"({"publish_strategy": "sequential", "worker_threads": 2})");
        auto config = LoadMediatorConfig(file.path(), &error);
        REQUIRE(config.has_value());
        REQUIRE(config->publish_strategy == PublishStrategy::Sequential);
        REQUIRE(config->worker_threads == 2);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(LoadMediatorConfig("/nonexistent/courier.json", &error));
        REQUIRE(error.find("cannot open") != std::string::npos);
    }

    SECTION("Invalid JSON") {
        TempFile file("courier_config_broken.json", "{ \"worker_threads\": ");
        REQUIRE_FALSE(LoadMediatorConfig(file.path(), &error));
        REQUIRE(error.rfind("invalid JSON", 0) == 0);
    }
}

TEST_CASE("Config - JSON output", "[dispatch][config]") {
    MediatorConfig config;
    config.publish_strategy = PublishStrategy::Sequential;
    config.worker_threads = 8;
    config.log_level = "warn";

    json j = MediatorConfigToJson(config);
    REQUIRE(j["publish_strategy"] == "sequential");
    REQUIRE(j["worker_threads"] == 8);
    REQUIRE(j["max_queue_size"] == 0);
    REQUIRE(j["log_level"] == "warn");
    REQUIRE(j["log_registrations"] == false);

    auto parsed = ParseMediatorConfig(j);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->worker_threads == 8);
}
