// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for Result<> and Result<T>

#include <catch2/catch_test_macros.hpp>
#include "dispatch/result.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace courier::dispatch;

namespace {

struct Widget {
    int id = 0;
};

Result<Widget> FindWidget(int id) {
    if (id <= 0) {
        return Result<>::NotFound("widget " + std::to_string(id));
    }
    return Widget{id};
}

} // namespace

TEST_CASE("Result - status factories", "[dispatch][result]") {
    SECTION("Success statuses") {
        REQUIRE(Result<>::Success().IsSuccess());
        REQUIRE(Result<>::NoContent().status() == ResultStatus::NoContent);
        REQUIRE(Result<>::NoContent().IsSuccess());

        auto created = Result<>::Created("/widgets/1");
        REQUIRE(created.IsSuccess());
        REQUIRE(created.status() == ResultStatus::Created);
        REQUIRE(created.location() == "/widgets/1");
    }

    SECTION("Failure statuses carry their message") {
        REQUIRE(Result<>::BadRequest("bad").status() == ResultStatus::BadRequest);
        REQUIRE(Result<>::Unauthorized().status() == ResultStatus::Unauthorized);
        REQUIRE(Result<>::Forbidden().status() == ResultStatus::Forbidden);
        REQUIRE(Result<>::Conflict().status() == ResultStatus::Conflict);
        REQUIRE(Result<>::Error().status() == ResultStatus::Error);
        REQUIRE(Result<>::CriticalError().status() == ResultStatus::CriticalError);
        REQUIRE(Result<>::Unavailable().status() == ResultStatus::Unavailable);

        auto missing = Result<>::NotFound("no such widget");
        REQUIRE_FALSE(missing.IsSuccess());
        REQUIRE(missing.message() == "no such widget");
    }

    SECTION("Invalid collects validation errors") {
        std::vector<ValidationError> errors{
            ValidationError{"name", "name is required", "required"},
            ValidationError{"size", "size is too large", "range", ValidationSeverity::Warning}};
        auto invalid = Result<>::Invalid(errors);
        REQUIRE(invalid.status() == ResultStatus::Invalid);
        REQUIRE_FALSE(invalid.IsSuccess());
        REQUIRE(invalid.validation_errors().size() == 2);
        REQUIRE(invalid.validation_errors()[1].severity == ValidationSeverity::Warning);
        REQUIRE(invalid.message() == "name is required");

        auto single = Result<>::Invalid(ValidationError{"id", "bad id", "format"});
        REQUIRE(single.validation_errors().size() == 1);
    }

    SECTION("Status names") {
        REQUIRE(std::string(ResultStatusName(ResultStatus::NotFound)) == "NotFound");
        REQUIRE(std::string(ResultStatusName(ResultStatus::CriticalError)) == "CriticalError");
    }
}

TEST_CASE("Result<T> - payload and conversions", "[dispatch][result]") {
    SECTION("Implicit success from a value") {
        Result<Widget> found = FindWidget(3);
        REQUIRE(found.IsSuccess());
        REQUIRE(found.HasValue());
        REQUIRE(found.value().id == 3);
    }

    SECTION("Implicit conversion from Result<> keeps status and message") {
        Result<Widget> missing = FindWidget(0);
        REQUIRE(missing.status() == ResultStatus::NotFound);
        REQUIRE(missing.message() == "widget 0");
        REQUIRE_FALSE(missing.HasValue());
        REQUIRE_THROWS_AS(missing.value(), std::logic_error);
    }

    SECTION("Created with location") {
        auto created = Result<Widget>::Created(Widget{9}, "/widgets/9");
        REQUIRE(created.status() == ResultStatus::Created);
        REQUIRE(created.location() == "/widgets/9");
        REQUIRE(created.value().id == 9);
    }

    SECTION("Result<T> is a Result<>") {
        const TypeInfo& type = TypeInfo::Get<Result<Widget>>();
        REQUIRE(type.IsAssignableTo(TypeInfo::Get<Result<>>()));
        REQUIRE(type.result_hooks() != nullptr);
        REQUIRE(type.result_hooks()->payload_type != nullptr);
        REQUIRE(TypeInfo::Get<Result<>>().result_hooks() != nullptr);
        REQUIRE(TypeInfo::Get<Result<>>().result_hooks()->payload_type == nullptr);
    }
}
