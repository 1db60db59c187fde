// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for runtime type identity and type-erased values

#include <catch2/catch_test_macros.hpp>
#include "dispatch/errors.hpp"
#include "dispatch/type_info.hpp"
#include "dispatch/value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <typeindex>

using namespace courier::dispatch;

namespace {

struct Named {
    virtual ~Named() = default;
    virtual std::string label() const = 0;
};

struct Tagged {
    int tag = 7;
};

struct Item : Named, Tagged {
    using BaseTypes = TypeList<Named, Tagged>;
    std::string label() const override { return "item"; }
};

struct SpecialItem : Item {
    using BaseTypes = TypeList<Item>;
    std::string label() const override { return "special"; }
};

struct Root {
    virtual ~Root() = default;
};
struct Left : virtual Root {
    using BaseTypes = TypeList<Root>;
};
struct Right : virtual Root {
    using BaseTypes = TypeList<Root>;
};
struct Bottom : Left, Right {
    using BaseTypes = TypeList<Left, Right>;
};

struct Plain {
    int value = 0;
};

template <typename T> struct Box {
    T content{};
};

template <typename T> struct Crate {
    T content{};
};

} // namespace

TEST_CASE("TypeInfo - identity and names", "[dispatch][type_info]") {
    const TypeInfo& a = TypeInfo::Get<Plain>();
    const TypeInfo& b = TypeInfo::Get<Plain>();
    REQUIRE(&a == &b);
    REQUIRE(a == b);
    REQUIRE(a != TypeInfo::Get<Item>());
    REQUIRE(a.name().find("Plain") != std::string::npos);
    REQUIRE(TypeInfo::Get<std::string>().name().find("string") != std::string::npos);

    REQUIRE(TypeInfo::Get<Named>().is_abstract());
    REQUIRE_FALSE(TypeInfo::Get<Item>().is_abstract());
    REQUIRE(a.bases().empty());
}

TEST_CASE("TypeInfo - lookup by runtime identity", "[dispatch][type_info]") {
    const TypeInfo& item = TypeInfo::Get<Item>();
    REQUIRE(TypeInfo::Find(std::type_index(typeid(Item))) == &item);

    struct NeverRequested {};
    REQUIRE(TypeInfo::Find(std::type_index(typeid(NeverRequested))) == nullptr);
}

TEST_CASE("TypeInfo - generic families", "[dispatch][type_info]") {
    const auto& int_box = TypeInfo::Get<Box<int>>().generic_family();
    const auto& text_box = TypeInfo::Get<Box<std::string>>().generic_family();
    const auto& int_crate = TypeInfo::Get<Crate<int>>().generic_family();

    REQUIRE(int_box.has_value());
    REQUIRE(int_box == text_box);
    REQUIRE(int_crate.has_value());
    REQUIRE(*int_crate != *int_box);
    REQUIRE(*int_box == std::type_index(typeid(GenericFamily<Box>)));
    REQUIRE_FALSE(TypeInfo::Get<Plain>().generic_family().has_value());
}

TEST_CASE("TypeInfo - declared ancestry", "[dispatch][type_info]") {
    const TypeInfo& special = TypeInfo::Get<SpecialItem>();

    SECTION("Assignability is transitive") {
        REQUIRE(special.IsAssignableTo(special));
        REQUIRE(special.IsAssignableTo(TypeInfo::Get<Item>()));
        REQUIRE(special.IsAssignableTo(TypeInfo::Get<Named>()));
        REQUIRE(special.IsAssignableTo(TypeInfo::Get<Tagged>()));
        REQUIRE_FALSE(special.IsAssignableTo(TypeInfo::Get<Plain>()));
        REQUIRE_FALSE(TypeInfo::Get<Item>().IsAssignableTo(special));
    }

    SECTION("Ancestors closest first") {
        auto ancestors = special.Ancestors();
        REQUIRE(ancestors.size() == 3);
        REQUIRE(*ancestors[0] == TypeInfo::Get<Item>());
        REQUIRE(*ancestors[1] == TypeInfo::Get<Named>());
        REQUIRE(*ancestors[2] == TypeInfo::Get<Tagged>());
    }

    SECTION("Shared ancestors are listed once") {
        auto ancestors = TypeInfo::Get<Bottom>().Ancestors();
        REQUIRE(ancestors.size() == 3);
        REQUIRE(*ancestors[0] == TypeInfo::Get<Left>());
        REQUIRE(*ancestors[1] == TypeInfo::Get<Right>());
        REQUIRE(*ancestors[2] == TypeInfo::Get<Root>());
    }

    SECTION("CastTo adjusts pointers for secondary bases") {
        SpecialItem object;
        const void* cast = special.CastTo(&object, TypeInfo::Get<Tagged>());
        REQUIRE(cast == static_cast<const Tagged*>(&object));
        REQUIRE(static_cast<const Tagged*>(cast)->tag == 7);
        REQUIRE(special.CastTo(&object, TypeInfo::Get<Plain>()) == nullptr);
    }
}

TEST_CASE("Value - construction from C++ values", "[dispatch][value]") {
    SECTION("Plain objects are copied") {
        Value v = Value::Of(Plain{42});
        REQUIRE(v.HasValue());
        REQUIRE_FALSE(v.IsTuple());
        REQUIRE(v.Is<Plain>());
        REQUIRE(v.As<Plain>().value == 42);
    }

    SECTION("Empty forms") {
        REQUIRE_FALSE(Value().HasValue());
        REQUIRE_FALSE(Value::Of(std::optional<Plain>()).HasValue());
        REQUIRE_FALSE(Value::Of(nullptr).HasValue());
        REQUIRE_FALSE(Value::Of(std::shared_ptr<Plain>()).HasValue());
        REQUIRE(Value().TypeName() == "empty");
    }

    SECTION("Optional with a value") {
        Value v = Value::Of(std::optional<Plain>(Plain{3}));
        REQUIRE(v.As<Plain>().value == 3);
    }

    SECTION("String literals become std::string") {
        Value v = Value::Of("hello");
        REQUIRE(v.As<std::string>() == "hello");
    }

    SECTION("shared_ptr shares the object") {
        auto item = std::make_shared<Plain>(Plain{5});
        Value v = Value::Of(item);
        REQUIRE(v.Get() == item.get());
        REQUIRE(item.use_count() == 2);
    }

    SECTION("shared_ptr to a base carries the runtime type") {
        const TypeInfo& special = TypeInfo::Get<SpecialItem>();
        auto held = std::make_shared<SpecialItem>();
        std::shared_ptr<const Named> named = held;
        Value v = Value::Of(named);
        REQUIRE(v.Type() == &special);
        REQUIRE(v.Get() == static_cast<const void*>(held.get()));
        REQUIRE(v.As<SpecialItem>().label() == "special");
        REQUIRE(v.As<Tagged>().tag == 7);
    }

    SECTION("Undeclared runtime types keep the static type") {
        struct Loose : Named {
            std::string label() const override { return "loose"; }
        };
        std::shared_ptr<Named> named = std::make_shared<Loose>();
        Value v = Value::Of(named);
        REQUIRE(v.Type() == &TypeInfo::Get<Named>());
        REQUIRE(v.As<Named>().label() == "loose");
    }

    SECTION("Tuples are element-wise") {
        Value v = Value::Of(std::make_tuple(Plain{1}, std::string("two"), std::optional<int>()));
        REQUIRE(v.IsTuple());
        REQUIRE(v.Type() == nullptr);
        REQUIRE(v.Elements().size() == 3);
        REQUIRE(v.Elements()[0].As<Plain>().value == 1);
        REQUIRE(v.Elements()[1].As<std::string>() == "two");
        REQUIRE_FALSE(v.Elements()[2].HasValue());
        REQUIRE(v.TypeName().rfind("tuple<", 0) == 0);
    }
}

TEST_CASE("Value - typed access follows ancestry", "[dispatch][value]") {
    Value v = Value::Of(SpecialItem());

    REQUIRE(v.Is<Named>());
    REQUIRE(v.As<Named>().label() == "special");
    REQUIRE(v.As<Tagged>().tag == 7);
    REQUIRE(v.TryAs<Plain>() == nullptr);
    REQUIRE_THROWS_AS(v.As<Plain>(), ResponseTypeMismatchError);
    REQUIRE_THROWS_AS(Value().As<Plain>(), ResponseTypeMismatchError);
}
