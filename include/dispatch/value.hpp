// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/errors.hpp"
#include "dispatch/type_info.hpp"
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace courier {
namespace dispatch {

namespace detail {

template <typename T> struct IsTuple : std::false_type {};
template <typename... Ts> struct IsTuple<std::tuple<Ts...>> : std::true_type {};

template <typename T> struct IsOptional : std::false_type {};
template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T> struct IsSharedPtr : std::false_type {};
template <typename T> struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

} // namespace detail

/**
 * Value - immutable, type-erased message or handler output
 *
 * A Value is one of:
 * - empty (void return, nullptr, std::nullopt)
 * - a single object of a known TypeInfo
 * - a tuple of Values (a handler returning std::tuple)
 *
 * Copies share the underlying object.
 */
class Value {
public:
  Value() = default;

  /**
   * Wrap a C++ value
   * - std::tuple        -> tuple Value (element-wise)
   * - std::optional<T>  -> empty or T
   * - std::shared_ptr<T> -> shares ownership, typed by T (static type)
   * - const char*       -> std::string
   * - anything else     -> moved or copied into a new shared object
   */
  template <typename T> static Value Of(T &&value);

  static Value Tuple(std::vector<Value> elements);
  static Value FromShared(std::shared_ptr<const void> object, const TypeInfo &type);

  // False only for the empty Value
  bool HasValue() const { return object_ != nullptr || elements_ != nullptr; }
  explicit operator bool() const { return HasValue(); }

  bool IsTuple() const { return elements_ != nullptr; }
  // Tuple elements (empty for non-tuples)
  const std::vector<Value> &Elements() const;

  // Runtime type of a single object (nullptr when empty or tuple)
  const TypeInfo *Type() const { return type_; }

  // True when a single object assignable to target
  bool IsA(const TypeInfo &target) const;
  template <typename T> bool Is() const { return IsA(TypeInfo::Get<T>()); }

  // nullptr when not assignable to T
  template <typename T> const T *TryAs() const;
  // @throws ResponseTypeMismatchError when not assignable to T
  template <typename T> const T &As() const;

  const void *Get() const { return object_.get(); }
  const std::shared_ptr<const void> &shared() const { return object_; }

  // "empty", "tuple<A, B>", or the object's type name
  std::string TypeName() const;

private:
  std::shared_ptr<const void> object_;
  const TypeInfo *type_ = nullptr;
  std::shared_ptr<const std::vector<Value>> elements_;
};

template <typename T> Value Value::Of(T &&value) {
  using D = std::decay_t<T>;
  if constexpr (std::is_same_v<D, Value>) {
    return std::forward<T>(value);
  } else if constexpr (detail::IsTuple<D>::value) {
    std::vector<Value> elements;
    elements.reserve(std::tuple_size_v<D>);
    std::apply(
        [&elements](auto &&...element) {
          (elements.push_back(Of(std::forward<decltype(element)>(element))), ...);
        },
        std::forward<T>(value));
    return Tuple(std::move(elements));
  } else if constexpr (detail::IsOptional<D>::value) {
    if (!value.has_value()) {
      return Value();
    }
    return Of(*std::forward<T>(value));
  } else if constexpr (detail::IsSharedPtr<D>::value) {
    using Element = std::remove_cv_t<typename D::element_type>;
    if (!value) {
      return Value();
    }
    if constexpr (std::is_polymorphic_v<Element>) {
      // Dispatch on the runtime type when it is known and declares the static one as a base
      const TypeInfo &declared = TypeInfo::Get<Element>();
      const TypeInfo *actual = TypeInfo::Find(std::type_index(typeid(*value)));
      if (actual != nullptr && *actual != declared && actual->IsAssignableTo(declared)) {
        return FromShared(std::shared_ptr<const void>(value, dynamic_cast<const void *>(value.get())),
                          *actual);
      }
    }
    return FromShared(std::shared_ptr<const void>(std::forward<T>(value)),
                      TypeInfo::Get<Element>());
  } else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>) {
    if (value == nullptr) {
      return Value();
    }
    return FromShared(std::make_shared<const std::string>(value),
                      TypeInfo::Get<std::string>());
  } else if constexpr (std::is_same_v<D, std::nullptr_t>) {
    return Value();
  } else {
    return FromShared(std::make_shared<const D>(std::forward<T>(value)),
                      TypeInfo::Get<D>());
  }
}

template <typename T> const T *Value::TryAs() const {
  if (type_ == nullptr) {
    return nullptr;
  }
  return static_cast<const T *>(type_->CastTo(object_.get(), TypeInfo::Get<T>()));
}

template <typename T> const T &Value::As() const {
  const T *typed = TryAs<T>();
  if (typed == nullptr) {
    throw ResponseTypeMismatchError("Expected " + TypeInfo::Get<T>().name() +
                                    " but value holds " + TypeName());
  }
  return *typed;
}

} // namespace dispatch
} // namespace courier
