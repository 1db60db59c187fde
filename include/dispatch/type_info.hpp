// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace courier {
namespace dispatch {

template <typename... Ts> struct TypeList {};

// Tag naming a single-parameter message template, e.g. GenericFamily<Envelope>
template <template <typename> class F> struct GenericFamily {};

template <typename T = void> class Result;
class Value;
class TypeInfo;

namespace detail {

// Direct bases a message declares with `using BaseTypes = TypeList<...>;`
template <typename T, typename = void> struct BaseTypesOf {
  using type = TypeList<>;
};
template <typename T>
struct BaseTypesOf<T, std::void_t<typename T::BaseTypes>> {
  using type = typename T::BaseTypes;
};

// Instances of a single-parameter template belong to that template's family
template <typename T> struct GenericOf {
  static constexpr bool value = false;
};
template <template <typename> class F, typename A> struct GenericOf<F<A>> {
  static constexpr bool value = true;
  using Family = GenericFamily<F>;
};

} // namespace detail

// Edge from a type to one of its direct bases
struct BaseLink {
  const TypeInfo &(*type)();
  const void *(*upcast)(const void *object);
};

// Hooks carried by Result<> and Result<T> types
struct ResultHooks {
  // View the object as the status-carrying Result<> part
  const Result<void> &(*as_result)(const void *object);
  // Payload of a successful Result<T>; empty Value otherwise
  Value (*payload)(const std::shared_ptr<const void> &object);
  // Build this Result<T> from a Result<> (nullptr for Result<> itself)
  std::shared_ptr<const void> (*from_result)(const Result<void> &source);
  // Payload type (nullptr for Result<>)
  const TypeInfo &(*payload_type)();
};

/**
 * TypeInfo - runtime identity and ancestry of a message or component type
 *
 * One immutable instance per type, created on first use. Ancestry comes from
 * the BaseTypes list a type declares; abstract types play the role of
 * interfaces when middleware specificity is ranked.
 *
 * A derived type that does not redeclare BaseTypes inherits its parent's list
 * (C++ member lookup), which skips the parent itself. Every type with bases
 * should declare its own list.
 */
class TypeInfo {
public:
  template <typename T> static const TypeInfo &Get();

  // TypeInfo of a type already obtained through Get<T>(); nullptr otherwise
  static const TypeInfo *Find(std::type_index id);

  TypeInfo(const TypeInfo &) = delete;
  TypeInfo &operator=(const TypeInfo &) = delete;

  std::type_index id() const { return id_; }
  const std::string &name() const { return name_; }
  bool is_abstract() const { return is_abstract_; }
  const std::vector<BaseLink> &bases() const { return bases_; }
  const ResultHooks *result_hooks() const { return result_hooks_; }
  // Set for instances of a single-parameter template (Envelope<int>)
  const std::optional<std::type_index> &generic_family() const { return generic_family_; }

  // True when this type is target or derives from it
  bool IsAssignableTo(const TypeInfo &target) const;

  // Adjust an object pointer of this type to target; nullptr if unrelated
  const void *CastTo(const void *object, const TypeInfo &target) const;

  // Distinct ancestors (excluding this type), closest first
  std::vector<const TypeInfo *> Ancestors() const;

  bool operator==(const TypeInfo &other) const { return id_ == other.id_; }
  bool operator!=(const TypeInfo &other) const { return id_ != other.id_; }

private:
  TypeInfo(std::type_index id, std::string name, bool is_abstract,
           std::vector<BaseLink> bases, const ResultHooks *hooks,
           std::optional<std::type_index> generic_family);

  template <typename T> static TypeInfo Make();
  static void Register(const TypeInfo &info);

  std::type_index id_;
  std::string name_;
  bool is_abstract_;
  std::vector<BaseLink> bases_;
  const ResultHooks *result_hooks_;
  std::optional<std::type_index> generic_family_;
};

// Human readable type name ("orders::CreateOrder")
std::string DemangleTypeName(const char *mangled);

namespace detail {

template <typename T, typename B> const void *Upcast(const void *object) {
  return static_cast<const B *>(static_cast<const T *>(object));
}

template <typename T, typename... Bs>
std::vector<BaseLink> MakeBaseLinks(TypeList<Bs...>) {
  static_assert((std::is_base_of_v<Bs, T> && ...),
                "BaseTypes lists a type that is not a base class");
  return {BaseLink{&TypeInfo::Get<Bs>, &Upcast<T, Bs>}...};
}

} // namespace detail

template <typename T> TypeInfo TypeInfo::Make() {
  const ResultHooks *hooks = nullptr;
  if constexpr (requires { T::CourierResultHooks(); }) {
    hooks = T::CourierResultHooks();
  }
  std::optional<std::type_index> family;
  if constexpr (detail::GenericOf<T>::value) {
    family = std::type_index(typeid(typename detail::GenericOf<T>::Family));
  }
  return TypeInfo(std::type_index(typeid(T)), DemangleTypeName(typeid(T).name()),
                  std::is_abstract_v<T>,
                  detail::MakeBaseLinks<T>(typename detail::BaseTypesOf<T>::type{}),
                  hooks, family);
}

template <typename T> const TypeInfo &TypeInfo::Get() {
  static_assert(std::is_same_v<T, std::remove_cv_t<std::remove_reference_t<T>>>,
                "TypeInfo::Get expects an unqualified type");
  static const TypeInfo info = Make<T>();
  static const bool registered = (Register(info), true);
  (void)registered;
  return info;
}

} // namespace dispatch
} // namespace courier
