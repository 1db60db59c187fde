// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/type_info.hpp"
#include <cstdlib>
#include <cxxabi.h>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace courier {
namespace dispatch {

namespace {

struct KnownTypes {
  std::mutex mutex;
  std::unordered_map<std::type_index, const TypeInfo *> by_id;
};

KnownTypes &Known() {
  static KnownTypes known;
  return known;
}

} // namespace

TypeInfo::TypeInfo(std::type_index id, std::string name, bool is_abstract,
                   std::vector<BaseLink> bases, const ResultHooks *hooks,
                   std::optional<std::type_index> generic_family)
    : id_(id), name_(std::move(name)), is_abstract_(is_abstract),
      bases_(std::move(bases)), result_hooks_(hooks),
      generic_family_(std::move(generic_family)) {}

void TypeInfo::Register(const TypeInfo &info) {
  KnownTypes &known = Known();
  std::lock_guard<std::mutex> lock(known.mutex);
  known.by_id.emplace(info.id(), &info);
}

const TypeInfo *TypeInfo::Find(std::type_index id) {
  KnownTypes &known = Known();
  std::lock_guard<std::mutex> lock(known.mutex);
  auto it = known.by_id.find(id);
  return it == known.by_id.end() ? nullptr : it->second;
}

bool TypeInfo::IsAssignableTo(const TypeInfo &target) const {
  if (*this == target) {
    return true;
  }
  for (const auto &base : bases_) {
    if (base.type().IsAssignableTo(target)) {
      return true;
    }
  }
  return false;
}

const void *TypeInfo::CastTo(const void *object, const TypeInfo &target) const {
  if (object == nullptr) {
    return nullptr;
  }
  if (*this == target) {
    return object;
  }
  for (const auto &base : bases_) {
    if (const void *adjusted = base.type().CastTo(base.upcast(object), target)) {
      return adjusted;
    }
  }
  return nullptr;
}

std::vector<const TypeInfo *> TypeInfo::Ancestors() const {
  std::vector<const TypeInfo *> result;
  std::unordered_set<std::type_index> seen{id_};
  std::deque<const TypeInfo *> queue{this};

  while (!queue.empty()) {
    const TypeInfo *current = queue.front();
    queue.pop_front();
    for (const auto &base : current->bases_) {
      const TypeInfo &type = base.type();
      if (seen.insert(type.id()).second) {
        result.push_back(&type);
        queue.push_back(&type);
      }
    }
  }
  return result;
}

std::string DemangleTypeName(const char *mangled) {
  int status = 0;
  char *demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
  if (status != 0 || demangled == nullptr) {
    return mangled;
  }
  std::string name(demangled);
  std::free(demangled);
  return name;
}

} // namespace dispatch
} // namespace courier
