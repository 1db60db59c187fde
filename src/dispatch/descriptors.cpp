// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/descriptors.hpp"

namespace courier {
namespace dispatch {

const char *ActivationKindName(ActivationKind kind) {
  switch (kind) {
  case ActivationKind::None:
    return "none";
  case ActivationKind::CachedOnce:
    return "cached";
  case ActivationKind::ResolveEveryCall:
    return "per-call";
  }
  return "unknown";
}

ActivationKind HandlerDescriptor::activation() const {
  if (handler_type == nullptr) {
    return ActivationKind::None;
  }
  return lifetime == Lifetime::Default ? ActivationKind::CachedOnce
                                       : ActivationKind::ResolveEveryCall;
}

bool MiddlewareDescriptor::Accepts(const TypeInfo &message_type) const {
  return applies_to == nullptr || message_type.IsAssignableTo(*applies_to);
}

int MiddlewareDescriptor::Specificity(const TypeInfo &message_type) const {
  if (applies_to == nullptr) {
    return 3;
  }
  if (message_type == *applies_to) {
    return 0;
  }
  return applies_to->is_abstract() ? 1 : 2;
}

ActivationKind MiddlewareDescriptor::activation() const {
  return lifetime == Lifetime::Default ? ActivationKind::CachedOnce
                                       : ActivationKind::ResolveEveryCall;
}

} // namespace dispatch
} // namespace courier
