// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/value.hpp"

namespace courier {
namespace dispatch {

Value Value::Tuple(std::vector<Value> elements) {
  Value value;
  value.elements_ = std::make_shared<const std::vector<Value>>(std::move(elements));
  return value;
}

Value Value::FromShared(std::shared_ptr<const void> object, const TypeInfo &type) {
  Value value;
  if (object) {
    value.object_ = std::move(object);
    value.type_ = &type;
  }
  return value;
}

const std::vector<Value> &Value::Elements() const {
  static const std::vector<Value> kNoElements;
  return elements_ ? *elements_ : kNoElements;
}

bool Value::IsA(const TypeInfo &target) const {
  return type_ != nullptr && type_->IsAssignableTo(target);
}

std::string Value::TypeName() const {
  if (elements_) {
    std::string name = "tuple<";
    for (size_t i = 0; i < elements_->size(); ++i) {
      if (i > 0) {
        name += ", ";
      }
      name += (*elements_)[i].TypeName();
    }
    return name + ">";
  }
  if (type_ == nullptr) {
    return "empty";
  }
  return type_->name();
}

} // namespace dispatch
} // namespace courier
