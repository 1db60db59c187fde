// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/call_context.hpp"
#include "dispatch/descriptors.hpp"
#include "dispatch/service_scope.hpp"
#include "dispatch/type_info.hpp"
#include "dispatch/value.hpp"
#include <concepts>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace courier {
namespace dispatch {

struct HandlerOptions {
  // Defaults to the handler's type name
  std::string name;
  int order = kDefaultHandlerOrder;
  Lifetime lifetime = Lifetime::Default;
  // Required for Lifetime::Default when the handler is not default-constructible
  InstanceFactory factory;
  std::vector<std::type_index> use_middleware;

  template <typename Mw> HandlerOptions &UseMiddleware() {
    use_middleware.emplace_back(typeid(Mw));
    return *this;
  }
};

struct MiddlewareOptions {
  // Defaults to the middleware's type name
  std::string name;
  // Unset runs after every explicitly ordered middleware
  std::optional<int> order;
  Lifetime lifetime = Lifetime::Default;
  bool explicit_only = false;
  InstanceFactory factory;
};

// One row of the registration listing
struct RegistrationInfo {
  std::string message_type;
  std::string handler;
  int order;
  bool is_async;
  bool returns_tuple;
  std::string result_type;
  Lifetime lifetime;
  std::vector<std::string> middleware;
};

/**
 * HandlerRegistry - immutable map from message types to handlers and the
 * middleware that wraps them
 *
 * Built once by HandlerRegistry::Builder, then shared read-only by any
 * number of mediators and threads. Lookups take no locks, except for message
 * types of a generic family with registered handler templates: those close
 * the templates on first lookup and serve the cached list under a short lock.
 *
 * Usage:
 *   auto registry = HandlerRegistry::Builder()
 *       .AddHandler(&OrderHandler::Handle)
 *       .AddMiddleware<LoggingMiddleware>()
 *       .Build();
 */
class HandlerRegistry {
public:
  class Builder;

  HandlerRegistry(const HandlerRegistry &) = delete;
  HandlerRegistry &operator=(const HandlerRegistry &) = delete;

  /**
   * Handlers registered for exactly this message type, ascending by order
   * (registration order breaks ties, closed generic handlers last). Empty
   * when none. The reference stays valid for the registry's lifetime.
   */
  const std::vector<const HandlerDescriptor *> &Lookup(const TypeInfo &message_type) const;

  /**
   * Handlers for the type and every ancestor it declares, each handler once,
   * ascending by order
   */
  std::vector<const HandlerDescriptor *> LookupForPublish(const TypeInfo &message_type) const;

  /**
   * Middleware wrapping handler for a message of the given runtime type,
   * outermost first. Ascending by order; equal orders fall back to
   * specificity (exact, abstract ancestor, concrete ancestor, universal),
   * then to registration order.
   */
  std::vector<const MiddlewareDescriptor *> MiddlewareFor(const HandlerDescriptor &handler,
                                                          const TypeInfo &message_type) const;

  // Sorted by message type, then handler name
  std::vector<RegistrationInfo> Registrations() const;
  nlohmann::json ToJson() const;

  size_t handler_count() const { return handlers_.size(); }
  size_t middleware_count() const { return middleware_.size(); }
  size_t generic_handler_count() const { return generic_.size(); }
  // Instance cache slots (one per handler, middleware and closable generic handler)
  size_t slot_count() const { return slot_count_; }

  const std::vector<std::unique_ptr<const HandlerDescriptor>> &handlers() const { return handlers_; }
  const std::vector<std::unique_ptr<const MiddlewareDescriptor>> &middleware() const {
    return middleware_;
  }
  const std::vector<std::unique_ptr<const GenericHandlerDescriptor>> &generic_handlers() const {
    return generic_;
  }

private:
  HandlerRegistry() = default;

  const std::vector<const HandlerDescriptor *> &
  LookupClosed(const TypeInfo &message_type,
               const std::vector<const HandlerDescriptor *> &exact) const;

  std::vector<std::unique_ptr<const HandlerDescriptor>> handlers_;
  std::vector<std::unique_ptr<const MiddlewareDescriptor>> middleware_;
  std::vector<std::unique_ptr<const GenericHandlerDescriptor>> generic_;
  std::unordered_map<std::type_index, std::vector<const HandlerDescriptor *>> by_message_;
  std::unordered_map<std::type_index, std::vector<const GenericHandlerDescriptor *>> by_family_;
  size_t slot_count_ = 0;

  // Closed generic handlers, built lazily per closed message type
  mutable std::mutex closed_mutex_;
  mutable std::unordered_map<std::type_index, std::vector<const HandlerDescriptor *>> closed_lists_;
  mutable std::vector<std::unique_ptr<const HandlerDescriptor>> closed_handlers_;
};

namespace detail {

template <typename T> struct FutureTraits {
  static constexpr bool is_future = false;
  using type = T;
};
template <typename T> struct FutureTraits<std::future<T>> {
  static constexpr bool is_future = true;
  using type = T;
};

// Signature of a member function handler: R(const M&[, CallContext&]) [const]
template <typename F> struct MethodTraits;
template <typename R, typename A, typename... Rest> struct MethodTraits<R(A, Rest...)> {
  using Return = R;
  using Message = std::remove_cvref_t<A>;
  static constexpr bool takes_context = sizeof...(Rest) == 1;
  static_assert(sizeof...(Rest) <= 1, "handlers take (const M&) or (const M&, CallContext&)");
};
template <typename R, typename A, typename... Rest>
struct MethodTraits<R(A, Rest...) const> : MethodTraits<R(A, Rest...)> {};
template <typename R, typename A, typename... Rest>
struct MethodTraits<R(A, Rest...) noexcept> : MethodTraits<R(A, Rest...)> {};
template <typename R, typename A, typename... Rest>
struct MethodTraits<R(A, Rest...) const noexcept> : MethodTraits<R(A, Rest...)> {};

template <typename P> struct MemberFunction;
template <typename C, typename F> struct MemberFunction<F C::*> {
  using type = F;
};

template <typename M> decltype(auto) MessageArg(CallContext &ctx) {
  if constexpr (std::is_same_v<M, Value>) {
    return (ctx.message());
  } else {
    return ctx.message().template As<M>();
  }
}

// Run call and wrap what it returns; futures are awaited
template <typename R, typename F> Value ToValue(F &&call) {
  if constexpr (FutureTraits<R>::is_future) {
    R pending = call();
    if constexpr (std::is_void_v<typename FutureTraits<R>::type>) {
      pending.get();
      return Value();
    } else {
      return Value::Of(pending.get());
    }
  } else if constexpr (std::is_void_v<R>) {
    call();
    return Value();
  } else {
    return Value::Of(call());
  }
}

// Before phases: void continues, HandlerResult is taken as is, any other
// value continues with that value as state
template <typename R, typename F> HandlerResult ToHandlerResult(F &&call) {
  if constexpr (FutureTraits<R>::is_future) {
    R pending = call();
    using Inner = typename FutureTraits<R>::type;
    return ToHandlerResult<Inner>([&pending]() -> Inner { return pending.get(); });
  } else if constexpr (std::is_void_v<R>) {
    call();
    return HandlerResult::Continue();
  } else if constexpr (std::is_same_v<std::decay_t<R>, HandlerResult>) {
    return call();
  } else {
    return HandlerResult::Continue(Value::Of(call()));
  }
}

template <typename R> std::string ResultTypeName() {
  using Inner = typename FutureTraits<R>::type;
  if constexpr (std::is_void_v<Inner>) {
    return "void";
  } else {
    return TypeInfo::Get<std::decay_t<Inner>>().name();
  }
}

template <typename R> constexpr bool ReturnsTuple() {
  using Inner = typename FutureTraits<R>::type;
  if constexpr (std::is_void_v<Inner>) {
    return false;
  } else {
    return IsTuple<std::decay_t<Inner>>::value;
  }
}

template <typename Mw, typename Arg>
concept HasBefore = requires(Mw &m, const Arg &msg, CallContext &ctx) { m.Before(msg, ctx); };
template <typename Mw, typename Arg>
concept HasAfter = requires(Mw &m, const Arg &msg, CallContext &ctx) { m.After(msg, ctx); };
template <typename Mw, typename Arg>
concept HasFinally = requires(Mw &m, const Arg &msg, CallContext &ctx) { m.Finally(msg, ctx); };
template <typename Mw, typename Arg>
concept HasExecute = requires(Mw &m, const Arg &msg, CallContext &ctx, const Next &next) {
  m.Execute(msg, ctx, next);
};

template <typename T> InstanceFactory DefaultFactory(InstanceFactory configured) {
  if (configured) {
    return configured;
  }
  if constexpr (std::is_default_constructible_v<T>) {
    return [](Scope &) -> std::shared_ptr<void> { return std::make_shared<T>(); };
  } else {
    return nullptr;
  }
}

template <typename H, typename Method>
HandlerDescriptor DescribeHandler(Method H::*method, HandlerOptions options) {
  static_assert(std::is_function_v<Method>, "AddHandler expects a member function");
  using Traits = MethodTraits<Method>;
  using M = typename Traits::Message;
  using R = typename Traits::Return;

  HandlerDescriptor descriptor;
  descriptor.message_type = &TypeInfo::Get<M>();
  descriptor.handler_type = &TypeInfo::Get<H>();
  descriptor.name = options.name.empty() ? TypeInfo::Get<H>().name() : std::move(options.name);
  descriptor.invoke = [method](void *instance, CallContext &ctx) -> Value {
    H &self = *static_cast<H *>(instance);
    const M &message = MessageArg<M>(ctx);
    return ToValue<R>([&]() -> R {
      if constexpr (Traits::takes_context) {
        return (self.*method)(message, ctx);
      } else {
        return (self.*method)(message);
      }
    });
  };
  descriptor.is_async = FutureTraits<R>::is_future;
  descriptor.order = options.order;
  descriptor.lifetime = options.lifetime;
  descriptor.returns_tuple = ReturnsTuple<R>();
  descriptor.result_type_name = ResultTypeName<R>();
  descriptor.factory = DefaultFactory<H>(std::move(options.factory));
  descriptor.use_middleware = std::move(options.use_middleware);
  return descriptor;
}

// "ns::Envelope<int>" -> "ns::Envelope"
inline std::string TemplateName(const std::string &closed) {
  return closed.substr(0, closed.find('<'));
}

// Closer building H<A> as the handler of F<A>
template <template <typename> class H, template <typename> class F, typename A>
GenericHandlerDescriptor::Closer CloseOver(const HandlerOptions &options) {
  using Handler = H<A>;
  using Traits = MethodTraits<typename MemberFunction<decltype(&Handler::Handle)>::type>;
  static_assert(std::is_same_v<typename Traits::Message, F<A>>,
                "a generic handler H<T> must handle F<T>");

  const TypeInfo &message = TypeInfo::Get<F<A>>();
  GenericHandlerDescriptor::Closer closer{message.id(), message.name(),
                                          std::is_default_constructible_v<Handler>, nullptr};
  closer.close = [options]() {
    HandlerOptions closed = options;
    if (!closed.name.empty()) {
      closed.name += "<" + TypeInfo::Get<A>().name() + ">";
    }
    return DescribeHandler(&Handler::Handle, std::move(closed));
  };
  return closer;
}

} // namespace detail

/**
 * HandlerRegistry::Builder - collects registrations at startup
 *
 * Registration errors (empty name, missing callable, no way to build a
 * Lifetime::Default instance) throw std::invalid_argument.
 */
class HandlerRegistry::Builder {
public:
  Builder() = default;

  /**
   * Register a member function handler
   *
   * Accepted shapes (const or not):
   *   R Handle(const M&)
   *   R Handle(const M&, CallContext&)
   * where R is void, any value, a std::tuple (cascading), or std::future<...>
   * (asynchronous handler).
   */
  template <typename H, typename Method>
  Builder &AddHandler(Method H::*method, HandlerOptions options = {});

  // Register a free callable handling M; no instance is created
  template <typename M, typename F> Builder &AddFunction(F &&function, HandlerOptions options = {});

  /**
   * Register a handler template for a family of message templates
   *
   * H<A>::Handle(const F<A>&[, CallContext&]) handles F<A> for every listed
   * argument A. Closed handlers are built the first time their message type
   * is looked up, then cached. options.name, when set, becomes "name<A>".
   * A factory cannot serve every closed type and is rejected.
   *
   *   builder.AddGenericHandler<AuditHandler, Audited, Order, Invoice>();
   */
  template <template <typename> class H, template <typename> class F, typename... Args>
  Builder &AddGenericHandler(HandlerOptions options = {});

  /**
   * Register middleware for messages assignable to M (Value = every message)
   *
   * Phases are detected from the members Mw declares:
   *   Before(const M&, CallContext&)  -> void | HandlerResult | state value
   *   After(const M&, CallContext&)
   *   Finally(const M&, CallContext&)
   *   Execute(const M&, CallContext&, const Next&) -> Value
   * Any phase may return std::future<...> instead, which marks it asynchronous.
   */
  template <typename Mw, typename M = Value> Builder &AddMiddleware(MiddlewareOptions options = {});

  Builder &Add(HandlerDescriptor descriptor);
  Builder &Add(MiddlewareDescriptor descriptor);
  Builder &Add(GenericHandlerDescriptor descriptor);

  size_t handler_count() const { return handlers_.size(); }
  size_t middleware_count() const { return middleware_.size(); }
  size_t generic_handler_count() const { return generic_.size(); }

  // Freeze registrations. The builder is left empty.
  std::shared_ptr<const HandlerRegistry> Build();

private:
  std::vector<HandlerDescriptor> handlers_;
  std::vector<MiddlewareDescriptor> middleware_;
  std::vector<GenericHandlerDescriptor> generic_;
};

template <typename H, typename Method>
HandlerRegistry::Builder &HandlerRegistry::Builder::AddHandler(Method H::*method,
                                                               HandlerOptions options) {
  return Add(detail::DescribeHandler(method, std::move(options)));
}

template <template <typename> class H, template <typename> class F, typename... Args>
HandlerRegistry::Builder &HandlerRegistry::Builder::AddGenericHandler(HandlerOptions options) {
  static_assert(sizeof...(Args) > 0, "list the argument types H is closed over");
  using First = std::tuple_element_t<0, std::tuple<Args...>>;

  if (options.factory) {
    throw std::invalid_argument("generic handler " +
                                detail::TemplateName(TypeInfo::Get<H<First>>().name()) +
                                " cannot take a factory");
  }

  GenericHandlerDescriptor descriptor;
  descriptor.family = std::type_index(typeid(GenericFamily<F>));
  descriptor.family_name = detail::TemplateName(TypeInfo::Get<F<First>>().name());
  descriptor.name = options.name.empty()
                        ? detail::TemplateName(TypeInfo::Get<H<First>>().name()) + "<*>"
                        : options.name + "<*>";
  descriptor.order = options.order;
  descriptor.lifetime = options.lifetime;
  (descriptor.closers.push_back(detail::CloseOver<H, F, Args>(options)), ...);
  return Add(std::move(descriptor));
}

template <typename M, typename F>
HandlerRegistry::Builder &HandlerRegistry::Builder::AddFunction(F &&function,
                                                                HandlerOptions options) {
  using Fn = std::decay_t<F>;
  constexpr bool takes_context = std::is_invocable_v<Fn &, const M &, CallContext &>;
  static_assert(takes_context || std::is_invocable_v<Fn &, const M &>,
                "function handlers take (const M&) or (const M&, CallContext&)");
  using R = typename std::conditional_t<takes_context,
                                        std::invoke_result<Fn &, const M &, CallContext &>,
                                        std::invoke_result<Fn &, const M &>>::type;

  HandlerDescriptor descriptor;
  descriptor.message_type = &TypeInfo::Get<M>();
  descriptor.name = options.name.empty() ? "function<" + TypeInfo::Get<M>().name() + ">"
                                         : std::move(options.name);
  descriptor.invoke = [fn = Fn(std::forward<F>(function))](void *, CallContext &ctx) mutable -> Value {
    const M &message = detail::MessageArg<M>(ctx);
    return detail::ToValue<R>([&]() -> R {
      if constexpr (takes_context) {
        return fn(message, ctx);
      } else {
        return fn(message);
      }
    });
  };
  descriptor.is_async = detail::FutureTraits<R>::is_future;
  descriptor.order = options.order;
  descriptor.lifetime = Lifetime::Default;
  descriptor.returns_tuple = detail::ReturnsTuple<R>();
  descriptor.result_type_name = detail::ResultTypeName<R>();
  descriptor.use_middleware = std::move(options.use_middleware);
  return Add(std::move(descriptor));
}

template <typename Mw, typename M>
HandlerRegistry::Builder &HandlerRegistry::Builder::AddMiddleware(MiddlewareOptions options) {
  constexpr bool has_before = detail::HasBefore<Mw, M>;
  constexpr bool has_after = detail::HasAfter<Mw, M>;
  constexpr bool has_finally = detail::HasFinally<Mw, M>;
  constexpr bool has_execute = detail::HasExecute<Mw, M>;
  static_assert(has_before || has_after || has_finally || has_execute,
                "middleware must declare Before, After, Finally or Execute");

  MiddlewareDescriptor descriptor;
  descriptor.name = options.name.empty() ? TypeInfo::Get<Mw>().name() : std::move(options.name);
  descriptor.middleware_type = &TypeInfo::Get<Mw>();
  if constexpr (!std::is_same_v<M, Value>) {
    descriptor.applies_to = &TypeInfo::Get<M>();
  }
  descriptor.order = options.order;
  descriptor.lifetime = options.lifetime;
  descriptor.explicit_only = options.explicit_only;
  descriptor.factory = detail::DefaultFactory<Mw>(std::move(options.factory));

  if constexpr (has_before) {
    using R = decltype(std::declval<Mw &>().Before(std::declval<const M &>(),
                                                   std::declval<CallContext &>()));
    descriptor.before_async = detail::FutureTraits<R>::is_future;
    descriptor.before = [](void *instance, CallContext &ctx) -> HandlerResult {
      Mw &self = *static_cast<Mw *>(instance);
      const M &message = detail::MessageArg<M>(ctx);
      return detail::ToHandlerResult<R>([&]() -> R { return self.Before(message, ctx); });
    };
  }
  if constexpr (has_after) {
    using R = decltype(std::declval<Mw &>().After(std::declval<const M &>(),
                                                  std::declval<CallContext &>()));
    descriptor.after_async = detail::FutureTraits<R>::is_future;
    descriptor.after = [](void *instance, CallContext &ctx) {
      Mw &self = *static_cast<Mw *>(instance);
      const M &message = detail::MessageArg<M>(ctx);
      detail::ToValue<R>([&]() -> R { return self.After(message, ctx); });
    };
  }
  if constexpr (has_finally) {
    using R = decltype(std::declval<Mw &>().Finally(std::declval<const M &>(),
                                                    std::declval<CallContext &>()));
    descriptor.finally_async = detail::FutureTraits<R>::is_future;
    descriptor.finally = [](void *instance, CallContext &ctx) {
      Mw &self = *static_cast<Mw *>(instance);
      const M &message = detail::MessageArg<M>(ctx);
      detail::ToValue<R>([&]() -> R { return self.Finally(message, ctx); });
    };
  }
  if constexpr (has_execute) {
    using R = decltype(std::declval<Mw &>().Execute(
        std::declval<const M &>(), std::declval<CallContext &>(), std::declval<const Next &>()));
    descriptor.execute_async = detail::FutureTraits<R>::is_future;
    descriptor.execute = [](void *instance, CallContext &ctx, const Next &next) -> Value {
      Mw &self = *static_cast<Mw *>(instance);
      const M &message = detail::MessageArg<M>(ctx);
      return detail::ToValue<R>([&]() -> R { return self.Execute(message, ctx, next); });
    };
  }
  return Add(std::move(descriptor));
}

} // namespace dispatch
} // namespace courier
