#pragma once

#include "analytics_cache/cache_store.hpp"
#include "analytics_cache/key_codec.hpp"

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace analytics_cache {

template <typename Signature> struct MemoizeOptions;

template <typename R, typename... Args> struct MemoizeOptions<R(Args...)> {
  std::string name_space{"memoized"};
  std::optional<Duration> ttl;
  std::vector<std::string> dependencies;
  // Defaults to generate_key(name_space, [args...]), which needs every
  // argument to be convertible to Json.
  std::function<std::string(const std::decay_t<Args> &...)> key_generator;
};

namespace detail {

template <typename R, typename... Args>
std::string memo_key(const MemoizeOptions<R(Args...)> &opts,
                     const std::decay_t<Args> &...args) {
  if (opts.key_generator)
    return opts.key_generator(args...);
  return generate_key(opts.name_space, Json::array({Json(args)...}));
}

template <typename Signature> struct Memoizer;

template <typename R, typename... Args> struct Memoizer<R(Args...)> {
  using Options = MemoizeOptions<R(Args...)>;

  template <typename Fn>
  static std::function<R(Args...)> wrap(CacheStore &store, Fn fn,
                                        Options opts) {
    return [&store, fn = std::move(fn), opts = std::move(opts)](
               Args... args) -> R {
      const auto key = memo_key<R, Args...>(opts, args...);
      if (auto cached = store.get<R>(key))
        return std::move(*cached);
      R result = fn(args...);
      store.set(key, result, SetOptions{opts.ttl, opts.dependencies});
      return result;
    };
  }

  template <typename Fn>
  static std::function<std::shared_future<R>(Args...)>
  wrap_async(CacheStore &store, Fn fn, Options opts) {
    auto shared_fn = std::make_shared<Fn>(std::move(fn));
    return [&store, shared_fn, opts = std::move(opts)](
               Args... args) -> std::shared_future<R> {
      const auto key = memo_key<R, Args...>(opts, args...);
      auto promise = std::make_shared<std::promise<R>>();
      std::shared_future<R> pending = promise->get_future().share();

      JsonAdopter adopt = nullptr;
      if constexpr (json_convertible_v<R>)
        adopt = &ready_future_from<R>;
      std::uint64_t generation = 0;
      auto cached = store.get_or_claim(
          key, typeid(std::shared_future<R>), make_value(pending),
          SetOptions{opts.ttl, opts.dependencies}, &generation, adopt);
      if (cached.has_value())
        return std::any_cast<std::shared_future<R>>(*cached);

      auto task = [&store, shared_fn, key, generation, promise,
                   args...]() mutable {
        try {
          promise->set_value((*shared_fn)(args...));
        } catch (...) {
          // Free the slot before the failure becomes visible so a retry
          // recomputes.
          store.del_generation(key, generation);
          promise->set_exception(std::current_exception());
        }
      };
      // Nested calls from a worker run inline so a blocking get() on the
      // result cannot wait on a task queued behind its own worker.
      if (store.workers().on_worker_thread() ||
          !store.workers().enqueue(task))
        task();
      return pending;
    };
  }
};

} // namespace detail

// Returns a callable with the given signature that serves repeated calls
// from store. Exceptions from fn propagate and nothing is cached for them.
// store must outlive the returned callable.
template <typename Signature, typename Fn>
std::function<Signature> memoize(CacheStore &store, Fn fn,
                                 MemoizeOptions<Signature> opts = {}) {
  return detail::Memoizer<Signature>::wrap(store, std::move(fn),
                                           std::move(opts));
}

/**
 * Asynchronous memoization with single-flight.
 *
 * fn runs on the store's worker pool; the pending shared_future is cached
 * as soon as the call claims the slot, so overlapping calls with the same
 * key share one computation. A failed computation is removed from the
 * store before its exception is delivered.
 *
 * Signature is the signature of fn, e.g. memoize_async<Json(int)>; the
 * wrapper returns std::shared_future<R>.
 */
template <typename Signature, typename Fn>
auto memoize_async(CacheStore &store, Fn fn,
                   MemoizeOptions<Signature> opts = {}) {
  return detail::Memoizer<Signature>::wrap_async(store, std::move(fn),
                                                 std::move(opts));
}

// Get-or-compute for a single key.
template <typename T, typename Fn>
T fetch(CacheStore &store, const std::string &key, Fn compute,
        const SetOptions &opts = {}) {
  if (auto cached = store.get<T>(key))
    return std::move(*cached);
  T value = compute();
  store.set(key, value, opts);
  return value;
}

} // namespace analytics_cache
