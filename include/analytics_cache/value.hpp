#pragma once

#include "analytics_cache/types.hpp"

#include <chrono>
#include <future>
#include <string>
#include <type_traits>
#include <utility>

namespace analytics_cache {
namespace detail {

template <typename T> struct is_shared_future : std::false_type {};
template <typename R>
struct is_shared_future<std::shared_future<R>> : std::true_type {
  using result_type = R;
};

template <typename T>
inline constexpr bool json_representable_v =
    !std::is_void_v<T> && std::is_constructible_v<Json, const T &>;

inline std::size_t json_size(const Json &j) {
  return j.dump(-1, ' ', false, Json::error_handler_t::replace).size();
}

template <typename T> std::size_t estimate_size(const T &v) {
  if constexpr (std::is_same_v<T, Json>)
    return json_size(v);
  else if constexpr (json_representable_v<T>)
    return json_size(Json(v));
  else
    return sizeof(T);
}

template <typename T>
inline constexpr bool json_convertible_v =
    json_representable_v<T> && !std::is_same_v<T, Json> &&
    !std::is_pointer_v<T> && std::is_default_constructible_v<T>;

template <typename T> std::optional<T> from_json_or_none(const Json &j) {
  try {
    return j.get<T>();
  } catch (const Json::exception &) {
    return std::nullopt;
  }
}

// Turns a restored JSON value into a ready shared_future<R>.
template <typename R> std::optional<std::any> ready_future_from(const Json &j) {
  auto v = from_json_or_none<R>(j);
  if (!v.has_value())
    return std::nullopt;
  std::promise<R> p;
  p.set_value(std::move(*v));
  return std::any(p.get_future().share());
}

template <typename T> std::optional<Json> snapshot_of(const std::any &a) {
  const auto *v = std::any_cast<T>(&a);
  if (v == nullptr)
    return std::nullopt;
  if constexpr (is_shared_future<T>::value) {
    using R = typename is_shared_future<T>::result_type;
    if constexpr (json_representable_v<R>) {
      // Failed computations never stay in the store, so a ready future
      // always holds a value here.
      if (!v->valid() ||
          v->wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        return std::nullopt;
      return Json(v->get());
    } else {
      return std::nullopt;
    }
  } else if constexpr (json_representable_v<T>) {
    return Json(*v);
  } else {
    return std::nullopt;
  }
}

} // namespace detail

template <typename T> Value make_value(T v) {
  Value out;
  out.size_bytes = detail::estimate_size(v);
  out.snapshot = &detail::snapshot_of<T>;
  out.data = std::move(v);
  return out;
}

inline Value make_value(const char *v) { return make_value(std::string(v)); }

} // namespace analytics_cache
