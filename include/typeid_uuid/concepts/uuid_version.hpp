#pragma once

#include <boost/uuid/uuid.hpp>
#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>

namespace typeid_uuid::concepts {

/**
 * @brief Concept defining read-only access to a UUID produced by one generation scheme.
 *
 * Types satisfying this concept wrap exactly one boost::uuids::uuid, generate a fresh
 * value when default-constructed, and expose the value without any way to mutate it.
 * The scheme is part of the type, so callers pick it at compile time.
 */
template<typename T>
concept uuid_version = std::default_initializable<T> && std::copyable<T> && requires(const T &id) {
  { T::version } -> std::convertible_to<int>;
  { id.get() } -> std::same_as<const boost::uuids::uuid &>;
  { *id } -> std::same_as<const boost::uuids::uuid &>;
  { id.operator->() } -> std::same_as<const boost::uuids::uuid *>;
  { id.bytes() } -> std::same_as<std::span<const std::uint8_t, 16>>;
};

/**
 * @brief Concept for generation schemes that hash a namespace and a name.
 */
template<typename Scheme>
concept name_based_scheme = requires(const boost::uuids::uuid &name_space, std::string_view name) {
  { Scheme::generate(name_space, name) } -> std::same_as<boost::uuids::uuid>;
};

}// namespace typeid_uuid::concepts
