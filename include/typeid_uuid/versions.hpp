#pragma once

#include <boost/container_hash/hash.hpp>
#include <boost/uuid/uuid.hpp>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <type_traits>
#include <typeid_uuid/concepts/uuid_version.hpp>
#include <variant>

namespace typeid_uuid {

inline constexpr std::size_t uuid_size = 16;

/**
 * @brief Generation schemes, one tag per UUID version.
 *
 * Each tag names its version number and forwards generation to Boost.UUID.
 * Stateful generators are kept per thread inside the implementation.
 */
namespace schemes {

  struct time_based
  {
    static constexpr int version = 1;
    static constexpr std::string_view scheme_name = "time_based";
    [[nodiscard]] static auto generate() -> boost::uuids::uuid;
  };

  struct name_based_md5
  {
    static constexpr int version = 3;
    static constexpr std::string_view scheme_name = "name_based_md5";
    /// Hashes the DNS namespace with an empty name.
    [[nodiscard]] static auto generate() -> boost::uuids::uuid;
    [[nodiscard]] static auto generate(const boost::uuids::uuid &name_space, std::string_view name)
      -> boost::uuids::uuid;
  };

  struct random_based
  {
    static constexpr int version = 4;
    static constexpr std::string_view scheme_name = "random_based";
    [[nodiscard]] static auto generate() -> boost::uuids::uuid;
  };

  struct name_based_sha1
  {
    static constexpr int version = 5;
    static constexpr std::string_view scheme_name = "name_based_sha1";
    /// Hashes the DNS namespace with an empty name.
    [[nodiscard]] static auto generate() -> boost::uuids::uuid;
    [[nodiscard]] static auto generate(const boost::uuids::uuid &name_space, std::string_view name)
      -> boost::uuids::uuid;
  };

  struct reordered_time
  {
    static constexpr int version = 6;
    static constexpr std::string_view scheme_name = "reordered_time";
    [[nodiscard]] static auto generate() -> boost::uuids::uuid;
  };

  struct time_ordered
  {
    static constexpr int version = 7;
    static constexpr std::string_view scheme_name = "time_ordered";
    [[nodiscard]] static auto generate() -> boost::uuids::uuid;
  };

  struct nil
  {
    static constexpr int version = 0;
    static constexpr std::string_view scheme_name = "nil";
    [[nodiscard]] static auto generate() noexcept -> boost::uuids::uuid;
  };

}// namespace schemes

/**
 * @brief A UUID tagged with the scheme that generated it.
 *
 * Default construction generates a new value with the scheme. The payload is fixed at
 * construction and only read access is exposed.
 *
 * @tparam Scheme Generation scheme tag from typeid_uuid::schemes
 */
template<typename Scheme> class versioned_uuid
{
public:
  using scheme_type = Scheme;

  static constexpr int version = Scheme::version;
  static constexpr std::string_view scheme_name = Scheme::scheme_name;

  /**
   * @brief Generates a new identifier with the scheme.
   *
   * Exceptions from Boost.UUID (entropy or clock failures) propagate unchanged.
   */
  versioned_uuid() : value_(Scheme::generate()) {}

  /**
   * @brief Wraps an existing identifier. The version bits are not checked.
   *
   * Not available for nil, whose payload is always all zero.
   *
   * @param value Identifier to wrap
   */
  explicit versioned_uuid(const boost::uuids::uuid &value) noexcept
    requires(!std::same_as<Scheme, schemes::nil>)
    : value_(value)
  {}

  /**
   * @brief Generates a name-based identifier from a caller-supplied namespace and name.
   *
   * @param name_space Namespace identifier (e.g. boost::uuids::ns::dns())
   * @param name Name hashed together with the namespace
   */
  versioned_uuid(const boost::uuids::uuid &name_space, std::string_view name)
    requires concepts::name_based_scheme<Scheme>
    : value_(Scheme::generate(name_space, name))
  {}

  [[nodiscard]] auto get() const noexcept -> const boost::uuids::uuid & { return value_; }

  [[nodiscard]] auto operator*() const noexcept -> const boost::uuids::uuid & { return value_; }

  [[nodiscard]] auto operator->() const noexcept -> const boost::uuids::uuid * { return &value_; }

  [[nodiscard]] auto bytes() const noexcept -> std::span<const std::uint8_t, uuid_size>
  {
    return std::span<const std::uint8_t, uuid_size>(value_.begin(), uuid_size);
  }

  friend auto operator==(const versioned_uuid &lhs, const versioned_uuid &rhs) noexcept -> bool
  {
    return lhs.value_ == rhs.value_;
  }

  friend auto operator<(const versioned_uuid &lhs, const versioned_uuid &rhs) noexcept -> bool
  {
    return lhs.value_ < rhs.value_;
  }

private:
  boost::uuids::uuid value_;
};

using time_based = versioned_uuid<schemes::time_based>;
using name_based_md5 = versioned_uuid<schemes::name_based_md5>;
using random_based = versioned_uuid<schemes::random_based>;
using name_based_sha1 = versioned_uuid<schemes::name_based_sha1>;
using reordered_time = versioned_uuid<schemes::reordered_time>;
using time_ordered = versioned_uuid<schemes::time_ordered>;
using nil = versioned_uuid<schemes::nil>;

using v1 = time_based;
using v3 = name_based_md5;
using v4 = random_based;
using v5 = name_based_sha1;
using v6 = reordered_time;
using v7 = time_ordered;

/**
 * @brief Closed set of all identifier variants.
 */
using any_version =
  std::variant<time_based, name_based_md5, random_based, name_based_sha1, reordered_time, time_ordered, nil>;

[[nodiscard]] inline auto as_uuid(const any_version &id) -> const boost::uuids::uuid &
{
  return std::visit([](const auto &alt) -> const boost::uuids::uuid & { return alt.get(); }, id);
}

[[nodiscard]] inline auto version_of(const any_version &id) -> int
{
  return std::visit([](const auto &alt) { return std::remove_cvref_t<decltype(alt)>::version; }, id);
}

}// namespace typeid_uuid

namespace std {

template<typename Scheme> struct hash<typeid_uuid::versioned_uuid<Scheme>>
{
  auto operator()(const typeid_uuid::versioned_uuid<Scheme> &id) const noexcept -> std::size_t
  {
    return boost::hash<boost::uuids::uuid>{}(id.get());
  }
};

}// namespace std
