#include <boost/uuid/uuid.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeid_uuid/concepts/uuid_version.hpp>
#include <typeid_uuid/versions.hpp>
#include <utility>

using namespace typeid_uuid;

namespace {

template<concepts::uuid_version T> auto first_byte(const T &id) -> std::uint8_t { return id.bytes()[0]; }

}// namespace

TEST_CASE("all variants satisfy the uuid_version concept", "[concepts][versions]")
{
  STATIC_REQUIRE(concepts::uuid_version<time_based>);
  STATIC_REQUIRE(concepts::uuid_version<name_based_md5>);
  STATIC_REQUIRE(concepts::uuid_version<random_based>);
  STATIC_REQUIRE(concepts::uuid_version<name_based_sha1>);
  STATIC_REQUIRE(concepts::uuid_version<reordered_time>);
  STATIC_REQUIRE(concepts::uuid_version<time_ordered>);
  STATIC_REQUIRE(concepts::uuid_version<nil>);
}

TEST_CASE("unrelated types do not satisfy the uuid_version concept", "[concepts]")
{
  STATIC_REQUIRE_FALSE(concepts::uuid_version<boost::uuids::uuid>);
  STATIC_REQUIRE_FALSE(concepts::uuid_version<std::string>);
  STATIC_REQUIRE_FALSE(concepts::uuid_version<int>);
}

TEST_CASE("each scheme is a distinct type", "[concepts][versions]")
{
  STATIC_REQUIRE_FALSE(std::is_same_v<time_based, reordered_time>);
  STATIC_REQUIRE_FALSE(std::is_same_v<name_based_md5, name_based_sha1>);
  STATIC_REQUIRE_FALSE(std::is_same_v<random_based, time_ordered>);
  STATIC_REQUIRE_FALSE(std::is_convertible_v<random_based, time_ordered>);
  STATIC_REQUIRE_FALSE(std::is_convertible_v<boost::uuids::uuid, random_based>);
}

TEST_CASE("only name-based schemes take a namespace and name", "[concepts][versions]")
{
  STATIC_REQUIRE(concepts::name_based_scheme<schemes::name_based_md5>);
  STATIC_REQUIRE(concepts::name_based_scheme<schemes::name_based_sha1>);
  STATIC_REQUIRE_FALSE(concepts::name_based_scheme<schemes::random_based>);
  STATIC_REQUIRE_FALSE(concepts::name_based_scheme<schemes::time_ordered>);

  STATIC_REQUIRE(std::is_constructible_v<name_based_md5, const boost::uuids::uuid &, std::string_view>);
  STATIC_REQUIRE(std::is_constructible_v<name_based_sha1, const boost::uuids::uuid &, std::string_view>);
  STATIC_REQUIRE_FALSE(std::is_constructible_v<random_based, const boost::uuids::uuid &, std::string_view>);
  STATIC_REQUIRE_FALSE(std::is_constructible_v<nil, const boost::uuids::uuid &, std::string_view>);
}

TEST_CASE("nil cannot wrap an arbitrary identifier", "[concepts][versions][nil]")
{
  STATIC_REQUIRE_FALSE(std::is_constructible_v<nil, const boost::uuids::uuid &>);
  STATIC_REQUIRE(std::is_constructible_v<random_based, const boost::uuids::uuid &>);
  STATIC_REQUIRE(std::is_constructible_v<time_ordered, const boost::uuids::uuid &>);
}

TEST_CASE("read access is const only", "[concepts][versions]")
{
  STATIC_REQUIRE(std::is_same_v<decltype(*std::declval<random_based &>()), const boost::uuids::uuid &>);
  STATIC_REQUIRE(std::is_same_v<decltype(std::declval<random_based &>().get()), const boost::uuids::uuid &>);
  STATIC_REQUIRE(std::is_same_v<decltype(std::declval<random_based &>().operator->()), const boost::uuids::uuid *>);
}

TEST_CASE("generic code accepts any variant", "[concepts][versions]")
{
  CHECK(first_byte(nil{}) == 0x00U);
  CHECK(first_byte(name_based_sha1{}) == *name_based_sha1{}.get().begin());
}
