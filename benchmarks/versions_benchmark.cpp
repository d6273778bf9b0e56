#include <boost/uuid/name_generator.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <typeid_uuid/versions.hpp>

namespace typeid_uuid::test {

TEST_CASE("Identifier Generation Benchmarks", "[benchmark][versions]")
{
  SECTION("Time-based schemes")
  {
    BENCHMARK("Generate v1") { return time_based{}; };
    BENCHMARK("Generate v6") { return reordered_time{}; };
    BENCHMARK("Generate v7") { return time_ordered{}; };
  }

  SECTION("Random scheme")
  {
    BENCHMARK("Generate v4") { return random_based{}; };
  }

  SECTION("Name-based schemes")
  {
    BENCHMARK("Generate v3") { return name_based_md5(boost::uuids::ns::dns(), "www.example.com"); };
    BENCHMARK("Generate v5") { return name_based_sha1(boost::uuids::ns::dns(), "www.example.com"); };
  }
}

}// namespace typeid_uuid::test
