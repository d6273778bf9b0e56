#include <typeid_uuid/versions.hpp>

#include "generation_guard.hpp"

#include <boost/uuid/name_generator.hpp>
#include <boost/uuid/name_generator_md5.hpp>
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/time_generator_v1.hpp>
#include <boost/uuid/time_generator_v6.hpp>
#include <boost/uuid/time_generator_v7.hpp>
#include <cstdint>
#include <string>

namespace typeid_uuid::schemes {

namespace {

  // v1 and v6 are generated with an all-zero node id
  constexpr boost::uuids::uuid::node_type zero_node = {};

  constexpr std::uint16_t clock_seq_mask = 0x3FFF;

  template<typename State> auto initial_time_state() -> State
  {
    // Last timestamp 0 so the first call takes the clock; random 14-bit clock sequence
    const auto seed = boost::uuids::random_generator{}();
    const auto clock_seq = static_cast<std::uint16_t>((seed.begin()[0] << 8U) | seed.begin()[1]);
    return State{ .timestamp = 0, .clock_seq = static_cast<std::uint16_t>(clock_seq & clock_seq_mask) };
  }

  template<typename Generator>
  auto hash_name(const boost::uuids::uuid &name_space, std::string_view name) -> boost::uuids::uuid
  {
    Generator gen(name_space);
    return gen(std::string(name));
  }

}// namespace

auto time_based::generate() -> boost::uuids::uuid
{
  return detail::logged_generate(scheme_name, [] {
    using generator_t = boost::uuids::time_generator_v1;
    static thread_local generator_t gen(zero_node, initial_time_state<generator_t::state_type>());
    return gen();
  });
}

auto name_based_md5::generate() -> boost::uuids::uuid { return generate(boost::uuids::ns::dns(), {}); }

auto name_based_md5::generate(const boost::uuids::uuid &name_space, std::string_view name) -> boost::uuids::uuid
{
  return hash_name<boost::uuids::name_generator_md5>(name_space, name);
}

auto random_based::generate() -> boost::uuids::uuid
{
  return detail::logged_generate(scheme_name, [] {
    static thread_local boost::uuids::random_generator gen;
    return gen();
  });
}

auto name_based_sha1::generate() -> boost::uuids::uuid { return generate(boost::uuids::ns::dns(), {}); }

auto name_based_sha1::generate(const boost::uuids::uuid &name_space, std::string_view name) -> boost::uuids::uuid
{
  return hash_name<boost::uuids::name_generator_sha1>(name_space, name);
}

auto reordered_time::generate() -> boost::uuids::uuid
{
  return detail::logged_generate(scheme_name, [] {
    using generator_t = boost::uuids::time_generator_v6;
    static thread_local generator_t gen(zero_node, initial_time_state<generator_t::state_type>());
    return gen();
  });
}

auto time_ordered::generate() -> boost::uuids::uuid
{
  return detail::logged_generate(scheme_name, [] {
    static thread_local boost::uuids::time_generator_v7 gen;
    return gen();
  });
}

auto nil::generate() noexcept -> boost::uuids::uuid { return boost::uuids::nil_uuid(); }

}// namespace typeid_uuid::schemes
