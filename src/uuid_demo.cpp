#include "internal_use_only/config.hpp"

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <typeid_uuid/uuid_format.hpp>
#include <typeid_uuid/versions.hpp>
#include <variant>
#include <vector>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main() -> int
{
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::cfg::load_env_levels();

  fmt::print("{} v{}\n\n", typeid_uuid::cmake::project_name, typeid_uuid::cmake::project_version);

  const std::vector<typeid_uuid::any_version> ids = { typeid_uuid::time_based{},
    typeid_uuid::name_based_md5{},
    typeid_uuid::random_based{},
    typeid_uuid::name_based_sha1{},
    typeid_uuid::reordered_time{},
    typeid_uuid::time_ordered{},
    typeid_uuid::nil{} };

  for (const auto &id : ids) {
    std::visit([](const auto &alt) { fmt::print("{:<16}{}\n", alt.scheme_name, alt); }, id);
  }

  spdlog::debug("Printed {} identifiers", ids.size());
  return 0;
}
