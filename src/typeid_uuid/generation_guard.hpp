#pragma once

#include <boost/uuid/uuid.hpp>
#include <exception>
#include <spdlog/spdlog.h>
#include <string_view>

namespace typeid_uuid::detail {

/**
 * @brief Runs a Boost.UUID generation call, logging any failure before rethrowing it.
 *
 * @param scheme Scheme name used in the log line
 * @param generate Callable returning a boost::uuids::uuid
 * @return The generated identifier
 */
template<typename Generate> auto logged_generate(std::string_view scheme, Generate &&generate) -> boost::uuids::uuid
{
  try {
    return generate();
  } catch (const std::exception &e) {
    spdlog::error("[versions] {} uuid generation failed: {}", scheme, e.what());
    throw;
  }
}

}// namespace typeid_uuid::detail
