#pragma once

#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <typeid_uuid/concepts/uuid_version.hpp>

namespace typeid_uuid {

/**
 * @brief Formats an identifier in canonical form.
 *
 * @param id Identifier of any version
 * @return Lowercase "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" string
 */
template<concepts::uuid_version T> [[nodiscard]] auto to_string(const T &id) -> std::string
{
  return boost::uuids::to_string(id.get());
}

}// namespace typeid_uuid

namespace fmt {

template<typeid_uuid::concepts::uuid_version T> struct formatter<T> : formatter<std::string_view>
{
  template<typename FormatContext> auto format(const T &id, FormatContext &ctx) const -> decltype(ctx.out())
  {
    return formatter<std::string_view>::format(typeid_uuid::to_string(id), ctx);
  }
};

}// namespace fmt
