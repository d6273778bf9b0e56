#include <boost/uuid/name_generator.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <typeid_uuid/versions.hpp>

// Fuzzer that hashes arbitrary names under both name-based schemes
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string_view name(reinterpret_cast<const char *>(Data), Size);

  const typeid_uuid::name_based_md5 md5(boost::uuids::ns::url(), name);
  const typeid_uuid::name_based_sha1 sha1(boost::uuids::ns::url(), name);

  // Hashing the same input twice must give the same identifier
  if (md5 != typeid_uuid::name_based_md5(boost::uuids::ns::url(), name)) { std::abort(); }
  if (sha1 != typeid_uuid::name_based_sha1(boost::uuids::ns::url(), name)) { std::abort(); }

  return 0;
}
