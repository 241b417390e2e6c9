#include "core/types.hpp"

#include <type_traits>

namespace lockbox {

// Uuid and Timestamp are copied freely through the tree and the ledger.
static_assert(sizeof(Uuid) == Uuid::BYTE_SIZE, "Uuid must be exactly its bytes");
static_assert(std::is_trivially_copyable_v<Uuid>);
static_assert(std::is_trivially_copyable_v<Timestamp>);
static_assert(!ROOT_GROUP_ID.is_nil(), "root group identity must not be nil");
static_assert((ROOT_GROUP_ID.bytes()[8] & 0xC0) == 0x80, "root group identity must use the RFC 4122 variant");

} // namespace lockbox
