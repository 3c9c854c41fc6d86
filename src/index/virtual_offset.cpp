// =============================================================================
// bamseek - Virtual Offset Implementation
// =============================================================================

#include "bamseek/index/virtual_offset.h"

#include <format>

namespace bamseek::index {

Result<VirtualOffset> VirtualOffset::fromParts(BlockAddress blockAddress,
                                               BlockOffset offsetInBlock) {
    if (blockAddress > kMaxBlockAddress) {
        return makeError<VirtualOffset>(
            ErrorCode::kInvalidArgument,
            std::format("block address {} does not fit in a virtual offset", blockAddress));
    }
    return VirtualOffset{blockAddress, offsetInBlock};
}

std::string VirtualOffset::toString() const {
    return std::format("{}:{}", blockAddress, offsetInBlock);
}

}  // namespace bamseek::index
