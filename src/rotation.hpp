#pragma once

#include <cstdint>

namespace log_collector {

enum class RotationDecision {
    Continue,                 // Seek to the stored offset and read forward
    ResetAndReadFromStart     // Seek to 0 and set the stored offset to 0 first
};

// Size-shrink heuristic: a file whose current size is below the last read
// offset was truncated or replaced. A file truncated and rewritten past the
// old offset between two passes cannot be told apart from ordinary growth
// and yields Continue. TailReader catches replacement by a new inode
// before consulting this.
RotationDecision decide_rotation(std::uint64_t last_offset, std::uint64_t current_size);

} // namespace log_collector
