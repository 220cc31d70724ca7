#include "rotation.hpp"

namespace log_collector {

RotationDecision decide_rotation(std::uint64_t last_offset, std::uint64_t current_size) {
    if (current_size < last_offset) {
        return RotationDecision::ResetAndReadFromStart;
    }
    return RotationDecision::Continue;
}

} // namespace log_collector
