#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace mpupload {

/// How a file is cut into parts. Immutable once computed.
struct UploadPlan {
    uint64_t file_size = 0;
    uint64_t part_size = 0;
    uint32_t total_parts = 0;

    bool operator==(const UploadPlan&) const = default;
};

/// One byte range of the source file, uploaded as one part.
struct PartTask {
    uint32_t part_number = 0;  // 1-based
    uint64_t byte_offset = 0;
    uint64_t byte_length = 0;
};

/// Default part size for a file: the larger of the fixed default and the
/// size that keeps the part count within the protocol limit.
uint64_t default_part_size(uint64_t file_size);

/// Compute the plan for a file. Throws ConfigError when file_size is zero,
/// when a requested part size is outside [5 MiB, 5 GiB], or when the part
/// count would exceed 10000.
UploadPlan plan_upload(uint64_t file_size,
                       std::optional<uint64_t> requested_part_size = std::nullopt);

/// All part tasks for a plan, in part-number order. Only the last part may
/// be shorter than part_size.
std::vector<PartTask> make_part_tasks(const UploadPlan& plan);

/// Finalize grace in seconds: max(60, 5 * ceil(file_size in GiB)).
int completion_timeout_seconds(uint64_t file_size);

}  // namespace mpupload
