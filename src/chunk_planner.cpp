#include "mpupload/chunk_planner.hpp"
#include "mpupload/constants.hpp"
#include "mpupload/errors.hpp"

#include <algorithm>
#include <string>

namespace mpupload {

namespace {

uint64_t ceil_div(uint64_t a, uint64_t b) {
    return a / b + (a % b != 0 ? 1 : 0);
}

}  // namespace

uint64_t default_part_size(uint64_t file_size) {
    uint64_t required = ceil_div(file_size, constants::MAX_PARTS);
    return std::max({constants::DEFAULT_PART_SIZE, constants::MIN_PART_SIZE, required});
}

UploadPlan plan_upload(uint64_t file_size, std::optional<uint64_t> requested_part_size) {
    if (file_size == 0) {
        throw ConfigError("File is empty; nothing to upload");
    }

    uint64_t part_size = requested_part_size.value_or(default_part_size(file_size));

    if (part_size < constants::MIN_PART_SIZE) {
        throw ConfigError("chunk_size must be at least " +
                          std::to_string(constants::MIN_PART_SIZE) + " bytes (5MB)");
    }
    if (part_size > constants::MAX_PART_SIZE) {
        throw ConfigError("chunk_size must be <= " +
                          std::to_string(constants::MAX_PART_SIZE) + " bytes (5GB)");
    }

    uint64_t total_parts = ceil_div(file_size, part_size);
    if (total_parts > constants::MAX_PARTS) {
        throw ConfigError("Upload would require " + std::to_string(total_parts) +
                          " parts; increase chunk_size to keep parts <= " +
                          std::to_string(constants::MAX_PARTS));
    }

    UploadPlan plan;
    plan.file_size = file_size;
    plan.part_size = part_size;
    plan.total_parts = static_cast<uint32_t>(total_parts);
    return plan;
}

std::vector<PartTask> make_part_tasks(const UploadPlan& plan) {
    std::vector<PartTask> tasks;
    tasks.reserve(plan.total_parts);
    for (uint32_t n = 1; n <= plan.total_parts; ++n) {
        PartTask task;
        task.part_number = n;
        task.byte_offset = static_cast<uint64_t>(n - 1) * plan.part_size;
        task.byte_length = std::min(plan.part_size, plan.file_size - task.byte_offset);
        tasks.push_back(task);
    }
    return tasks;
}

int completion_timeout_seconds(uint64_t file_size) {
    constexpr uint64_t GIB = 1024ULL * 1024 * 1024;
    uint64_t gib = ceil_div(file_size, GIB);
    uint64_t scaled = gib * constants::COMPLETION_SECONDS_PER_GIB;
    return static_cast<int>(std::max<uint64_t>(constants::MIN_COMPLETION_TIMEOUT_SECONDS, scaled));
}

}  // namespace mpupload
