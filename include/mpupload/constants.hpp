#pragma once

#include <cstddef>
#include <cstdint>

namespace mpupload::constants {

// S3 multipart protocol limits
constexpr uint64_t MIN_PART_SIZE = 5ULL * 1024 * 1024;             // 5 MiB
constexpr uint64_t MAX_PART_SIZE = 5ULL * 1024 * 1024 * 1024;      // 5 GiB
constexpr uint32_t MAX_PARTS = 10000;
constexpr uint64_t DEFAULT_PART_SIZE = 50ULL * 1024 * 1024;        // 50 MiB

// Orchestrator defaults
constexpr int DEFAULT_MAX_RETRIES = 5;
constexpr int DEFAULT_WORKERS = 4;
constexpr int MAX_RETRIES_LIMIT = 10;
constexpr int MAX_BACKOFF_EXPONENT = 10;  // longest backoff sleep is 2^10 s

// Finalize grace: max(60, 5 * ceil(size in GiB)) seconds
constexpr int MIN_COMPLETION_TIMEOUT_SECONDS = 60;
constexpr int COMPLETION_SECONDS_PER_GIB = 5;

// HTTP status codes the core classifies explicitly
constexpr int HTTP_INSUFFICIENT_STORAGE = 507;
constexpr int HTTP_ORIGIN_TIMEOUT = 524;  // proxy gave up waiting on the origin

// Transport defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 60;
constexpr int DEFAULT_READ_TIMEOUT_SECONDS = 60;
constexpr size_t MIN_IDLE_CONNECTIONS = 10;
constexpr uint32_t LIST_PARTS_PAGE_SIZE = 1000;

// Metrics
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace mpupload::constants
