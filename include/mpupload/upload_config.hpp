#pragma once

#include "mpupload/constants.hpp"
#include "mpupload/s3_store.hpp"
#include "mpupload/uploader.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mpupload {

/// Configuration for one mpupload run.
/// Sources, highest precedence first: CLI flags, JSON config file,
/// environment variables, built-in defaults.
struct UploadConfig {
    // Target
    std::string bucket;
    std::string key;
    std::filesystem::path file_path;
    std::optional<std::string> content_type;

    // Endpoint and credentials
    std::string region;
    std::string endpoint;       // Empty for AWS
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    bool path_style = false;
    bool verify_ssl = true;
    std::string ca_cert;

    // Upload tuning
    std::optional<uint64_t> chunk_size;  // Bytes; planner default when unset
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    int workers = constants::DEFAULT_WORKERS;

    // Output
    bool quiet = false;
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    std::filesystem::path config_path;

    /// Parse configuration from command line arguments, layered over the
    /// JSON file named by --config (or MPUPLOAD_CONFIG) and the environment.
    /// Returns empty optional on error or --help (message already printed).
    static std::optional<UploadConfig> from_args(int argc, char* argv[]);

    /// Overlay values from environment variables that are set.
    void load_env();

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate required fields and the upload plan. Returns error message
    /// or empty string.
    std::string validate() const;

    S3ObjectStore::Config to_store_config() const;
    UploadRequest to_upload_request() const;
    UploaderOptions to_uploader_options() const;
};

/// "****" for non-empty secrets, "(not set)" otherwise.
std::string mask_secret(const std::string& value);

}  // namespace mpupload
