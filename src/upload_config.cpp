#include "mpupload/upload_config.hpp"
#include "mpupload/chunk_planner.hpp"
#include "mpupload/constants.hpp"
#include "mpupload/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace mpupload {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: mpupload -b <bucket> -k <key> -f <file> [options]\n"
        "\n"
        "Required (flag, config file or environment):\n"
        "  -b, --bucket <name>              Target bucket\n"
        "  -k, --key <key>                  Object key\n"
        "  -f, --file <path>                Local file to upload\n"
        "  -r, --region <region>            Region (or S3_REGION / AWS_REGION env)\n"
        "  -a, --access-key <key>           Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  -s, --secret-key <key>           Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "\n"
        "Endpoint:\n"
        "  -e, --endpoint <url>             S3-compatible endpoint (or S3_ENDPOINT env)\n"
        "  --session-token <token>          Session token (or AWS_SESSION_TOKEN env)\n"
        "  --path-style                     Use path-style bucket addressing\n"
        "  --ca-cert <path>                 CA certificate bundle for SSL\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "\n"
        "Upload options:\n"
        "  --config <path>                  JSON config file (or MPUPLOAD_CONFIG env)\n"
        "  --content-type <type>            Content-Type of the object\n"
        "  -c, --chunk-size <bytes>         Part size in bytes (default: max(50MiB, size/10000))\n"
        "  -m, --max-retries <N>            Attempts per request, 1-10 (default: 5, or MAX_RETRIES env)\n"
        "  -w, --workers <N>                Concurrent part uploads (default: 4)\n"
        "\n"
        "Output:\n"
        "  -q, --quiet                      Only warnings and errors\n"
        "  -v, --verbose                    Debug output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  -h, --help                       Show this help\n";
}

// Value of --config in argv, or MPUPLOAD_CONFIG. Empty when neither is set.
std::filesystem::path find_config_path(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") return argv[i + 1];
    }
    if (const char* v = std::getenv("MPUPLOAD_CONFIG")) {
        if (*v) return v;
    }
    return {};
}

}  // namespace

std::string mask_secret(const std::string& value) {
    return value.empty() ? "(not set)" : "****";
}

std::optional<UploadConfig> UploadConfig::from_args(int argc, char* argv[]) {
    UploadConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    config.load_env();

    config.config_path = find_config_path(argc, argv);
    if (!config.config_path.empty() && !config.load_json(config.config_path)) {
        return std::nullopt;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-b" || arg == "--bucket") {
                auto* v = next_arg(i, "--bucket");
                if (!v) return std::nullopt;
                config.bucket = v;
            } else if (arg == "-k" || arg == "--key") {
                auto* v = next_arg(i, "--key");
                if (!v) return std::nullopt;
                config.key = v;
            } else if (arg == "-f" || arg == "--file") {
                auto* v = next_arg(i, "--file");
                if (!v) return std::nullopt;
                config.file_path = v;
            } else if (arg == "-r" || arg == "--region") {
                auto* v = next_arg(i, "--region");
                if (!v) return std::nullopt;
                config.region = v;
            } else if (arg == "-e" || arg == "--endpoint") {
                auto* v = next_arg(i, "--endpoint");
                if (!v) return std::nullopt;
                config.endpoint = v;
            } else if (arg == "-a" || arg == "--access-key") {
                auto* v = next_arg(i, "--access-key");
                if (!v) return std::nullopt;
                config.access_key = v;
            } else if (arg == "-s" || arg == "--secret-key") {
                auto* v = next_arg(i, "--secret-key");
                if (!v) return std::nullopt;
                config.secret_key = v;
            } else if (arg == "--session-token") {
                auto* v = next_arg(i, "--session-token");
                if (!v) return std::nullopt;
                config.session_token = v;
            } else if (arg == "--content-type") {
                auto* v = next_arg(i, "--content-type");
                if (!v) return std::nullopt;
                config.content_type = v;
            } else if (arg == "-c" || arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "-m" || arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_retries = std::stoi(v);
            } else if (arg == "-w" || arg == "--workers") {
                auto* v = next_arg(i, "--workers");
                if (!v) return std::nullopt;
                config.workers = std::stoi(v);
            } else if (arg == "--path-style") {
                config.path_style = true;
            } else if (arg == "--no-verify-ssl") {
                config.verify_ssl = false;
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.ca_cert = v;
            } else if (arg == "--config") {
                // Already loaded before the flags
                if (!next_arg(i, "--config")) return std::nullopt;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "-q" || arg == "--quiet") {
                config.quiet = true;
            } else if (arg == "-v" || arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi / std::stoull on a malformed number
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    return config;
}

void UploadConfig::load_env() {
    auto env = [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (v && *v) return std::string(v);
        return std::nullopt;
    };

    if (auto v = env("S3_REGION")) {
        region = *v;
    } else if (auto v2 = env("AWS_REGION")) {
        region = *v2;
    }
    if (auto v = env("S3_ENDPOINT")) endpoint = *v;
    if (auto v = env("AWS_ACCESS_KEY_ID")) access_key = *v;
    if (auto v = env("AWS_SECRET_ACCESS_KEY")) secret_key = *v;
    if (auto v = env("AWS_SESSION_TOKEN")) session_token = *v;
    if (auto v = env("MAX_RETRIES")) {
        try {
            max_retries = std::stoi(*v);
        } catch (const std::exception&) {
            std::cerr << "Warning: ignoring non-numeric MAX_RETRIES=" << *v << "\n";
        }
    }
}

bool UploadConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("bucket")) bucket = j["bucket"].get<std::string>();
        if (j.contains("key")) key = j["key"].get<std::string>();
        if (j.contains("file")) {
            file_path = j["file"].get<std::string>();
        } else if (j.contains("file_path")) {
            file_path = j["file_path"].get<std::string>();
        }
        if (j.contains("region")) region = j["region"].get<std::string>();
        if (j.contains("endpoint")) endpoint = j["endpoint"].get<std::string>();
        if (j.contains("access_key")) access_key = j["access_key"].get<std::string>();
        if (j.contains("secret_key")) secret_key = j["secret_key"].get<std::string>();
        if (j.contains("session_token")) session_token = j["session_token"].get<std::string>();
        if (j.contains("content_type")) content_type = j["content_type"].get<std::string>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<int>();
        if (j.contains("workers")) workers = j["workers"].get<int>();
        if (j.contains("path_style")) path_style = j["path_style"].get<bool>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_cert")) ca_cert = j["ca_cert"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("quiet")) quiet = j["quiet"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string UploadConfig::validate() const {
    if (bucket.empty()) return "bucket is required (--bucket)";
    if (key.empty()) return "key is required (--key)";
    if (file_path.empty()) return "file is required (--file)";
    if (region.empty()) return "region is required (--region, S3_REGION or AWS_REGION)";
    if (access_key.empty() || secret_key.empty()) {
        return "access_key and secret_key are required "
               "(set via config, CLI, or AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY)";
    }
    if (max_retries < 1) return "max_retries must be >= 1";
    if (max_retries > constants::MAX_RETRIES_LIMIT) {
        return "max_retries must be <= " + std::to_string(constants::MAX_RETRIES_LIMIT);
    }
    if (workers < 1) return "workers must be >= 1";

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) return "file not found: " + file_path.string();
    if (!std::filesystem::is_regular_file(file_path, ec)) return "not a regular file: " + file_path.string();
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) return "cannot stat " + file_path.string() + ": " + ec.message();

    try {
        plan_upload(size, chunk_size);
    } catch (const ConfigError& e) {
        return e.what();
    }
    return {};
}

S3ObjectStore::Config UploadConfig::to_store_config() const {
    S3ObjectStore::Config sc;
    sc.region = region;
    sc.endpoint = endpoint;
    sc.access_key = access_key;
    sc.secret_key = secret_key;
    sc.session_token = session_token;
    sc.use_path_style = path_style;
    sc.verify_ssl = verify_ssl;
    sc.ca_bundle_path = ca_cert;
    sc.max_retries = max_retries;
    sc.max_connections = std::max(constants::MIN_IDLE_CONNECTIONS,
                                  static_cast<size_t>(workers) * 2);
    return sc;
}

UploadRequest UploadConfig::to_upload_request() const {
    UploadRequest request;
    request.file_path = file_path;
    request.bucket = bucket;
    request.key = key;
    request.part_size = chunk_size;
    request.content_type = content_type;
    return request;
}

UploaderOptions UploadConfig::to_uploader_options() const {
    UploaderOptions options;
    options.max_retries = max_retries;
    options.max_workers = workers;
    return options;
}

}  // namespace mpupload
