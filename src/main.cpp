#include "mpupload/errors.hpp"
#include "mpupload/log.hpp"
#include "mpupload/metrics.hpp"
#include "mpupload/s3_store.hpp"
#include "mpupload/upload_config.hpp"
#include "mpupload/uploader.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_UNEXPECTED = 1,
    EXIT_CONFIG = 2,
    EXIT_STORAGE_FULL = 3,
    EXIT_NETWORK = 4,
    EXIT_VERIFICATION = 5
};

void report_upload_id(const mpupload::UploadError& e) {
    if (!e.upload_id().empty()) {
        std::cerr << "UploadId " << e.upload_id()
                  << " was left open; inspect or resume it manually" << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = mpupload::UploadConfig::from_args(argc, argv);
    if (!config_opt) {
        return EXIT_CONFIG;
    }
    auto config = std::move(*config_opt);

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            std::cerr << "Warning: cannot open log file " << config.log_file << std::endl;
        }
    }

    if (config.verbose) {
        mpupload::set_log_level(mpupload::LogLevel::Debug);
    } else if (config.quiet) {
        mpupload::set_log_level(mpupload::LogLevel::Warn);
    }

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_CONFIG;
    }

    if (!config.quiet) {
        std::cout << "mpupload starting..." << std::endl;
        std::cout << "  file: " << config.file_path.string() << std::endl;
        std::cout << "  target: s3://" << config.bucket << "/" << config.key << std::endl;
        std::cout << "  region: " << config.region << std::endl;
        std::cout << "  endpoint: " << (config.endpoint.empty() ? "(aws)" : config.endpoint) << std::endl;
        std::cout << "  access-key: " << mpupload::mask_secret(config.access_key) << std::endl;
        std::cout << "  secret-key: " << mpupload::mask_secret(config.secret_key) << std::endl;
        std::cout << "  session-token: " << mpupload::mask_secret(config.session_token) << std::endl;
        if (config.chunk_size) {
            std::cout << "  chunk-size: " << *config.chunk_size << " bytes" << std::endl;
        } else {
            std::cout << "  chunk-size: auto" << std::endl;
        }
        std::cout << "  max-retries: " << config.max_retries << std::endl;
        std::cout << "  workers: " << config.workers << std::endl;
        if (config.content_type) {
            std::cout << "  content-type: " << *config.content_type << std::endl;
        }
        if (!config.metrics_file.empty()) {
            std::cout << "  metrics-file: " << config.metrics_file.string() << std::endl;
        }
    }

    std::unique_ptr<mpupload::UploadMetrics> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<mpupload::UploadMetrics>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"bucket", config.bucket}});
        metrics->start();
    }

    int rc = EXIT_OK;
    try {
        mpupload::S3ObjectStore store(config.to_store_config());
        mpupload::MultipartUploader uploader(store, config.to_uploader_options(), metrics.get());
        auto report = uploader.upload(config.to_upload_request());

        std::cout << "Uploaded " << report.bytes << " bytes in " << report.parts << " parts"
                  << " (UploadId " << report.upload_id << ")" << std::endl;
    } catch (const mpupload::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        rc = EXIT_CONFIG;
    } catch (const mpupload::StorageExhaustedError& e) {
        std::cerr << "Upload failed, storage full on the server: " << e.what() << std::endl;
        report_upload_id(e);
        rc = EXIT_STORAGE_FULL;
    } catch (const mpupload::CompletionError& e) {
        std::cerr << "Upload failed, completion could not be confirmed: " << e.what() << std::endl;
        report_upload_id(e);
        rc = EXIT_NETWORK;
    } catch (const mpupload::RequestError& e) {
        std::cerr << "Upload failed, network or request error after retries: " << e.what() << std::endl;
        report_upload_id(e);
        rc = EXIT_NETWORK;
    } catch (const mpupload::IncompleteUploadError& e) {
        std::cerr << "Upload failed, server is missing parts: " << e.what() << std::endl;
        report_upload_id(e);
        rc = EXIT_VERIFICATION;
    } catch (const mpupload::VerificationError& e) {
        std::cerr << "Upload failed, verification mismatch: " << e.what() << std::endl;
        report_upload_id(e);
        rc = EXIT_VERIFICATION;
    } catch (const mpupload::UploadError& e) {
        std::cerr << "Upload failed: " << e.what() << std::endl;
        report_upload_id(e);
        rc = EXIT_UNEXPECTED;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        rc = EXIT_UNEXPECTED;
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
