#pragma once

#include <stdexcept>
#include <string>

namespace mpupload {

/// Base of every error raised by the upload core.
/// Carries the multipart upload id when a server-side session is open, so the
/// driver can report it for manual resumption.
class UploadError : public std::runtime_error {
public:
    explicit UploadError(const std::string& message)
        : std::runtime_error(message) {}

    const std::string& upload_id() const { return upload_id_; }
    void set_upload_id(const std::string& upload_id) { upload_id_ = upload_id; }

private:
    std::string upload_id_;
};

// Invalid plan or configuration inputs. Never retried.
class ConfigError : public UploadError {
public:
    using UploadError::UploadError;
};

// A storage request failed.
class RequestError : public UploadError {
public:
    enum class Kind {
        Timeout,   // client-side connect/read timeout
        Network,   // connection-level failure, no HTTP status
        Http       // server answered with an error status
    };

    RequestError(const std::string& operation, Kind kind, int status,
                 const std::string& code, const std::string& detail)
        : UploadError(describe(operation, kind, status, code, detail))
        , operation_(operation)
        , kind_(kind)
        , status_(status)
        , code_(code) {}

    const std::string& operation() const { return operation_; }
    Kind kind() const { return kind_; }
    int status() const { return status_; }
    const std::string& code() const { return code_; }

    bool is_timeout() const { return kind_ == Kind::Timeout; }

private:
    static std::string describe(const std::string& operation, Kind kind, int status,
                                const std::string& code, const std::string& detail) {
        std::string msg = operation + ": ";
        switch (kind) {
            case Kind::Timeout: msg += "request timed out"; break;
            case Kind::Network: msg += "network error"; break;
            case Kind::Http:
                msg += "HTTP " + std::to_string(status);
                if (!code.empty()) msg += " " + code;
                break;
        }
        if (!detail.empty()) msg += " (" + detail + ")";
        return msg;
    }

    std::string operation_;
    Kind kind_;
    int status_;
    std::string code_;
};

// Timeouts, connection failures and overload statuses (5xx, 429).
// Expected to resolve on their own.
class TransientNetworkError : public RequestError {
public:
    using RequestError::RequestError;
};

// Backend reported HTTP 507. Will not self-resolve; aborts the upload.
class StorageExhaustedError : public UploadError {
public:
    using UploadError::UploadError;
};

// Server-recorded part count does not match the plan.
class IncompleteUploadError : public UploadError {
public:
    using UploadError::UploadError;
};

// Finalize could not be confirmed after all attempts.
class CompletionError : public UploadError {
public:
    using UploadError::UploadError;
};

// Completed object does not match the local file.
class VerificationError : public UploadError {
public:
    using UploadError::UploadError;
};

} // namespace mpupload
