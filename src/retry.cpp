#include "mpupload/retry.hpp"
#include "mpupload/constants.hpp"

#include <thread>

namespace mpupload {

bool is_timeout_error(const std::exception& e) {
    auto* req = dynamic_cast<const RequestError*>(&e);
    return req && req->is_timeout();
}

bool is_overload_error(const std::exception& e) {
    auto* req = dynamic_cast<const RequestError*>(&e);
    return req && req->status() == constants::HTTP_ORIGIN_TIMEOUT;
}

bool is_timeout_or_overload(const std::exception& e) {
    return is_timeout_error(e) || is_overload_error(e);
}

bool is_transient_error(const std::exception& e) {
    return dynamic_cast<const TransientNetworkError*>(&e) != nullptr;
}

bool is_no_such_upload(const std::exception& e) {
    auto* req = dynamic_cast<const RequestError*>(&e);
    return req && req->code() == "NoSuchUpload";
}

bool is_storage_exhausted(const std::exception& e) {
    return dynamic_cast<const StorageExhaustedError*>(&e) != nullptr;
}

void sleep_seconds(std::chrono::seconds duration) {
    std::this_thread::sleep_for(duration);
}

}  // namespace mpupload
