#pragma once

#include <stdexcept>
#include <string>

namespace ih::uploads {

// Base for every failure an upload or derivation reports to the caller.
struct UploadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UploadValidationError : UploadError {
    using UploadError::UploadError;
};

struct StorageWriteError : UploadError {
    explicit StorageWriteError(const std::string& path) : UploadError("Image path not writable: " + path) {}
};

struct DerivationError : UploadError {
    DerivationError() : UploadError("Cannot create thumbnail") {}
    explicit DerivationError(const std::string& detail) : UploadError("Cannot create thumbnail: " + detail) {}
};

struct RemoteFetchError : UploadError {
    explicit RemoteFetchError(const std::string& url) : UploadError("Cannot get image from URL " + url) {}
};

}
