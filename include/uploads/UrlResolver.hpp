#pragma once

#include "config/Config.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace ih::uploads {

// Maps storage paths to public URLs and back.
class UrlResolver {
public:
    UrlResolver(config::AppConfig app, config::StorageConfig storage);

    [[nodiscard]] std::string toPublicUrl(const std::string& path) const;

    // std::nullopt for anything that is not one of our uploaded images.
    [[nodiscard]] std::optional<std::string> toStoragePath(const std::string& url) const;

    // Computed on first use and kept for the lifetime of the resolver; configuration is static.
    [[nodiscard]] const std::string& publicBase() const;

private:
    config::AppConfig app_;
    config::StorageConfig storage_;

    mutable std::once_flag baseOnce_;
    mutable std::string base_;

    [[nodiscard]] std::string computePublicBase() const;
};

}
