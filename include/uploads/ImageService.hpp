#pragma once

#include "config/Config.hpp"
#include "http/Fetcher.hpp"
#include "uploads/PathNamer.hpp"
#include "uploads/Resize.hpp"
#include "uploads/model/Image.hpp"
#include "uploads/model/Uploader.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ih::storage { class Manager; }

namespace ih::uploads {

class ImageStore;
class UrlResolver;

// Accepts new images from uploads, data URIs and remote URLs.
class ImageService {
public:
    static constexpr const char* GRAVATAR_TEMPLATE = "https://www.gravatar.com/avatar/${hash}?s=${size}&d=identicon";

    ImageService(std::shared_ptr<storage::Manager> storage,
                 std::shared_ptr<ImageStore> images,
                 std::shared_ptr<UrlResolver> urls,
                 const config::AppConfig& app,
                 config::AvatarConfig avatar,
                 Codec codec = defaultCodec(),
                 http::Fetcher fetcher = {},
                 PathNamer::Clock clock = {});

    // Optionally resized before saving; a 0 or missing side is unconstrained in keep-ratio mode.
    std::shared_ptr<model::Image> saveNewFromUpload(const std::string& name,
                                                    const std::vector<uint8_t>& bytes,
                                                    const model::Type& type,
                                                    unsigned int uploadedTo = 0,
                                                    std::optional<unsigned int> resizeWidth = std::nullopt,
                                                    std::optional<unsigned int> resizeHeight = std::nullopt,
                                                    bool keepRatio = true,
                                                    const std::optional<model::Uploader>& uploader = std::nullopt);

    std::shared_ptr<model::Image> saveNewFromBase64Uri(const std::string& uri,
                                                       const std::string& name,
                                                       const model::Type& type,
                                                       unsigned int uploadedTo = 0,
                                                       const std::optional<model::Uploader>& uploader = std::nullopt);

    std::shared_ptr<model::Image> saveNewFromUrl(const std::string& url,
                                                 const model::Type& type,
                                                 const std::optional<std::string>& name = std::nullopt);

    std::shared_ptr<model::Image> saveNew(const std::string& name,
                                          const std::vector<uint8_t>& bytes,
                                          const model::Type& type,
                                          unsigned int uploadedTo = 0,
                                          const std::optional<model::Uploader>& uploader = std::nullopt);

    std::shared_ptr<model::Image> saveUserAvatar(const model::Uploader& user, unsigned int size = 500);

    [[nodiscard]] bool avatarFetchEnabled() const;

    // Throws storage::NotFound when the bytes are gone.
    [[nodiscard]] std::vector<uint8_t> getImageData(const model::Image& image) const;

    // "data:image/<ext>;base64,..." for one of our image URLs, std::nullopt otherwise.
    [[nodiscard]] std::optional<std::string> imageUriToBase64(const std::string& uri) const;

private:
    std::shared_ptr<storage::Manager> storage_;
    std::shared_ptr<ImageStore> images_;
    std::shared_ptr<UrlResolver> urls_;
    config::AvatarConfig avatar_;
    Codec codec_;
    http::Fetcher fetcher_;
    PathNamer namer_;

    [[nodiscard]] std::string avatarUrlTemplate() const;
};

}
