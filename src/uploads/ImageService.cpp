#include "uploads/ImageService.hpp"
#include "uploads/Errors.hpp"
#include "uploads/ImageStore.hpp"
#include "uploads/UrlResolver.hpp"
#include "storage/Manager.hpp"
#include "storage/Engine.hpp"
#include "util/encoding.hpp"
#include "util/slug.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ih::log;
using namespace ih::util;

namespace ih::uploads {

namespace {

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    for (size_t pos = 0; (pos = s.find(from, pos)) != std::string::npos; pos += to.size())
        s.replace(pos, from.size(), to);
}

// Last path segment with any query or fragment removed.
std::string urlBasename(const std::string& url) {
    auto path = url.substr(0, url.find_first_of("?#"));
    path = rtrim(path, "/");
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

}

ImageService::ImageService(std::shared_ptr<storage::Manager> storage,
                           std::shared_ptr<ImageStore> images,
                           std::shared_ptr<UrlResolver> urls,
                           const config::AppConfig& app,
                           config::AvatarConfig avatar,
                           Codec codec,
                           http::Fetcher fetcher,
                           PathNamer::Clock clock)
    : storage_(std::move(storage)), images_(std::move(images)), urls_(std::move(urls)),
      avatar_(std::move(avatar)), codec_(std::move(codec)), fetcher_(std::move(fetcher)),
      namer_(app.secure_images, std::move(clock)) {
    if (!storage_ || !images_ || !urls_) throw std::invalid_argument("ImageService is missing a collaborator");
    if (!fetcher_) fetcher_ = [](const std::string& url) { return http::fetch(url); };
}

std::shared_ptr<model::Image> ImageService::saveNewFromUpload(const std::string& name,
                                                              const std::vector<uint8_t>& bytes,
                                                              const model::Type& type,
                                                              const unsigned int uploadedTo,
                                                              const std::optional<unsigned int> resizeWidth,
                                                              const std::optional<unsigned int> resizeHeight,
                                                              const bool keepRatio,
                                                              const std::optional<model::Uploader>& uploader) {
    if (resizeWidth || resizeHeight) {
        const auto resized = resizeImage(codec_, bytes, resizeWidth.value_or(0), resizeHeight.value_or(0), keepRatio);
        return saveNew(name, resized, type, uploadedTo, uploader);
    }
    return saveNew(name, bytes, type, uploadedTo, uploader);
}

std::shared_ptr<model::Image> ImageService::saveNewFromBase64Uri(const std::string& uri,
                                                                 const std::string& name,
                                                                 const model::Type& type,
                                                                 const unsigned int uploadedTo,
                                                                 const std::optional<model::Uploader>& uploader) {
    static const std::string delimiter = ";base64,";

    const auto start = uri.find(delimiter);
    if (start == std::string::npos) throw UploadValidationError("Invalid base64 image data provided");

    const auto payloadStart = start + delimiter.size();
    const auto next = uri.find(delimiter, payloadStart);
    const auto payload = uri.substr(payloadStart, next == std::string::npos ? std::string::npos : next - payloadStart);

    const auto bytes = base64Decode(payload);
    if (!bytes) throw UploadValidationError("Invalid base64 image data provided");

    return saveNew(name, *bytes, type, uploadedTo, uploader);
}

std::shared_ptr<model::Image> ImageService::saveNewFromUrl(const std::string& url,
                                                           const model::Type& type,
                                                           const std::optional<std::string>& name) {
    const auto imageName = name && !name->empty() ? *name : urlBasename(url);

    std::vector<uint8_t> bytes;
    try {
        bytes = fetcher_(url);
    } catch (const http::FetchError& e) {
        Registry::uploads()->warn("[ImageService] Fetching {} failed: {}", url, e.what());
        throw RemoteFetchError(url);
    }

    return saveNew(imageName, bytes, type);
}

std::shared_ptr<model::Image> ImageService::saveNew(const std::string& name,
                                                    const std::vector<uint8_t>& bytes,
                                                    const model::Type& type,
                                                    const unsigned int uploadedTo,
                                                    const std::optional<model::Uploader>& uploader) {
    const auto storage = storage_->forType(type);
    const auto path = namer_.newSourcePath(name, type, [&](const std::string& p) { return storage->exists(p); });

    try {
        storage->put(path, bytes);
        storage->setPublic(path);
    } catch (const std::exception& e) {
        Registry::uploads()->error("[ImageService] Writing {} failed: {}", path, e.what());
        throw StorageWriteError(path);
    }

    model::Image fields;
    fields.name = name;
    fields.path = path;
    fields.url = urls_->toPublicUrl(path);
    fields.type = type;
    fields.uploaded_to = uploadedTo;
    if (uploader) {
        fields.created_by = uploader->id;
        fields.updated_by = uploader->id;
    }

    auto image = images_->create(fields);
    Registry::uploads()->info("[ImageService] Saved image {} at {} ({} bytes)", image->id, path, bytes.size());
    return image;
}

std::string ImageService::avatarUrlTemplate() const {
    auto url = trim(avatar_.url);
    if (url.empty() && !avatar_.disable_services) url = GRAVATAR_TEMPLATE;
    return url;
}

bool ImageService::avatarFetchEnabled() const {
    return avatarUrlTemplate().starts_with("http");
}

std::shared_ptr<model::Image> ImageService::saveUserAvatar(const model::Uploader& user, const unsigned int size) {
    if (!avatarFetchEnabled()) throw UploadValidationError("Avatar fetching is not enabled");

    const auto email = toLower(trim(user.email));
    auto url = avatarUrlTemplate();
    replaceAll(url, "${hash}", md5Hex(email));
    replaceAll(url, "${size}", std::to_string(size));
    replaceAll(url, "${email}", urlEncode(email));

    auto imageName = user.name + "-avatar.png";
    std::ranges::replace(imageName, ' ', '-');

    auto image = saveNewFromUrl(url, model::Type::User, imageName);
    image->created_by = user.id;
    image->updated_by = user.id;
    image->uploaded_to = user.id;
    images_->update(image);

    return image;
}

std::vector<uint8_t> ImageService::getImageData(const model::Image& image) const {
    return storage_->forType(image.type)->get(image.path);
}

std::optional<std::string> ImageService::imageUriToBase64(const std::string& uri) const {
    if (trim(uri).empty()) return std::nullopt;

    const auto storagePath = urls_->toStoragePath(uri);
    if (!storagePath) return std::nullopt;

    const auto storage = storage_->disk(storage_->defaultDisk());
    if (!storage->exists(*storagePath)) return std::nullopt;
    const auto bytes = storage->get(*storagePath);

    const auto file = urlBasename(uri);
    const auto dot = file.find_last_of('.');
    auto extension = dot == std::string::npos ? std::string{} : file.substr(dot + 1);
    if (extension == "svg") extension = "svg+xml";

    return "data:image/" + extension + ";base64," + base64Encode(bytes);
}

}
