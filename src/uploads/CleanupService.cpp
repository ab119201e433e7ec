#include "uploads/CleanupService.hpp"
#include "uploads/ImageStore.hpp"
#include "uploads/ContentIndex.hpp"
#include "storage/Manager.hpp"
#include "storage/Engine.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ih::log;

namespace ih::uploads {

static std::string basenameOf(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

CleanupService::CleanupService(std::shared_ptr<storage::Manager> storage,
                               std::shared_ptr<ImageStore> images,
                               std::shared_ptr<ContentIndex> content,
                               const unsigned int batchSize)
    : storage_(std::move(storage)), images_(std::move(images)), content_(std::move(content)),
      batchSize_(batchSize ? batchSize : DEFAULT_BATCH_SIZE) {
    if (!storage_ || !images_ || !content_) throw std::invalid_argument("CleanupService is missing a collaborator");
}

void CleanupService::destroy(const model::Image& image) const {
    const auto storage = storage_->forType(image.type);
    const auto dir = image.directory();
    const auto name = image.basename();

    std::vector<std::string> toDelete;
    for (const auto& file : storage->allFiles(dir))
        if (basenameOf(file) == name) toDelete.push_back(file);

    storage->remove(toDelete);

    const auto isEmpty = [&](const std::string& d) {
        return storage->files(d).empty() && storage->directories(d).empty();
    };

    // Subdirectories first so an emptied variant folder can leave the image folder empty too.
    for (const auto& sub : storage->directories(dir))
        if (isEmpty(sub)) storage->deleteDirectory(sub);

    if (!storage::Engine::normalize(dir).empty() && isEmpty(dir)) storage->deleteDirectory(dir);

    images_->remove(image);

    Registry::cleanup()->info("[CleanupService] Destroyed image {} ({} files removed)", image.id, toDelete.size());
}

bool CleanupService::isReferenced(const std::string& needle, const bool checkRevisions) const {
    if (content_->pagesContaining(needle) > 0) return true;
    return checkRevisions && content_->revisionsContaining(needle) > 0;
}

std::vector<std::string> CleanupService::sweep(const bool checkRevisions, const bool dryRun,
                                               const std::vector<model::Type>& types) const {
    std::vector<model::Type> eligible;
    for (const auto& t : types)
        if (model::isSweepable(t) && std::ranges::find(eligible, t) == eligible.end()) eligible.push_back(t);

    std::vector<std::string> unreferenced;
    if (eligible.empty()) {
        Registry::cleanup()->warn("[CleanupService] No sweepable types requested, nothing to do");
        return unreferenced;
    }

    images_->chunkByTypes(eligible, batchSize_, [&](const std::vector<ImageStore::ImagePtr>& batch) {
        for (const auto& image : batch) {
            if (isReferenced(image->basename(), checkRevisions)) continue;

            unreferenced.push_back(image->path);
            if (!dryRun) destroy(*image);
        }
    });

    Registry::cleanup()->info("[CleanupService] Sweep found {} unreferenced images{}",
                              unreferenced.size(), dryRun ? " (dry run)" : "");
    return unreferenced;
}

}
