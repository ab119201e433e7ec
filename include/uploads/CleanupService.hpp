#pragma once

#include "uploads/model/Image.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ih::storage { class Manager; }

namespace ih::uploads {

class ImageStore;
class ContentIndex;

class CleanupService {
public:
    static constexpr unsigned int DEFAULT_BATCH_SIZE = 1000;

    CleanupService(std::shared_ptr<storage::Manager> storage,
                   std::shared_ptr<ImageStore> images,
                   std::shared_ptr<ContentIndex> content,
                   unsigned int batchSize = DEFAULT_BATCH_SIZE);

    /**
     * Removes the source file and every derived variant (same file name anywhere under the
     * source directory), then any directory that deletion left empty, then the record.
     * A storage failure propagates and leaves the record in place.
     */
    void destroy(const model::Image& image) const;

    /**
     * Finds images of the sweepable types whose file name appears in no page (and, with
     * checkRevisions, no page revision). Returns their paths; destroys them unless dryRun.
     */
    std::vector<std::string> sweep(bool checkRevisions = true, bool dryRun = true,
                                   const std::vector<model::Type>& types = model::sweepableTypes()) const;

private:
    std::shared_ptr<storage::Manager> storage_;
    std::shared_ptr<ImageStore> images_;
    std::shared_ptr<ContentIndex> content_;
    unsigned int batchSize_;

    [[nodiscard]] bool isReferenced(const std::string& needle, bool checkRevisions) const;
};

}
