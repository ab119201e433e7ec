#pragma once

#include "uploads/model/Image.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace ih::uploads {

// Persistence for image records.
class ImageStore {
public:
    using ImagePtr = std::shared_ptr<model::Image>;
    using ChunkFn = std::function<void(const std::vector<ImagePtr>& batch)>;

    virtual ~ImageStore() = default;

    // Returns the stored record with id and timestamps assigned.
    virtual ImagePtr create(const model::Image& fields) = 0;
    virtual void update(const ImagePtr& image) = 0;
    virtual void remove(const model::Image& image) = 0;
    [[nodiscard]] virtual ImagePtr find(unsigned int id) = 0;

    // Visits every image of the given types in id order, batchSize records at a time.
    // Records removed by fn are never revisited and never cause others to be skipped.
    virtual void chunkByTypes(const std::vector<model::Type>& types, unsigned int batchSize, const ChunkFn& fn) = 0;
};

}
