#pragma once

#include "uploads/ImageStore.hpp"

namespace ih::uploads {

class DatabaseImageStore final : public ImageStore {
public:
    ImagePtr create(const model::Image& fields) override;
    void update(const ImagePtr& image) override;
    void remove(const model::Image& image) override;
    [[nodiscard]] ImagePtr find(unsigned int id) override;
    void chunkByTypes(const std::vector<model::Type>& types, unsigned int batchSize, const ChunkFn& fn) override;
};

}
