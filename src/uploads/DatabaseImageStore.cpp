#include "uploads/DatabaseImageStore.hpp"
#include "db/query/uploads/Image.hpp"

#include <stdexcept>

namespace query = ih::db::query::uploads;

namespace ih::uploads {

ImageStore::ImagePtr DatabaseImageStore::create(const model::Image& fields) {
    return query::Image::addImage(fields);
}

void DatabaseImageStore::update(const ImagePtr& image) {
    query::Image::updateImage(image);
}

void DatabaseImageStore::remove(const model::Image& image) {
    query::Image::deleteImage(image.id);
}

ImageStore::ImagePtr DatabaseImageStore::find(const unsigned int id) {
    return query::Image::getImage(id);
}

void DatabaseImageStore::chunkByTypes(const std::vector<model::Type>& types, const unsigned int batchSize,
                                      const ChunkFn& fn) {
    if (types.empty()) return;
    if (batchSize == 0) throw std::invalid_argument("batchSize must be positive");

    unsigned int lastId = 0;
    while (true) {
        const auto batch = query::Image::listImagesByTypesAfter(types, lastId, batchSize);
        if (batch.empty()) break;
        lastId = batch.back()->id;
        fn(batch);
        if (batch.size() < batchSize) break;
    }
}

}
