#pragma once

#include "uploads/ImageStore.hpp"

#include <algorithm>
#include <ctime>
#include <map>
#include <stdexcept>

namespace ih::test {

// Keyset-paginated like the database store, so removals during chunking behave the same.
class InMemoryImageStore final : public uploads::ImageStore {
public:
    ImagePtr create(const uploads::model::Image& fields) override {
        auto image = std::make_shared<uploads::model::Image>(fields);
        image->id = ++lastId_;
        image->created_at = image->updated_at = std::time(nullptr);
        rows_[image->id] = std::make_shared<uploads::model::Image>(*image);
        return image;
    }

    void update(const ImagePtr& image) override {
        if (!rows_.contains(image->id)) throw std::runtime_error("No such image");
        ++updates;
        rows_[image->id] = std::make_shared<uploads::model::Image>(*image);
    }

    void remove(const uploads::model::Image& image) override { rows_.erase(image.id); }

    ImagePtr find(const unsigned int id) override {
        const auto it = rows_.find(id);
        if (it == rows_.end()) return nullptr;
        return std::make_shared<uploads::model::Image>(*it->second);
    }

    void chunkByTypes(const std::vector<uploads::model::Type>& types, const unsigned int batchSize,
                      const ChunkFn& fn) override {
        unsigned int after = 0;
        while (true) {
            std::vector<ImagePtr> batch;
            for (auto it = rows_.upper_bound(after); it != rows_.end() && batch.size() < batchSize; ++it)
                if (std::ranges::find(types, it->second->type) != types.end())
                    batch.push_back(std::make_shared<uploads::model::Image>(*it->second));

            if (batch.empty()) return;
            ++chunks;
            after = batch.back()->id;
            fn(batch);
            if (batch.size() < batchSize) return;
        }
    }

    [[nodiscard]] size_t size() const { return rows_.size(); }

    unsigned int updates = 0;
    unsigned int chunks = 0;

private:
    unsigned int lastId_ = 0;
    std::map<unsigned int, ImagePtr> rows_;
};

}
