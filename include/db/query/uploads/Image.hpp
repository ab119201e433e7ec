#pragma once

#include "uploads/model/Image.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace ih::db::query::uploads {

class Image {
    using I = ih::uploads::model::Image;
    using ImagePtr = std::shared_ptr<I>;

public:
    Image() = default;

    // Inserts and fills id and timestamps from the stored row.
    static ImagePtr addImage(const I& image);
    static void updateImage(const ImagePtr& image);
    static void deleteImage(unsigned int id);
    [[nodiscard]] static ImagePtr getImage(unsigned int id);

    [[nodiscard]] static std::vector<ImagePtr> listImagesByTypesAfter(const std::vector<ih::uploads::model::Type>& types,
                                                                      unsigned int afterId, unsigned int limit);
};

}
