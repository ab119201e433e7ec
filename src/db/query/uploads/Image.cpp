#include "db/query/uploads/Image.hpp"
#include "db/Transactions.hpp"
#include "util/timestamp.hpp"

namespace model = ih::uploads::model;

namespace ih::db::query::uploads {

static std::vector<std::shared_ptr<model::Image>> images_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<model::Image>> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(std::make_shared<model::Image>(row));
    return out;
}

std::shared_ptr<model::Image> Image::addImage(const I& image) {
    return Transactions::exec("Image::addImage", [&](pqxx::work& txn) -> ImagePtr {
        pqxx::params p;
        p.append(image.name);
        p.append(image.url);
        p.append(image.path);
        p.append(model::to_string(image.type));
        p.append(image.uploaded_to);
        p.append(image.created_by);
        p.append(image.updated_by);

        const auto row = txn.exec(pqxx::prepped{"insert_image"}, p).one_row();
        return std::make_shared<I>(row);
    });
}

void Image::updateImage(const ImagePtr& image) {
    if (!image) throw std::invalid_argument("Image cannot be null");
    Transactions::exec("Image::updateImage", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(image->id);
        p.append(image->name);
        p.append(image->url);
        p.append(image->uploaded_to);
        p.append(image->created_by);
        p.append(image->updated_by);

        const auto row = txn.exec(pqxx::prepped{"update_image"}, p).one_row();
        image->updated_at = util::parsePostgresTimestamp(row["updated_at"].c_str());
    });
}

void Image::deleteImage(const unsigned int id) {
    Transactions::exec("Image::deleteImage", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_image"}, pqxx::params{id});
    });
}

std::shared_ptr<model::Image> Image::getImage(const unsigned int id) {
    return Transactions::exec("Image::getImage", [&](pqxx::work& txn) -> ImagePtr {
        const auto res = txn.exec(pqxx::prepped{"get_image"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<I>(res[0]);
    });
}

std::vector<std::shared_ptr<model::Image>>
Image::listImagesByTypesAfter(const std::vector<model::Type>& types, const unsigned int afterId, const unsigned int limit) {
    std::vector<std::string> typeNames;
    for (const auto& t : types) typeNames.push_back(model::to_string(t));

    return Transactions::exec("Image::listImagesByTypesAfter", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"list_images_by_types_after"}, pqxx::params{typeNames, afterId, limit});
        return images_from_pq_res(res);
    });
}

}
