#include "uploads/model/Image.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>

namespace ih::uploads::model {

Image::Image(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      name(row["name"].as<std::string>()),
      url(row["url"].as<std::string>()),
      path(row["path"].as<std::string>()),
      type(type_from_string(row["type"].as<std::string>())),
      uploaded_to(row["uploaded_to"].as<unsigned int>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].c_str())),
      updated_at(util::parsePostgresTimestamp(row["updated_at"].c_str())) {
    if (!row["created_by"].is_null()) created_by = row["created_by"].as<unsigned int>();
    if (!row["updated_by"].is_null()) updated_by = row["updated_by"].as<unsigned int>();
}

std::string Image::basename() const {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string Image::directory() const {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? std::string{} : path.substr(0, pos);
}

std::string Image::extension() const {
    const auto base = basename();
    const auto pos = base.find_last_of('.');
    return pos == std::string::npos ? std::string{} : base.substr(pos + 1);
}

void to_json(nlohmann::json& j, const Image& img) {
    j = {
        {"id", img.id},
        {"name", img.name},
        {"url", img.url},
        {"path", img.path},
        {"type", to_string(img.type)},
        {"uploaded_to", img.uploaded_to},
        {"created_at", util::timestampToString(img.created_at)},
        {"updated_at", util::timestampToString(img.updated_at)}
    };

    if (img.created_by) j["created_by"] = *img.created_by;
    else j["created_by"] = nullptr;
    if (img.updated_by) j["updated_by"] = *img.updated_by;
    else j["updated_by"] = nullptr;
}

void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Image>>& images) {
    j = nlohmann::json::array();
    for (const auto& img : images) j.push_back(*img);
}

}
