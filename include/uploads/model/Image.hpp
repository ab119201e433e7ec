#pragma once

#include "uploads/model/Type.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace ih::uploads::model {

struct Image {
    unsigned int id{};
    std::string name;
    std::string url;
    std::string path;               // storage path of the source bytes, immutable once assigned
    Type type{Type::Gallery};
    unsigned int uploaded_to{};     // 0 = unattached
    std::optional<unsigned int> created_by, updated_by;
    std::time_t created_at{}, updated_at{};

    Image() = default;
    explicit Image(const pqxx::row& row);

    [[nodiscard]] std::string basename() const;
    [[nodiscard]] std::string directory() const;
    [[nodiscard]] std::string extension() const;
};

void to_json(nlohmann::json& j, const Image& img);
void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Image>>& images);

}
