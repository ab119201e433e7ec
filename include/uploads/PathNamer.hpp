#pragma once

#include "uploads/model/Type.hpp"

#include <ctime>
#include <functional>
#include <string>

namespace ih::uploads {

/**
 * Chooses where a new source image is stored:
 * /uploads/images/<type>/<YYYY-MM>/[<token>-]<slug>.<ext>
 */
class PathNamer {
public:
    using ExistsCheck = std::function<bool(const std::string& path)>;
    using Clock = std::function<std::time_t()>;

    static constexpr size_t MAX_STEM_LENGTH = 100;

    explicit PathNamer(bool secureUploads = false, Clock clock = {});

    // Failures of the existence check propagate.
    [[nodiscard]] std::string newSourcePath(const std::string& originalName, const model::Type& type,
                                            const ExistsCheck& exists) const;

    // Slugged stem capped at MAX_STEM_LENGTH, extension kept verbatim; an empty stem becomes 10 random characters.
    [[nodiscard]] static std::string cleanFileName(const std::string& name);

    [[nodiscard]] static std::string baseDirectory(const model::Type& type, std::time_t when);

private:
    bool secure_;
    Clock clock_;
};

}
