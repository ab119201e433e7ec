#include "uploads/PathNamer.hpp"
#include "util/random.hpp"
#include "util/slug.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>

namespace ih::uploads {

PathNamer::PathNamer(const bool secureUploads, Clock clock)
    : secure_(secureUploads), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()); };
}

std::string PathNamer::cleanFileName(const std::string& name) {
    std::string spaced = name;
    std::ranges::replace(spaced, ' ', '-');

    std::string stem, extension;
    if (const auto dot = spaced.find_last_of('.'); dot == std::string::npos) {
        extension = spaced;
    } else {
        extension = spaced.substr(dot + 1);
        stem = spaced.substr(0, dot);
    }

    stem = util::slugify(stem);
    if (stem.size() > MAX_STEM_LENGTH) {
        stem.resize(MAX_STEM_LENGTH);
        while (!stem.empty() && stem.back() == '-') stem.pop_back();
    }
    if (stem.empty()) stem = util::randomAlnum(10);

    return stem + "." + extension;
}

std::string PathNamer::baseDirectory(const model::Type& type, const std::time_t when) {
    return "/uploads/images/" + model::to_string(type) + "/" + util::yearMonth(when) + "/";
}

std::string PathNamer::newSourcePath(const std::string& originalName, const model::Type& type,
                                     const ExistsCheck& exists) const {
    const auto dir = baseDirectory(type, clock_());
    auto fileName = cleanFileName(originalName);

    while (exists(dir + fileName)) {
        log::Registry::uploads()->debug("[PathNamer] {} already taken, adding a prefix", dir + fileName);
        fileName = util::randomAlnum(3) + fileName;
    }

    if (secure_) return dir + util::randomAlnum(16) + "-" + fileName;
    return dir + fileName;
}

}
