#pragma once

#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ih::storage::s3 {

namespace fs = std::filesystem;

struct ListResult {
    std::vector<std::string> keys;
    std::vector<std::string> prefixes;  // only populated for delimited listings
};

class Controller {
public:
    explicit Controller(config::S3Config cfg);
    virtual ~Controller() = default;

    // #########################################################################
    // ########################### OBJECT OPS ##################################
    // #########################################################################

    // true on 200, false on 404, throws otherwise
    [[nodiscard]] virtual bool headObject(const fs::path& key) const;

    // std::nullopt on 404
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> getObject(const fs::path& key) const;

    virtual void putObject(const fs::path& key, const std::vector<uint8_t>& buffer,
                           const std::string& contentType = "application/octet-stream") const;

    virtual void putObjectAcl(const fs::path& key, const std::string& cannedAcl) const;

    virtual void deleteObject(const fs::path& key) const;

    // #########################################################################
    // ############################# LISTING ###################################
    // #########################################################################

    // ListObjectsV2 following continuation tokens. An empty delimiter lists recursively.
    [[nodiscard]] virtual ListResult list(const std::string& prefix, const std::string& delimiter = "") const;

    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }
    [[nodiscard]] const std::string& bucket() const { return cfg_.bucket; }

private:
    config::S3Config cfg_;
    std::string endpoint_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    [[nodiscard]] std::pair<std::string, std::string> constructPaths(CURL* curl, const fs::path& p,
                                                                     const std::string& query = "") const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             const std::map<std::string, std::string>& extra = {}) const;
};

}
