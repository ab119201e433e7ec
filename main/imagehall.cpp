#include "cache/DatabaseStore.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/Transactions.hpp"
#include "log/Registry.hpp"
#include "runtime/Deps.hpp"
#include "uploads/CleanupService.hpp"
#include "uploads/Errors.hpp"
#include "uploads/ImageService.hpp"
#include "uploads/ImageStore.hpp"
#include "uploads/ThumbnailService.hpp"
#include "uploads/UrlResolver.hpp"
#include "util/files.hpp"
#include "util/parse.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ih;
using namespace ih::uploads;
using json = nlohmann::json;

namespace {

struct CommandCall {
    std::string name;
    std::vector<std::string> positionals;
    std::multimap<std::string, std::string> options;
    std::set<std::string> flags;
};

const std::set<std::string> kFlags = {"--force", "--skip-revisions", "--keep-ratio"};

// Splits --key=value, collects repeated options, and treats known switches as flags.
CommandCall parseArgs(const int argc, char** argv) {
    CommandCall call;
    call.name = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];

        if (a.rfind("--", 0) != 0) {
            call.positionals.push_back(std::move(a));
            continue;
        }

        if (const auto eq = a.find('='); eq != std::string::npos) {
            call.options.emplace(a.substr(0, eq), a.substr(eq + 1));
            continue;
        }

        if (kFlags.contains(a)) {
            call.flags.insert(a);
            continue;
        }

        if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + a);
        call.options.emplace(a, argv[++i]);
    }

    return call;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    const auto it = c.options.find(key);
    if (it == c.options.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    const auto [begin, end] = c.options.equal_range(key);
    for (auto it = begin; it != end; ++it) out.push_back(it->second);
    return out;
}

unsigned int parseUnsigned(const std::string& s, const std::string& what) {
    const auto v = util::parseUInt(s);
    if (!v) throw std::invalid_argument(fmt::format("Invalid {}: {}", what, s));
    return *v;
}

const std::string& requirePositional(const CommandCall& c, const std::string& what) {
    if (c.positionals.empty()) throw std::invalid_argument(fmt::format("{} requires <{}>", c.name, what));
    return c.positionals.front();
}

std::shared_ptr<model::Image> requireImage(const std::string& idArg) {
    const auto id = parseUnsigned(idArg, "image id");
    auto image = runtime::Deps::get().imageStore->find(id);
    if (!image) throw std::invalid_argument(fmt::format("No image with id {}", id));
    return image;
}

json cleanupImages(const CommandCall& c) {
    std::vector<model::Type> types;
    for (const auto& t : optVals(c, "--type")) types.push_back(model::type_from_string(t));
    if (types.empty()) types = model::sweepableTypes();

    const bool dryRun = !c.flags.contains("--force");
    const bool checkRevisions = config::ConfigRegistry::get().cleanup.check_revisions && !c.flags.contains("--skip-revisions");

    const auto paths = runtime::Deps::get().cleanupService->sweep(checkRevisions, dryRun, types);

    if (const auto db = std::dynamic_pointer_cast<cache::DatabaseStore>(runtime::Deps::get().cache); db && !dryRun)
        db->purgeExpired();
    return {{"dry_run", dryRun}, {"count", paths.size()}, {"paths", paths}};
}

json thumbnail(const CommandCall& c) {
    const auto image = requireImage(requirePositional(c, "id"));
    const auto& defaults = config::ConfigRegistry::get().thumbnails;

    const auto width = optVal(c, "--width") ? parseUnsigned(*optVal(c, "--width"), "width") : defaults.default_width;
    const auto height = optVal(c, "--height") ? parseUnsigned(*optVal(c, "--height"), "height") : defaults.default_height;
    const bool keepRatio = c.flags.contains("--keep-ratio");

    const auto url = runtime::Deps::get().thumbnailService->getThumbnail(*image, width, height, keepRatio);
    return {{"id", image->id}, {"url", url}};
}

json upload(const CommandCall& c) {
    const std::filesystem::path file = requirePositional(c, "file");
    const auto type = optVal(c, "--type");
    if (!type) throw std::invalid_argument("upload requires --type");

    std::optional<model::Uploader> uploader;
    if (const auto user = optVal(c, "--user")) uploader = model::Uploader{parseUnsigned(*user, "user id"), {}, {}};

    const auto name = optVal(c, "--name").value_or(file.filename().string());
    const auto uploadedTo = optVal(c, "--uploaded-to") ? parseUnsigned(*optVal(c, "--uploaded-to"), "page id") : 0;

    const auto image = runtime::Deps::get().imageService->saveNewFromUpload(
        name, util::readFileToVector(file), model::type_from_string(*type), uploadedTo,
        std::nullopt, std::nullopt, true, uploader);
    return *image;
}

json importUrl(const CommandCall& c) {
    const auto& url = requirePositional(c, "url");
    const auto type = optVal(c, "--type");
    if (!type) throw std::invalid_argument("import-url requires --type");

    const auto image = runtime::Deps::get().imageService->saveNewFromUrl(url, model::type_from_string(*type),
                                                                         optVal(c, "--name"));
    return *image;
}

json avatar(const CommandCall& c) {
    const auto userId = parseUnsigned(requirePositional(c, "user-id"), "user id");
    const auto email = optVal(c, "--email");
    if (!email) throw std::invalid_argument("avatar requires --email");

    const auto size = optVal(c, "--size") ? parseUnsigned(*optVal(c, "--size"), "size")
                                          : config::ConfigRegistry::get().avatar.size;

    const model::Uploader user{userId, optVal(c, "--name").value_or("user-" + std::to_string(userId)), *email};
    const auto image = runtime::Deps::get().imageService->saveUserAvatar(user, size);
    return *image;
}

json destroy(const CommandCall& c) {
    const auto image = requireImage(requirePositional(c, "id"));
    runtime::Deps::get().cleanupService->destroy(*image);
    return {{"destroyed", image->id}, {"path", image->path}};
}

json resolve(const CommandCall& c) {
    const auto path = runtime::Deps::get().urlResolver->toStoragePath(requirePositional(c, "url"));
    if (!path) return {{"path", nullptr}};
    return {{"path", *path}, {"url", runtime::Deps::get().urlResolver->toPublicUrl(*path)}};
}

void printUsage() {
    std::cerr << "Usage: imagehall <command> [options]\n\n"
                 "Commands:\n"
                 "  cleanup-images [--force] [--skip-revisions] [--type <t>]...\n"
                 "  thumbnail <id> [--width N] [--height N] [--keep-ratio]\n"
                 "  upload <file> --type <t> [--name N] [--uploaded-to N] [--user N]\n"
                 "  import-url <url> --type <t> [--name N]\n"
                 "  avatar <user-id> --email E [--name N] [--size N]\n"
                 "  destroy <id>\n"
                 "  resolve <url>\n";
}

}

int main(const int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "help") {
        printUsage();
        return argc < 2 ? 2 : 0;
    }

    using Handler = json (*)(const CommandCall&);
    const std::map<std::string, Handler> commands = {
        {"cleanup-images", cleanupImages},
        {"thumbnail", thumbnail},
        {"upload", upload},
        {"import-url", importUrl},
        {"avatar", avatar},
        {"destroy", destroy},
        {"resolve", resolve},
    };

    try {
        const auto call = parseArgs(argc, argv);
        const auto it = commands.find(call.name);
        if (it == commands.end()) {
            std::cerr << "Unknown command: " << call.name << "\n\n";
            printUsage();
            return 2;
        }

        config::ConfigRegistry::init();
        ih::log::Registry::init();

        db::Transactions::init(config::ConfigRegistry::get().database);
        runtime::Deps::init();

        std::cout << it->second(call).dump(2) << std::endl;
        return 0;
    } catch (const UploadError& e) {
        if (ih::log::Registry::isInitialized()) ih::log::Registry::imagehall()->error("[imagehall] {}", e.what());
        std::cout << json{{"error", e.what()}}.dump(2) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        if (ih::log::Registry::isInitialized()) ih::log::Registry::imagehall()->error("[imagehall] Fatal: {}", e.what());
        else std::cerr << "[imagehall] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
