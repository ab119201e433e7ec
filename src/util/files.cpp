#include "util/files.hpp"
#include "util/random.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::vector<uint8_t> ih::util::readFileToVector(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void ih::util::writeFile(const fs::path& absPath, const std::vector<uint8_t>& bytes) {
    std::ofstream out(absPath, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + absPath.string());
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + absPath.string());
}

void ih::util::writeFileAtomic(const fs::path& absPath, const std::vector<uint8_t>& bytes) {
    const auto tmp = absPath.parent_path() / ("." + absPath.filename().string() + "." + randomAlnum(8) + ".tmp");
    try {
        writeFile(tmp, bytes);
        fs::rename(tmp, absPath);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}
