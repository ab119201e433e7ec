#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace ih::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& bytes);

// Writes to a sibling temp file and renames it into place, so readers never see a partial object.
void writeFileAtomic(const std::filesystem::path& absPath, const std::vector<uint8_t>& bytes);

}
