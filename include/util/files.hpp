#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ts::util {

using Blob = std::vector<uint8_t>;

Blob readFileToVector(const std::filesystem::path& path);
std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file, fsyncs, then renames over the target.
void writeFileAtomic(const std::filesystem::path& path, std::string_view data);
void writeFileAtomic(const std::filesystem::path& path, const Blob& data);

std::string randomSuffix(size_t length = 8);

// POSIX shell single-quote escaping.
std::string shellQuote(const std::string& s);

// "profiles/" -> "profiles", "themes/dark" -> "themes__dark"
std::string slugify(std::string_view relPath);

}
