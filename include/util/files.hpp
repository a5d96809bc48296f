#pragma once

#include <filesystem>
#include <string>

namespace hs::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file, fsyncs it, then renames over the target.
// Readers of `path` observe either the old or the new content, never a mix.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

// Moves a bad artifact aside as "<name>.corrupt-<stamp>" and returns the new path.
std::filesystem::path quarantineFile(const std::filesystem::path& path);

std::string generate_random_suffix(size_t length = 8);

}
