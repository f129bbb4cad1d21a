#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>

namespace regflow::util {

// Atomically replace `path` by writing to a temp file in the same directory and
// renaming it into place. Missing parent directories are created. The writer
// must write the full contents to the stream and return true on success.
bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error = nullptr);

bool AtomicWriteText(const std::filesystem::path& path, std::string_view text,
                     std::string* error = nullptr);

}  // namespace regflow::util
