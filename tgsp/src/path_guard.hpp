#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>

// Extraction-side path checks. Every failure is a PathSecurityError.

namespace path_guard {

// Reduces a filename taken from package metadata to a bare basename.
// Rejects empty names, absolute paths (POSIX, UNC or drive-letter), any
// ".." component, backslashes and NUL bytes.
std::string sanitize_filename(const std::string& name);

// Resolves relative under dest_dir. The result is canonicalized (symlinks
// in existing prefixes resolved) and must stay inside the canonical
// dest_dir, compared component by component.
std::filesystem::path resolve_under(const std::filesystem::path& dest_dir,
                                    const std::string& relative);

// Resolves as above, creates parent directories, and writes data.
std::filesystem::path write_file_safely(const std::filesystem::path& dest_dir,
                                        const std::string& relative,
                                        const std::vector<uint8_t>& data);

} // namespace path_guard
