#include "path_guard.hpp"
#include "errors.hpp"
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace path_guard {

static bool is_absolute_name(const std::string& name) {
    if (name.empty()) return false;
    if (name[0] == '/' || name[0] == '\\') return true;
    // "C:" and "C:\..." on Windows-produced packages
    return name.size() >= 2 && name[1] == ':' &&
           ((name[0] >= 'A' && name[0] <= 'Z') || (name[0] >= 'a' && name[0] <= 'z'));
}

std::string sanitize_filename(const std::string& name) {
    if (name.empty())
        throw PathSecurityError("empty filename");
    if (name.find('\0') != std::string::npos)
        throw PathSecurityError("filename contains NUL byte");
    if (is_absolute_name(name))
        throw PathSecurityError("absolute path not allowed: " + name);
    if (name.find('\\') != std::string::npos)
        throw PathSecurityError("backslash not allowed in filename: " + name);

    for (const auto& component : fs::path(name)) {
        if (component == "..")
            throw PathSecurityError("path traversal not allowed: " + name);
    }

    std::string base = fs::path(name).filename().string();
    if (base.empty() || base == "." || base == "..")
        throw PathSecurityError("filename has no usable basename: " + name);
    return base;
}

fs::path resolve_under(const fs::path& dest_dir, const std::string& relative) {
    if (relative.empty() || is_absolute_name(relative))
        throw PathSecurityError("refusing to extract '" + relative + "'");

    std::error_code ec;
    fs::path root = fs::weakly_canonical(dest_dir, ec);
    if (ec)
        throw PathSecurityError("cannot canonicalize destination " +
                                dest_dir.string() + ": " + ec.message());
    if (root.filename().empty())
        root = root.parent_path();

    fs::path target = fs::weakly_canonical(root / fs::path(relative), ec);
    if (ec)
        throw PathSecurityError("cannot canonicalize target '" + relative +
                                "': " + ec.message());

    // target must be root itself plus at least one more component
    auto r = root.begin();
    auto t = target.begin();
    for (; r != root.end(); ++r, ++t) {
        if (t == target.end() || *r != *t)
            throw PathSecurityError("path escapes destination directory: " + relative);
    }
    if (t == target.end())
        throw PathSecurityError("path resolves to the destination directory itself: " + relative);
    return target;
}

fs::path write_file_safely(const fs::path& dest_dir,
                           const std::string& relative,
                           const std::vector<uint8_t>& data)
{
    fs::path target = resolve_under(dest_dir, relative);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
        throw std::runtime_error("Cannot create directory " +
                                 target.parent_path().string() + ": " + ec.message());

    std::ofstream f(target, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("Cannot open file for writing: " + target.string());
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
    if (!f)
        throw std::runtime_error("Write error on file: " + target.string());
    return target;
}

} // namespace path_guard
