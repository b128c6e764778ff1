#include "file_io.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> read_file(const std::string& path, uint64_t max_size) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);

    std::streamoff size = f.tellg();
    if (size < 0)
        throw std::runtime_error("Cannot determine size of: " + path);
    if ((uint64_t)size > max_size)
        throw std::runtime_error("File too large: " + path + " (" +
                                 std::to_string(size) + " bytes, limit " +
                                 std::to_string(max_size) + ")");
    f.seekg(0);

    std::vector<uint8_t> data((size_t)size);
    if (size > 0 && !f.read(reinterpret_cast<char*>(data.data()), size))
        throw std::runtime_error("Read error on file: " + path);
    return data;
}

std::string read_file_text(const std::string& path, uint64_t max_size) {
    std::vector<uint8_t> data = read_file(path, max_size);
    return std::string(data.begin(), data.end());
}

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}
