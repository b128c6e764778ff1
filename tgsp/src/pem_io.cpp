#include "pem_io.hpp"
#include "base64.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

static const int kLineWidth = 64;

void write_pem(std::ostream& out,
               const std::string& type_header,
               const std::vector<uint8_t>& data)
{
    out << "-----BEGIN " << type_header << "-----\n";

    std::string encoded = base64_encode(data.data(), data.size());
    for (size_t i = 0; i < encoded.size(); i += kLineWidth) {
        out << encoded.substr(i, kLineWidth) << '\n';
    }

    out << "-----END " << type_header << "-----\n";

    if (!out)
        throw std::runtime_error("Write error on PEM output");
}

void write_pem_file(const std::string& path,
                    const std::string& type_header,
                    const std::vector<uint8_t>& data,
                    bool private_file)
{
    std::ostringstream armored;
    write_pem(armored, type_header, data);
    const std::string text = armored.str();

    mode_t mode = private_file ? 0600 : 0644;
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0)
        throw std::runtime_error("Cannot open file for writing: " + path +
                                 ": " + std::strerror(errno));
    // An existing file keeps its old mode under O_CREAT; tighten it explicitly.
    if (private_file && ::fchmod(fd, 0600) != 0) {
        ::close(fd);
        throw std::runtime_error("Cannot restrict permissions on: " + path);
    }

    size_t off = 0;
    while (off < text.size()) {
        ssize_t n = ::write(fd, text.data() + off, text.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            throw std::runtime_error("Write error on file: " + path);
        }
        off += (size_t)n;
    }
    if (::close(fd) != 0)
        throw std::runtime_error("Write error on file: " + path);
}

std::vector<uint8_t> parse_pem(const std::string& text,
                               const std::string& expected_type,
                               const std::string& origin)
{
    std::istringstream f(text);
    std::string begin_marker = "-----BEGIN " + expected_type + "-----";
    std::string end_marker   = "-----END "   + expected_type + "-----";

    std::string line;
    bool found_begin = false;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == begin_marker) { found_begin = true; break; }
    }
    if (!found_begin)
        throw std::runtime_error("Missing or wrong PEM header in: " + origin +
                                 "\n  Expected: " + begin_marker);

    std::string body;
    bool found_end = false;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == end_marker) { found_end = true; break; }
        body += line;
    }
    if (!found_end)
        throw std::runtime_error("Missing PEM footer in: " + origin +
                                 "\n  Expected: " + end_marker);

    try {
        return base64_decode(body);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Bad PEM body in " + origin + ": " + e.what());
    }
}

bool looks_like_pem(const std::string& text) {
    return text.find("-----BEGIN ") != std::string::npos;
}
