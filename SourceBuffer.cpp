// SourceBuffer.cpp
#include "SourceBuffer.hpp"
#include "Error.hpp"
#include "TextIO.hpp"
#include <filesystem>
#include <fstream>   // For std::ifstream
#include <sstream>

namespace fs = std::filesystem;

SourceBuffer::SourceBuffer(std::string path, std::string bytes)
    : file_path(std::move(path)), content(std::move(bytes)) {
    content_fingerprint = fingerprint_of(content);
}

SourceBuffer SourceBuffer::load_from_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw Error::Failure(Error::FILE_NOT_FOUND, path);
    }

    std::ifstream infile(path, std::ios::binary);
    if (!infile) {
        throw Error::Failure(Error::FILE_IO, path);
    }
    std::stringstream buffer;
    buffer << infile.rdbuf();
    if (infile.bad()) {
        throw Error::Failure(Error::FILE_IO, path);
    }
    TextIO::debug("DAP Info: Loaded " + path + "\n");
    return SourceBuffer(normalize_path(path), buffer.str());
}

std::string SourceBuffer::normalize_path(const std::string& path, const std::string& base_dir) {
    if (path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_relative()) {
        std::error_code ec;
        fs::path base = base_dir.empty() ? fs::current_path(ec) : fs::path(base_dir);
        p = base / p;
    }
    return p.lexically_normal().string();
}

uint64_t SourceBuffer::fingerprint_of(const std::string& bytes) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : bytes) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}
