// SourceBuffer.hpp
#pragma once
#include <cstdint>
#include <string>

// The raw bytes of one source file plus a content fingerprint.
// A buffer is never edited: a changed file is a new buffer.
class SourceBuffer {
public:
    SourceBuffer(std::string path, std::string bytes);

    // Reads the whole file. Throws Error::Failure (FILE_NOT_FOUND / FILE_IO).
    static SourceBuffer load_from_file(const std::string& path);

    // Absolute, lexically normalized form of a path. Used as the file identity.
    static std::string normalize_path(const std::string& path, const std::string& base_dir = "");

    // 64-bit FNV-1a over the bytes.
    static uint64_t fingerprint_of(const std::string& bytes);

    const std::string& path() const { return file_path; }
    const std::string& bytes() const { return content; }
    uint64_t fingerprint() const { return content_fingerprint; }

private:
    std::string file_path;
    std::string content;
    uint64_t content_fingerprint = 0;
};
