#pragma once

#include <zip.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace aasx_kg {
namespace testing {

// ---------------------------------------------------------------------------
// Test fixtures built at test time: scratch directories and ZIP containers.
// ---------------------------------------------------------------------------

// A fresh directory under the system temp path, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "aasx_kg_test") {
        static int counter = 0;
        auto base = std::filesystem::temp_directory_path() / prefix;
        path_ = base / (std::to_string(::getpid()) + "_" + std::to_string(++counter));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const { return path_; }
    [[nodiscard]] std::string File(const std::string& name) const {
        return (path_ / name).string();
    }

private:
    std::filesystem::path path_;
};

using ZipEntries = std::vector<std::pair<std::string, std::string>>;

// Write `entries` (name, contents) into a new ZIP archive at `path`, in
// order. Names ending in '/' become directory entries.
inline void WriteZip(const std::string& path, const ZipEntries& entries) {
    int error = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
    if (archive == nullptr) {
        throw std::runtime_error("zip_open failed for " + path);
    }
    for (const auto& [name, contents] : entries) {
        if (!name.empty() && name.back() == '/') {
            if (zip_dir_add(archive, name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
                zip_discard(archive);
                throw std::runtime_error("zip_dir_add failed for " + name);
            }
            continue;
        }
        // The buffer must outlive zip_close; `entries` owns it.
        zip_source_t* source =
            zip_source_buffer(archive, contents.data(), contents.size(), 0);
        if (source == nullptr) {
            zip_discard(archive);
            throw std::runtime_error("zip_source_buffer failed for " + name);
        }
        if (zip_file_add(archive, name.c_str(), source,
                         ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(source);
            zip_discard(archive);
            throw std::runtime_error("zip_file_add failed for " + name);
        }
    }
    if (zip_close(archive) != 0) {
        std::string message = zip_strerror(archive);
        zip_discard(archive);
        throw std::runtime_error("zip_close failed for " + path + ": " + message);
    }
}

inline void WriteTextFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("cannot write " + path);
    }
    out << contents;
}

} // namespace testing
} // namespace aasx_kg
