#include <aasx_kg/container/container_reader.hpp>

#include <aasx_kg/core/log.hpp>

#include <zip.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace aasx_kg {

namespace {

constexpr std::array<const char*, 13> kDocumentExtensions = {
    ".pdf", ".doc", ".docx", ".txt", ".xls", ".xlsx", ".png",
    ".jpg", ".jpeg", ".step", ".stp", ".csv", ".md"};

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.substr(s.size() - suffix.size()) == suffix;
}

Error MakeContainerError(const std::string& operation,
                         const std::string& target,
                         const std::string& message,
                         ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

std::string ZipErrorString(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

// zip_discard releases a read-only archive without touching the file.
struct ZipArchiveDeleter {
    void operator()(zip_t* archive) const {
        if (archive != nullptr) {
            zip_discard(archive);
        }
    }
};

} // anonymous namespace

std::string EntryKindName(EntryKind kind) {
    switch (kind) {
        case EntryKind::Document:     return "document";
        case EntryKind::JsonMetadata: return "json";
        case EntryKind::XmlMetadata:  return "xml";
        case EntryKind::Ignorable:    return "ignorable";
    }
    return "ignorable";
}

std::string EntryExtension(std::string_view name) {
    auto base = EntryBaseName(name);
    auto dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return ToLower(base.substr(dot));
}

std::string EntryBaseName(std::string_view name) {
    auto slash = name.find_last_of("/\\");
    if (slash == std::string_view::npos) {
        return std::string(name);
    }
    return std::string(name.substr(slash + 1));
}

EntryKind ClassifyEntry(std::string_view name) {
    if (name.empty() || EndsWith(name, "/")) {
        return EntryKind::Ignorable;
    }
    const auto lower = ToLower(name);
    if (EntryBaseName(lower) == "[content_types].xml" || EndsWith(lower, ".rels")) {
        return EntryKind::Ignorable;
    }

    const auto ext = EntryExtension(lower);
    if (ext == ".json") {
        return EntryKind::JsonMetadata;
    }
    if (ext == ".xml") {
        // Packaging XML (origin markers, thumbnails metadata) shares the
        // extension; only names carrying the aas.xml marker are metadata.
        return lower.find("aas.xml") != std::string::npos
            ? EntryKind::XmlMetadata
            : EntryKind::Ignorable;
    }
    if (std::find(kDocumentExtensions.begin(), kDocumentExtensions.end(), ext) !=
        kDocumentExtensions.end()) {
        return EntryKind::Document;
    }
    return EntryKind::Ignorable;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct ContainerReader::Impl {
    std::string path;
    uint64_t file_size = 0;
    std::unique_ptr<zip_t, ZipArchiveDeleter> archive;
    std::vector<ContainerEntry> entries;
};

ContainerReader::ContainerReader(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

ContainerReader::~ContainerReader() = default;

Result<std::unique_ptr<ContainerReader>, Error> ContainerReader::Open(
    const std::string& path) {
    using ReaderResult = Result<std::unique_ptr<ContainerReader>, Error>;
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return ReaderResult::Err(MakeContainerError(
            "OpenContainer", path, "Container does not exist",
            ErrorCategory::NotFound));
    }
    if (!fs::is_regular_file(path, ec)) {
        return ReaderResult::Err(MakeContainerError(
            "OpenContainer", path, "Container path is not a regular file",
            ErrorCategory::InvalidContainerFormat));
    }

    int zip_error = 0;
    zip_t* raw = zip_open(path.c_str(), ZIP_RDONLY, &zip_error);
    if (raw == nullptr) {
        const auto category = zip_error == ZIP_ER_NOENT
            ? ErrorCategory::NotFound
            : ErrorCategory::InvalidContainerFormat;
        return ReaderResult::Err(MakeContainerError(
            "OpenContainer", path,
            "Cannot open ZIP archive: " + ZipErrorString(zip_error), category));
    }

    auto impl = std::make_unique<Impl>();
    impl->path = path;
    impl->archive.reset(raw);
    impl->file_size = static_cast<uint64_t>(fs::file_size(path, ec));

    const zip_int64_t total = zip_get_num_entries(raw, 0);
    if (total < 0) {
        return ReaderResult::Err(MakeContainerError(
            "OpenContainer", path, "Cannot enumerate archive entries",
            ErrorCategory::InvalidContainerFormat));
    }

    for (zip_int64_t i = 0; i < total; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(raw, static_cast<zip_uint64_t>(i), 0, &st) != 0 ||
            (st.valid & ZIP_STAT_NAME) == 0) {
            LogWarn("container", path + ": cannot stat entry #" + std::to_string(i));
            continue;
        }
        ContainerEntry entry;
        entry.name = st.name;
        entry.size = (st.valid & ZIP_STAT_SIZE) != 0 ? st.size : 0;
        entry.kind = ClassifyEntry(entry.name);
        entry.index = static_cast<uint64_t>(i);
        LogDebug("container", path + ": " + entry.name + " -> " +
                                  EntryKindName(entry.kind));
        impl->entries.push_back(std::move(entry));
    }

    LogInfo("container", "Opened " + path + " (" +
                             std::to_string(impl->entries.size()) + " entries)");
    return ReaderResult::Ok(std::unique_ptr<ContainerReader>(
        new ContainerReader(std::move(impl))));
}

const std::string& ContainerReader::Path() const {
    return impl_->path;
}

uint64_t ContainerReader::FileSize() const {
    return impl_->file_size;
}

const std::vector<ContainerEntry>& ContainerReader::Entries() const {
    return impl_->entries;
}

Result<std::string, Error> ContainerReader::ReadEntry(const ContainerEntry& entry) const {
    if (entry.size > kMaxEntrySize) {
        return Result<std::string, Error>::Err(MakeContainerError(
            "ReadEntry", entry.name,
            "Entry exceeds " + std::to_string(kMaxEntrySize) + " bytes",
            ErrorCategory::EntryParseFailure));
    }

    zip_file_t* file = zip_fopen_index(impl_->archive.get(), entry.index, 0);
    if (file == nullptr) {
        return Result<std::string, Error>::Err(MakeContainerError(
            "ReadEntry", entry.name,
            std::string("Cannot open entry: ") + zip_strerror(impl_->archive.get()),
            ErrorCategory::EntryParseFailure));
    }

    std::string contents(static_cast<size_t>(entry.size), '\0');
    const zip_int64_t bytes_read = entry.size == 0
        ? 0
        : zip_fread(file, &contents[0], entry.size);
    zip_fclose(file);

    if (bytes_read < 0 || static_cast<zip_uint64_t>(bytes_read) != entry.size) {
        return Result<std::string, Error>::Err(MakeContainerError(
            "ReadEntry", entry.name, "Short or failed read (corrupt entry)",
            ErrorCategory::EntryParseFailure));
    }
    return Result<std::string, Error>::Ok(std::move(contents));
}

} // namespace aasx_kg
