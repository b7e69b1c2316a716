#pragma once

#include <aasx_kg/core/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// EntryKind — what an archive entry is, decided from its name alone.
// ---------------------------------------------------------------------------
enum class EntryKind {
    Document,
    JsonMetadata,
    XmlMetadata,
    Ignorable,
};

[[nodiscard]] std::string EntryKindName(EntryKind kind);

// ---------------------------------------------------------------------------
// ContainerEntry — one entry of an open container. Only valid while the
// ContainerReader that produced it is alive.
// ---------------------------------------------------------------------------
struct ContainerEntry {
    std::string name;
    uint64_t size = 0;
    EntryKind kind = EntryKind::Ignorable;
    uint64_t index = 0;
};

/// Classify an entry by name: directories and packaging parts are
/// ignorable; `.json` is JSON metadata; `.xml` is XML metadata only when
/// the name contains "aas.xml"; known document extensions are documents.
[[nodiscard]] EntryKind ClassifyEntry(std::string_view name);

/// Lowercased extension including the dot (".pdf"), or "" when none.
[[nodiscard]] std::string EntryExtension(std::string_view name);

/// Final path component of an entry name ("aasx/docs/manual.pdf" -> "manual.pdf").
[[nodiscard]] std::string EntryBaseName(std::string_view name);

// Entries larger than this are refused rather than read into memory.
constexpr uint64_t kMaxEntrySize = 100ULL * 1024 * 1024;

// ---------------------------------------------------------------------------
// ContainerReader — read-only view of a ZIP container (libzip).
//
// Open() fails with NotFound when the path does not exist and with
// InvalidContainerFormat when it is not a readable ZIP archive. Entries are
// listed in archive index order.
// ---------------------------------------------------------------------------
class ContainerReader {
public:
    [[nodiscard]] static Result<std::unique_ptr<ContainerReader>, Error> Open(
        const std::string& path);

    ~ContainerReader();

    ContainerReader(const ContainerReader&) = delete;
    ContainerReader& operator=(const ContainerReader&) = delete;
    ContainerReader(ContainerReader&&) = delete;
    ContainerReader& operator=(ContainerReader&&) = delete;

    [[nodiscard]] const std::string& Path() const;
    [[nodiscard]] uint64_t FileSize() const;
    [[nodiscard]] const std::vector<ContainerEntry>& Entries() const;

    /// Read the full contents of one entry. Failures are reported as
    /// EntryParseFailure so the caller can skip the entry and continue.
    [[nodiscard]] Result<std::string, Error> ReadEntry(const ContainerEntry& entry) const;

private:
    struct Impl;
    explicit ContainerReader(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace aasx_kg
