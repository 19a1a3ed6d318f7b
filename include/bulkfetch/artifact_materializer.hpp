#pragma once

#include "byte_accumulator.hpp"

#include <filesystem>
#include <memory>
#include <cstdint>
#include <string>

namespace bulkfetch {

// A finished buffer written to a private temporary file. The file is removed
// when the handle goes away unless a sink moved it elsewhere first.
class StagedArtifact {
public:
    StagedArtifact(const std::filesystem::path& staging_dir, const Chunk& buffer);
    ~StagedArtifact();

    StagedArtifact(const StagedArtifact&) = delete;
    StagedArtifact& operator=(const StagedArtifact&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uintmax_t size() const noexcept { return size_; }

private:
    std::filesystem::path path_;
    std::uintmax_t size_{0};
};

// Save-as primitive: turns a staged file into the user-visible artifact.
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    // Returns where the artifact ended up.
    virtual std::filesystem::path save(const std::filesystem::path& staged,
                                       const std::string& filename) = 0;
};

using ArtifactSinkPtr = std::shared_ptr<ArtifactSink>;

// Stores artifacts in a download directory. An existing file is never
// overwritten; "name.zip" becomes "name (1).zip" and so on.
class DirectorySink final : public ArtifactSink {
public:
    explicit DirectorySink(std::filesystem::path directory);

    std::filesystem::path save(const std::filesystem::path& staged,
                               const std::string& filename) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    [[nodiscard]] static std::filesystem::path uniqueTarget(const std::filesystem::path& directory,
                                                            const std::string& filename);

private:
    std::filesystem::path directory_;
};

class ArtifactMaterializer {
public:
    explicit ArtifactMaterializer(ArtifactSinkPtr sink,
                                  std::filesystem::path staging_dir = std::filesystem::temp_directory_path());

    // Assembles the chunks in order and persists them under filename.
    // Throws MaterializationError; the staged file is released either way.
    std::filesystem::path materialize(ChunkList chunks, const std::string& filename);

private:
    ArtifactSinkPtr sink_;
    std::filesystem::path staging_dir_;
};

} // namespace bulkfetch
