#include "bulkfetch/artifact_materializer.hpp"
#include "bulkfetch/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace bulkfetch {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

} // namespace

StagedArtifact::StagedArtifact(const fs::path& staging_dir, const Chunk& buffer) {
    std::error_code ec;
    fs::create_directories(staging_dir, ec);
    if (ec) {
        throw MaterializationError("Cannot create staging directory: " + staging_dir.string() +
                                   " - " + ec.message());
    }

    std::string pattern = (staging_dir / "bulkfetch-XXXXXX.part").string();
    const int fd = mkstemps(pattern.data(), 5);
    if (fd == -1) {
        throw MaterializationError(fmt::format("Cannot create staging file in {}: {}",
                                               staging_dir.string(), std::strerror(errno)));
    }
    path_ = pattern;

    FilePtr file{fdopen(fd, "wb")};
    if (!file) {
        ::close(fd);
        fs::remove(path_, ec);
        throw MaterializationError("Cannot open staging file: " + path_.string());
    }

    if (!buffer.empty()) {
        const size_t written = std::fwrite(buffer.data(), 1, buffer.size(), file.get());
        if (written != buffer.size()) {
            file.reset();
            fs::remove(path_, ec);
            throw MaterializationError("Failed to write staging file: " + path_.string());
        }
    }

    const bool flushed = std::fflush(file.get()) == 0;
    const bool closed = std::fclose(file.release()) == 0;
    if (!flushed || !closed) {
        fs::remove(path_, ec);
        throw MaterializationError("Failed to flush staging file: " + path_.string());
    }
    size_ = buffer.size();
}

StagedArtifact::~StagedArtifact() {
    std::error_code ec;
    if (fs::remove(path_, ec)) {
        spdlog::debug("released staged artifact {}", path_.string());
    } else if (ec) {
        spdlog::warn("Failed to remove staged artifact {}: {}", path_.string(), ec.message());
    }
}

DirectorySink::DirectorySink(fs::path directory) : directory_(std::move(directory)) {}

fs::path DirectorySink::uniqueTarget(const fs::path& directory, const std::string& filename) {
    fs::path target = directory / filename;
    if (!fs::exists(target)) {
        return target;
    }

    const fs::path name{filename};
    const std::string stem = name.stem().string();
    const std::string ext = name.extension().string();
    for (int i = 1;; ++i) {
        target = directory / fmt::format("{} ({}){}", stem, i, ext);
        if (!fs::exists(target)) {
            return target;
        }
    }
}

fs::path DirectorySink::save(const fs::path& staged, const std::string& filename) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw MaterializationError("Failed to create download directory: " + directory_.string() +
                                   " - " + ec.message());
    }

    const fs::path target = uniqueTarget(directory_, filename);
    fs::rename(staged, target, ec);
    if (ec) {
        // Staging and download directories may sit on different filesystems.
        ec.clear();
        fs::copy_file(staged, target, fs::copy_options::none, ec);
        if (ec) {
            throw MaterializationError("Failed to save " + target.string() + ": " + ec.message());
        }
    }
    return target;
}

ArtifactMaterializer::ArtifactMaterializer(ArtifactSinkPtr sink, fs::path staging_dir)
    : sink_(std::move(sink)), staging_dir_(std::move(staging_dir)) {
    if (!sink_) {
        throw std::invalid_argument("ArtifactMaterializer requires a sink");
    }
}

fs::path ArtifactMaterializer::materialize(ChunkList chunks, const std::string& filename) {
    try {
        Chunk buffer = concatenate(chunks);
        ChunkList{}.swap(chunks);

        StagedArtifact staged{staging_dir_, buffer};
        Chunk{}.swap(buffer);

        auto target = sink_->save(staged.path(), filename);
        spdlog::info("Saved {} ({} bytes)", target.string(), staged.size());
        return target;
    } catch (const MaterializationError&) {
        throw;
    } catch (const std::exception& ex) {
        throw MaterializationError(fmt::format("Failed to save {}: {}", filename, ex.what()));
    }
}

} // namespace bulkfetch
