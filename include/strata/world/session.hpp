#pragma once

#include "strata/world/chunk_provider.hpp"
#include "strata/world/chunk_store.hpp"
#include "strata/world/world.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace strata::world {

// An open world directory: the resident World plus the store it was loaded
// from. Exactly one session should own a directory at a time.
class Session {
public:
    Session(std::filesystem::path path,
            const core::WorldConfig& cfg,
            std::optional<terrain::TerrainParams> generator);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Throws core::LoadError once the session is closed.
    World& world();
    const World& world() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool is_open() const noexcept { return open_; }

    // Makes every chunk column covering `rect` resident. Returns the number
    // of chunks loaded or generated; already resident chunks are skipped.
    std::size_t load_region(const Dimension& dimension, const core::Rect& rect);

private:
    friend void save(Session& session);
    friend void close(Session& session);

    std::filesystem::path path_;
    std::shared_ptr<FileChunkStore> store_;
    CachedChunkProvider provider_;
    World world_;
    bool open_ = true;
};

// Opens (creating if needed) a world directory. The directory's level.yaml
// fixes its WorldConfig; `cfg` only applies to new directories. With a
// generator, chunks missing on disk are generated on first load.
std::unique_ptr<Session> open_session(const std::filesystem::path& path,
                                      const core::WorldConfig& cfg = {},
                                      std::optional<terrain::TerrainParams> generator = std::nullopt);

// Writes every resident chunk. Throws core::Error on I/O failure.
void save(Session& session);

// Drops residency without saving.
void close(Session& session);

} // namespace strata::world
