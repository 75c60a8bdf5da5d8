#pragma once

#include <fetchd/downloader/downloader.hpp>

#include <filesystem>
#include <memory>

namespace fetchd::storage {

using downloader::IDownloadStore;

// Process-local store; contents vanish with the object.
std::unique_ptr<IDownloadStore> makeInMemoryDownloadStore();

/**
 * @brief Durable store backed by one SQLite file.
 *
 * Creates the parent directory and the schema when missing and switches the database to WAL.
 * Pass ":memory:" for a private in-memory database.
 */
Result<std::unique_ptr<IDownloadStore>> makeSqliteDownloadStore(const std::filesystem::path& path);

} // namespace fetchd::storage
