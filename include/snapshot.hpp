/**
 * @file snapshot.hpp
 * @brief Hardlink-seeded snapshots on a target root.
 *
 * A target root holds one directory per snapshot, named after the UTC time it was taken,
 * plus a "latest" symbolic link to the most recent one:
 *
 *     <root>/2024-05-01_10-00-00_UTC/...
 *     <root>/2024-05-02_10-00-00_UTC/...
 *     <root>/latest -> 2024-05-02_10-00-00_UTC
 *
 * A new snapshot starts as a hardlinked copy of the one "latest" points at, so files the
 * following transfer leaves alone share inodes with the previous snapshot.
 *
 * @note The protocol is not safe against concurrent snapshots of the same root.
 */

#ifndef SNAPSHOT_HPP
#define SNAPSHOT_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

/**
 * @brief Name of the link to the most recent snapshot.
 */
inline constexpr const char* kLatestSnapshotLink = "latest";

/**
 * @brief Creates a snapshot name for a point in time.
 *
 * Names have second resolution and sort lexicographically in chronological order, e.g.
 * "2024-05-02_10-00-00_UTC".
 *
 * @param time The time the snapshot is taken.
 * @return std::string The snapshot name.
 */
std::string snapshotName(std::chrono::system_clock::time_point time = std::chrono::system_clock::now());

/**
 * @brief Creates a snapshot on a local target root and points "latest" at it.
 *
 * If the snapshot does not exist yet and "latest" resolves to a directory, the snapshot is
 * created as an archival hardlinked copy of it. Otherwise the snapshot directory is created
 * empty, or left as it is when it already exists.
 *
 * @param root Target root directory.
 * @param name Snapshot name.
 * @return std::expected<void, std::string> Success or an error message.
 */
std::expected<void, std::string> createLocalSnapshot(const std::filesystem::path& root, const std::string& name);

/**
 * @brief Builds the remote shell command that creates a snapshot on a remote target root.
 *
 * The command follows the same protocol as createLocalSnapshot() and exits non-zero if any
 * step fails.
 */
std::string remoteSnapshotCommand(const std::string& root, const std::string& name);

#endif // SNAPSHOT_HPP
