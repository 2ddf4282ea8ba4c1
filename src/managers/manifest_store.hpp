#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <core/kernel_descriptor.hpp>
#include <platform/file_lock.hpp>

namespace fs = std::filesystem;

// One entry of kernels.json. On disk:
//   "<kernel_id>": {"display_name": ..., "interpreter": ..., "language": ...,
//                   "remote_host": "user@host", "venv": "name" | null,
//                   "venv_root": "/opt/envs"}
// venv_root is absent in manifests written before it was recorded.
struct ManifestRecord {
    std::string kernel_id;
    std::string display_name;
    std::string interpreter;
    std::string language;
    std::string remote_user;                // "" when remote_host carried no user
    std::string host;
    std::optional<std::string> venv;
    std::optional<std::string> venv_root;   // remote parent directory of the venv
    nlohmann::json extra = nlohmann::json::object();   // keys we don't own, kept on rewrite

    std::string remote_host() const;
    KernelDescriptor to_descriptor() const;

    static ManifestRecord from_descriptor(const KernelDescriptor& kernel,
                                          const std::string& remote_user,
                                          const std::string& language,
                                          const std::optional<std::string>& venv_root = std::nullopt);
};

using Manifest = std::map<std::string, ManifestRecord>;

// The local kernels.json: the only durable record of which kernels exist.
// Reads are whole-document; writes replace the whole document via a temp
// file and rename, so a crash leaves either the old or the new manifest.
// Callers that read-modify-write hold lock() across the sequence.
class ManifestStore {
public:
    explicit ManifestStore(const fs::path& path);

    // Throws ManifestUnreadable if the file is missing, unreadable or malformed.
    Manifest load() const;

    // Throws ManifestWriteError; the previous file is untouched on failure.
    void save(const Manifest& manifest) const;

    // Every record as a descriptor, skipping records whose host == filter_host.
    std::vector<KernelDescriptor> list(const std::optional<std::string>& filter_host = std::nullopt) const;

    std::optional<ManifestRecord> find(const std::string& kernel_id) const;

    // Exclusive lock on "<manifest>.lock". Throws ManifestWriteError if it
    // cannot be taken within timeout_ms (-1 = wait forever).
    FileLock lock(int timeout_ms = -1) const;

    bool exists() const;

    // Create an empty manifest ("{}") if none exists.
    Result<void> initialize() const;

    const fs::path& path() const { return path_; }
    fs::path lock_path() const;

    static nlohmann::json to_json(const Manifest& manifest);
    static Manifest from_json(const nlohmann::json& doc, const std::string& origin);

private:
    fs::path path_;
};
