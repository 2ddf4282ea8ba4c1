#include "manifest_store.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <unistd.h>

using nlohmann::json;

// ── ManifestRecord ─────────────────────────────────────────

std::string ManifestRecord::remote_host() const {
    return remote_user.empty() ? host : remote_user + "@" + host;
}

KernelDescriptor ManifestRecord::to_descriptor() const {
    return KernelDescriptor(host, kernel_id, venv, interpreter,
                            display_name.empty() ? std::nullopt
                                                 : std::optional<std::string>(display_name));
}

ManifestRecord ManifestRecord::from_descriptor(const KernelDescriptor& kernel,
                                               const std::string& remote_user,
                                               const std::string& language,
                                               const std::optional<std::string>& venv_root) {
    ManifestRecord rec;
    rec.kernel_id = kernel.kernel_id();
    rec.display_name = kernel.display_name();
    rec.interpreter = kernel.python_cmd();
    rec.language = language;
    rec.remote_user = remote_user;
    rec.host = kernel.host();
    rec.venv = kernel.venv_name();
    rec.venv_root = venv_root;
    return rec;
}

// ── JSON mapping ───────────────────────────────────────────

json ManifestStore::to_json(const Manifest& manifest) {
    json doc = json::object();
    for (const auto& [id, rec] : manifest) {
        json entry = rec.extra.is_object() ? rec.extra : json::object();
        entry["display_name"] = rec.display_name;
        entry["interpreter"] = rec.interpreter;
        entry["language"] = rec.language;
        entry["remote_host"] = rec.remote_host();
        entry["venv"] = rec.venv ? json(*rec.venv) : json(nullptr);
        if (rec.venv_root) entry["venv_root"] = *rec.venv_root;
        doc[id] = entry;
    }
    return doc;
}

static std::string string_field(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw std::invalid_argument(fmt::format("'{}' is not a string", key));
    }
    return it->get<std::string>();
}

Manifest ManifestStore::from_json(const json& doc, const std::string& origin) {
    if (!doc.is_object()) {
        throw ManifestUnreadable("", "", fmt::format("{}: top level is not a JSON object", origin));
    }

    Manifest manifest;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& id = it.key();
        const json& entry = it.value();
        if (id.empty()) {
            throw ManifestUnreadable("", "", fmt::format("{}: record with empty kernel id", origin));
        }
        if (!entry.is_object()) {
            throw ManifestUnreadable(id, "", fmt::format("{}: record is not an object", origin));
        }

        ManifestRecord rec;
        rec.kernel_id = id;
        try {
            rec.display_name = string_field(entry, "display_name");
            rec.interpreter = string_field(entry, "interpreter");
            rec.language = string_field(entry, "language");
            auto [user, host] = split_user_host(string_field(entry, "remote_host"));
            rec.remote_user = user;
            rec.host = host;
            std::string venv = string_field(entry, "venv");
            if (!venv.empty()) rec.venv = venv;
            std::string root = string_field(entry, "venv_root");
            if (!root.empty()) rec.venv_root = root;
        } catch (const std::invalid_argument& e) {
            throw ManifestUnreadable(id, "", fmt::format("{}: {}", origin, e.what()));
        }

        if (rec.host.empty() || rec.interpreter.empty()) {
            throw ManifestUnreadable(id, rec.host,
                fmt::format("{}: record needs remote_host and interpreter", origin));
        }

        rec.extra = entry;
        for (const char* key : {"display_name", "interpreter", "language", "remote_host", "venv", "venv_root"}) {
            rec.extra.erase(key);
        }
        manifest.emplace(id, std::move(rec));
    }
    return manifest;
}

// ── ManifestStore ──────────────────────────────────────────

ManifestStore::ManifestStore(const fs::path& path) : path_(path) {
}

fs::path ManifestStore::lock_path() const {
    return fs::path(path_.string() + ".lock");
}

bool ManifestStore::exists() const {
    return fs::exists(path_);
}

Manifest ManifestStore::load() const {
    if (!fs::exists(path_)) {
        throw ManifestUnreadable("", "", fmt::format(
            "manifest not found at {} (run 'rkl init' to create one)", path_.string()));
    }

    std::ifstream in(path_);
    if (!in) {
        throw ManifestUnreadable("", "", "cannot open manifest " + path_.string());
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::exception& e) {
        throw ManifestUnreadable("", "", fmt::format("{} is not valid JSON: {}", path_.string(), e.what()));
    }

    return from_json(doc, path_.string());
}

void ManifestStore::save(const Manifest& manifest) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    fs::path tmp = path_.string() + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw ManifestWriteError("", "", "cannot write " + tmp.string());
        }
        out << to_json(manifest).dump(2) << "\n";
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw ManifestWriteError("", "", "failed writing " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ManifestWriteError("", "", fmt::format("cannot replace {}: {}", path_.string(), ec.message()));
    }
    rkl_log(fmt::format("manifest: wrote {} record(s) to {}", manifest.size(), path_.string()));
}

std::vector<KernelDescriptor> ManifestStore::list(const std::optional<std::string>& filter_host) const {
    std::vector<KernelDescriptor> kernels;
    for (const auto& [id, rec] : load()) {
        if (filter_host && rec.host == *filter_host) continue;
        kernels.push_back(rec.to_descriptor());
    }
    return kernels;
}

std::optional<ManifestRecord> ManifestStore::find(const std::string& kernel_id) const {
    auto manifest = load();
    auto it = manifest.find(kernel_id);
    if (it == manifest.end()) return std::nullopt;
    return it->second;
}

FileLock ManifestStore::lock(int timeout_ms) const {
    FileLock guard(lock_path().string(), timeout_ms);
    if (!guard.held()) {
        throw ManifestWriteError("", "", fmt::format("cannot lock {}: {}",
                                                     guard.path(), guard.error()));
    }
    return guard;
}

Result<void> ManifestStore::initialize() const {
    if (exists()) {
        return Result<void>::Ok();
    }
    try {
        auto guard = lock();
        if (!exists()) {
            save(Manifest{});
        }
        return Result<void>::Ok();
    } catch (const KernelError& e) {
        return Result<void>::Err(e.what());
    }
}
