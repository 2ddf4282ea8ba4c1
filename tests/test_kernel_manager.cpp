#include <gtest/gtest.h>
#include <managers/kernel_manager.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Fakes ────────────────────────────────────────────────────

// Shared between the test and every session the factory hands out.
struct SessionScript {
    // First rule whose key is a substring of the rendered command wins.
    std::vector<std::pair<std::string, SSHResult>> rules;
    std::vector<std::string> commands;
    std::vector<std::pair<std::string, std::string>> uploads;
    std::vector<SessionTarget> opened;
    std::string connect_error;
    int closes = 0;

    void on(const std::string& key, SSHResult result) { rules.emplace_back(key, result); }

    int count(const std::string& needle) const {
        return static_cast<int>(std::count_if(commands.begin(), commands.end(),
            [&](const std::string& c) { return c.find(needle) != std::string::npos; }));
    }

    std::string find(const std::string& needle) const {
        for (const auto& c : commands)
            if (c.find(needle) != std::string::npos) return c;
        return "";
    }
};

class FakeSession : public RemoteSession {
public:
    FakeSession(std::shared_ptr<SessionScript> script, std::string target)
        : script_(std::move(script)), target_(std::move(target)) {}
    ~FakeSession() override { close(); }

    SSHResult run(const RemoteCommand& command, int) override {
        std::string text = command.render();
        script_->commands.push_back(text);
        for (const auto& [key, result] : script_->rules) {
            if (text.find(key) != std::string::npos) return result;
        }
        return SSHResult{0, "", ""};
    }

    SSHResult upload(const fs::path& local, const std::string& remote) override {
        script_->uploads.emplace_back(local.string(), remote);
        return SSHResult{0, "", ""};
    }

    void close() override {
        if (active_) script_->closes++;
        active_ = false;
    }
    bool is_active() const override { return active_; }
    const std::string& target() const override { return target_; }

private:
    std::shared_ptr<SessionScript> script_;
    std::string target_;
    bool active_ = true;
};

class FakeRegistrar : public KernelRegistrar {
public:
    std::vector<std::string> calls;
    bool fail = false;

    void install(const std::string& id) override { record("install", id); }
    void uninstall(const std::string& id) override { record("uninstall", id); }

private:
    void record(const std::string& action, const std::string& id) {
        calls.push_back(action + ":" + id);
        if (fail) throw RegistrarError(id, "", action + " failed");
    }
};

// ── Fixture ──────────────────────────────────────────────────

class KernelManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<ManifestStore> store;
    Config config = Config::defaults();
    FakeRegistrar registrar;
    std::shared_ptr<SessionScript> script = std::make_shared<SessionScript>();
    std::unique_ptr<KernelManager> manager;
    std::vector<std::string> status;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("rkl_manager_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        store = std::make_unique<ManifestStore>(test_dir / "kernels.json");
        ASSERT_TRUE(store->initialize().is_ok());

        auto sessions = [s = script](const SessionTarget& target, StatusCallback)
                -> Result<std::unique_ptr<RemoteSession>> {
            s->opened.push_back(target);
            if (!s->connect_error.empty()) {
                return Result<std::unique_ptr<RemoteSession>>::Err(s->connect_error);
            }
            return Result<std::unique_ptr<RemoteSession>>::Ok(
                std::make_unique<FakeSession>(s, target.user + "@" + target.host));
        };
        manager = std::make_unique<KernelManager>(config, *store, registrar, sessions);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    StatusCallback collect() {
        return [this](const std::string& msg) { status.push_back(msg); };
    }

    void seed(const KernelDescriptor& kernel, const std::string& user = "ubuntu") {
        auto manifest = store->load();
        manifest[kernel.kernel_id()] = ManifestRecord::from_descriptor(kernel, user, "python");
        store->save(manifest);
    }

    std::string manifest_text() const {
        std::ifstream in(store->path());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    nlohmann::json manifest_json() const {
        return nlohmann::json::parse(manifest_text());
    }

    CreateOptions options(bool overwrite = false) const {
        auto opts = manager->default_create_options();
        opts.overwrite = overwrite;
        return opts;
    }
};

// ── create ───────────────────────────────────────────────────

TEST_F(KernelManagerTest, CreateProvisionsVenvAndRecordsKernel) {
    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    script->on("test -d", SSHResult{1, "", ""});

    auto outcome = manager->create(kernel, std::nullopt, std::nullopt, options());

    EXPECT_TRUE(outcome.venv_created);
    EXPECT_FALSE(outcome.overwrote);
    EXPECT_FALSE(outcome.escalated);
    EXPECT_TRUE(outcome.duplicate_ids.empty());

    EXPECT_EQ(script->count("virtualenv -p python3.8 ~/envA"), 1);
    EXPECT_EQ(script->count("~/envA/bin/python -m pip install jupyter"), 1);
    EXPECT_EQ(script->count("~/envA/bin/python -m jupyter kernelspec list --json"), 1);
    EXPECT_EQ(script->count("~/envA/bin/python -m ipykernel install --name=k1"), 1);
    EXPECT_NE(script->find("ipykernel install").find("--sys-prefix"), std::string::npos);
    EXPECT_EQ(script->closes, 1);

    ASSERT_EQ(script->opened.size(), 1u);
    EXPECT_EQ(script->opened[0].host, "10.0.0.5");
    EXPECT_EQ(script->opened[0].user, "ubuntu");

    EXPECT_EQ(registrar.calls, std::vector<std::string>{"install:k1"});

    auto doc = manifest_json();
    ASSERT_TRUE(doc.contains("k1"));
    EXPECT_EQ(doc["k1"]["display_name"], "10.0.0.5 :: k1");
    EXPECT_EQ(doc["k1"]["interpreter"], "python3.8");
    EXPECT_EQ(doc["k1"]["language"], "python");
    EXPECT_EQ(doc["k1"]["remote_host"], "ubuntu@10.0.0.5");
    EXPECT_EQ(doc["k1"]["venv"], "envA");
}

TEST_F(KernelManagerTest, CreateReusesExistingVenv) {
    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");

    auto outcome = manager->create(kernel, std::nullopt, std::nullopt, options());

    EXPECT_FALSE(outcome.venv_created);
    EXPECT_EQ(script->count("virtualenv"), 0);
    EXPECT_EQ(script->count("ipykernel install"), 1);
}

TEST_F(KernelManagerTest, CreateExistingIdWithoutOverwriteLeavesManifestUnchanged) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    std::string before = manifest_text();

    KernelDescriptor again("10.0.0.5", "k1", "envA", "python3.8");
    EXPECT_THROW(manager->create(again, std::nullopt, std::nullopt, options()), AlreadyExistsError);

    EXPECT_EQ(manifest_text(), before);
    EXPECT_TRUE(script->opened.empty());
    EXPECT_TRUE(registrar.calls.empty());
}

TEST_F(KernelManagerTest, CreateSameIdDifferentConfigStillCollides) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    std::string before = manifest_text();

    KernelDescriptor other("10.0.0.9", "k1", "envB", "python3.9");
    EXPECT_THROW(manager->create(other, std::nullopt, std::nullopt, options()), AlreadyExistsError);
    EXPECT_EQ(manifest_text(), before);
}

TEST_F(KernelManagerTest, OverwriteReplacesRecordAndReregisters) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    script->on("kernelspec list", SSHResult{0, R"({"kernelspecs": {"k1": {"resource_dir": "/x"}}})", ""});

    KernelDescriptor replacement("10.0.0.5", "k1", "envB", "python3.9");
    auto outcome = manager->create(replacement, std::nullopt, std::nullopt, options(true));

    EXPECT_TRUE(outcome.overwrote);
    EXPECT_EQ(script->count("ipykernel install --name=k1"), 1);
    EXPECT_EQ(registrar.calls, (std::vector<std::string>{"uninstall:k1", "install:k1"}));

    auto doc = manifest_json();
    EXPECT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc["k1"]["venv"], "envB");
    EXPECT_EQ(doc["k1"]["interpreter"], "python3.9");
}

TEST_F(KernelManagerTest, DuplicateConfigurationUnderNewIdWarnsAndProceeds) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));

    KernelDescriptor twin("10.0.0.5", "k2", "envA", "python3.8");
    auto outcome = manager->create(twin, std::nullopt, std::nullopt, options(), collect());

    EXPECT_EQ(outcome.duplicate_ids, std::vector<std::string>{"k1"});
    bool warned = std::any_of(status.begin(), status.end(), [](const std::string& s) {
        return s.find("Duplicate kernel") != std::string::npos && s.find("'k1'") != std::string::npos;
    });
    EXPECT_TRUE(warned);

    auto doc = manifest_json();
    EXPECT_TRUE(doc.contains("k1"));
    EXPECT_TRUE(doc.contains("k2"));
}

TEST_F(KernelManagerTest, RemoteKernelspecPresentWithoutOverwrite) {
    script->on("kernelspec list", SSHResult{0, R"({"kernelspecs": {"K1": {}}})", ""});
    std::string before = manifest_text();

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    EXPECT_THROW(manager->create(kernel, std::nullopt, std::nullopt, options()),
                 RemoteAlreadyExistsError);

    EXPECT_EQ(script->count("ipykernel install"), 0);
    EXPECT_EQ(script->closes, 1);
    EXPECT_EQ(manifest_text(), before);
    EXPECT_TRUE(registrar.calls.empty());
}

TEST_F(KernelManagerTest, FailedInstallRaisesRemoteCommandError) {
    script->on("pip install jupyter", SSHResult{1, "Collecting jupyter", "ERROR: No space left on device"});
    std::string before = manifest_text();

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    try {
        manager->create(kernel, std::nullopt, std::nullopt, options());
        FAIL() << "expected RemoteCommandError";
    } catch (const RemoteCommandError& e) {
        EXPECT_EQ(e.step(), "kernel package install");
        EXPECT_EQ(e.exit_code(), 1);
        EXPECT_EQ(e.kernel_id(), "k1");
        EXPECT_NE(std::string(e.what()).find("No space left"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("partially provisioned"), std::string::npos);
    }

    EXPECT_EQ(script->count("ipykernel install"), 0);
    EXPECT_EQ(script->closes, 1);
    EXPECT_EQ(manifest_text(), before);
    EXPECT_TRUE(registrar.calls.empty());
}

TEST_F(KernelManagerTest, VenvCreationFailureStopsProvisioning) {
    script->on("test -d", SSHResult{1, "", ""});
    script->on("virtualenv", SSHResult{127, "", "virtualenv: command not found"});

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    EXPECT_THROW(manager->create(kernel, std::nullopt, std::nullopt, options()), RemoteCommandError);
    EXPECT_EQ(script->count("pip install"), 0);
    EXPECT_EQ(script->closes, 1);
}

TEST_F(KernelManagerTest, ChannelFailureRaisesTransportError) {
    script->on("kernelspec list", SSHResult{-1, "", "channel closed"});

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    EXPECT_THROW(manager->create(kernel, std::nullopt, std::nullopt, options()), TransportError);
    EXPECT_EQ(script->closes, 1);
    EXPECT_FALSE(store->find("k1").has_value());
}

TEST_F(KernelManagerTest, ConnectFailureRaisesTransportError) {
    script->connect_error = "Authentication failed for ubuntu@10.0.0.5";
    std::string before = manifest_text();

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    EXPECT_THROW(manager->create(kernel, std::nullopt, std::nullopt, options()), TransportError);
    EXPECT_TRUE(script->commands.empty());
    EXPECT_EQ(manifest_text(), before);
}

TEST_F(KernelManagerTest, SystemInterpreterRunsInstallsThroughSudo) {
    script->on("command -v python3", SSHResult{0, "/usr/bin/python3\n", ""});

    KernelDescriptor kernel("10.0.0.5", "k1", std::nullopt, "python3");
    auto outcome = manager->create(kernel, std::nullopt, std::nullopt, options());

    EXPECT_TRUE(outcome.escalated);
    EXPECT_EQ(script->count("test -d"), 0);
    EXPECT_EQ(script->count("sudo -n python3 -m pip install jupyter"), 1);

    std::string reg = script->find("ipykernel install");
    EXPECT_EQ(reg.rfind("sudo -n python3 -m ipykernel install --name=k1", 0), 0u);
    EXPECT_EQ(reg.find("--sys-prefix"), std::string::npos);

    EXPECT_TRUE(manifest_json()["k1"]["venv"].is_null());
}

TEST_F(KernelManagerTest, UserInterpreterInstallsWithoutSudo) {
    script->on("command -v python3", SSHResult{0, "/home/ubuntu/.pyenv/shims/python3\n", ""});

    KernelDescriptor kernel("10.0.0.5", "k1", std::nullopt, "python3");
    auto outcome = manager->create(kernel, std::nullopt, std::nullopt, options());

    EXPECT_FALSE(outcome.escalated);
    EXPECT_EQ(script->count("sudo"), 0);
    EXPECT_NE(script->find("ipykernel install").find("--sys-prefix"), std::string::npos);
}

TEST_F(KernelManagerTest, RequirementsAreUploadedIntoVenv) {
    fs::path req = test_dir / "requirements.txt";
    std::ofstream(req) << "numpy\n";

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    manager->create(kernel, std::nullopt, req, options());

    ASSERT_EQ(script->uploads.size(), 1u);
    EXPECT_EQ(script->uploads[0].first, req.string());
    EXPECT_EQ(script->uploads[0].second, "~/envA/requirements.txt");
    EXPECT_EQ(script->count("~/envA/bin/python -m pip install -r ~/envA/requirements.txt"), 1);
}

TEST_F(KernelManagerTest, MissingRequirementsFileIsRejectedBeforeConnecting) {
    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    EXPECT_THROW(manager->create(kernel, std::nullopt, test_dir / "nope.txt", options()),
                 ValidationError);
    EXPECT_TRUE(script->opened.empty());
}

TEST_F(KernelManagerTest, OptionsOverrideUserAndVenvRoot) {
    auto opts = options();
    opts.remote_username = "alice";
    opts.remote_venv_root_dir = "/opt/envs";

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    manager->create(kernel, std::string("/keys/id_ed25519"), std::nullopt, opts);

    ASSERT_EQ(script->opened.size(), 1u);
    EXPECT_EQ(script->opened[0].user, "alice");
    EXPECT_EQ(script->opened[0].ssh_key_path.value_or(""), "/keys/id_ed25519");
    EXPECT_EQ(script->count("/opt/envs/envA/bin/python -m pip install jupyter"), 1);
    EXPECT_EQ(manifest_json()["k1"]["remote_host"], "alice@10.0.0.5");
}

TEST_F(KernelManagerTest, CreateRecordsVenvRoot) {
    auto opts = options();
    opts.remote_venv_root_dir = "/opt/envs";

    manager->create(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"),
                    std::nullopt, std::nullopt, opts);

    EXPECT_EQ(manifest_json()["k1"]["venv_root"], "/opt/envs");
    EXPECT_EQ(store->find("k1")->venv_root.value_or(""), "/opt/envs");
}

// ── remove ───────────────────────────────────────────────────

TEST_F(KernelManagerTest, RemoveUsesVenvRootFromCreate) {
    auto opts = options();
    opts.remote_venv_root_dir = "/opt/envs";
    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    manager->create(kernel, std::nullopt, std::nullopt, opts);

    manager->remove(kernel);

    EXPECT_EQ(script->count("/opt/envs/envA/bin/python -m jupyter kernelspec remove -f k1"), 1);
    EXPECT_EQ(script->count("~/envA/bin/python -m jupyter kernelspec remove"), 0);
    EXPECT_FALSE(store->find("k1").has_value());
}

TEST_F(KernelManagerTest, RemoveFallsBackToConfiguredVenvRoot) {
    // Records written without venv_root
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));

    manager->remove(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));

    EXPECT_EQ(script->count("~/envA/bin/python -m jupyter kernelspec remove -f k1"), 1);
}

TEST_F(KernelManagerTest, RemoveClosesSessionWhenRegistrarFails) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    registrar.fail = true;

    EXPECT_THROW(manager->remove(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8")),
                 RegistrarError);
    EXPECT_EQ(script->closes, 1);
}

TEST_F(KernelManagerTest, RemoveUnknownIdLeavesManifestUnchanged) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    std::string before = manifest_text();

    KernelDescriptor ghost("10.0.0.5", "ghost", "envA", "python3.8");
    EXPECT_THROW(manager->remove(ghost), NotFoundError);

    EXPECT_EQ(manifest_text(), before);
    EXPECT_TRUE(script->opened.empty());
    EXPECT_TRUE(registrar.calls.empty());
}

TEST_F(KernelManagerTest, RemoveKeepsOtherRecords) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    seed(KernelDescriptor("10.0.0.6", "k2", "envB", "python3.8"), "alice");
    seed(KernelDescriptor("10.0.0.7", "k3", std::nullopt, "python3"));

    manager->remove(KernelDescriptor("10.0.0.6", "k2", "envB", "python3.8"));

    auto doc = manifest_json();
    EXPECT_EQ(doc.size(), 2u);
    EXPECT_TRUE(doc.contains("k1"));
    EXPECT_TRUE(doc.contains("k3"));
    EXPECT_FALSE(doc.contains("k2"));
    EXPECT_EQ(doc["k1"]["remote_host"], "ubuntu@10.0.0.5");

    EXPECT_EQ(registrar.calls, std::vector<std::string>{"uninstall:k2"});
    ASSERT_EQ(script->opened.size(), 1u);
    EXPECT_EQ(script->opened[0].user, "alice");
    EXPECT_EQ(script->count("~/envB/bin/python -m jupyter kernelspec remove -f k2"), 1);
}

TEST_F(KernelManagerTest, RemoveWithoutRemoteDeregisterSkipsSession) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));

    RemoveOptions opts;
    opts.remote_deregister = false;
    manager->remove(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"), std::nullopt, opts);

    EXPECT_TRUE(script->opened.empty());
    EXPECT_EQ(registrar.calls, std::vector<std::string>{"uninstall:k1"});
    EXPECT_FALSE(store->find("k1").has_value());
}

TEST_F(KernelManagerTest, RemoteDeregisterFailureOnlyWarns) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    script->on("kernelspec remove", SSHResult{1, "", "No such kernel named k1"});

    manager->remove(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"),
                    std::nullopt, RemoveOptions{}, collect());

    EXPECT_FALSE(store->find("k1").has_value());
    bool warned = std::any_of(status.begin(), status.end(), [](const std::string& s) {
        return s.find("Could not remove remote kernelspec k1") != std::string::npos;
    });
    EXPECT_TRUE(warned);
}

TEST_F(KernelManagerTest, RegistrarFailureOnRemoveKeepsRecord) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    registrar.fail = true;

    RemoveOptions opts;
    opts.remote_deregister = false;
    try {
        manager->remove(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"), std::nullopt, opts);
        FAIL() << "expected RegistrarError";
    } catch (const RegistrarError& e) {
        EXPECT_EQ(e.kernel_id(), "k1");
        EXPECT_EQ(e.host(), "10.0.0.5");
        EXPECT_NE(std::string(e.what()).find("on 10.0.0.5"), std::string::npos);
    }
    EXPECT_TRUE(store->find("k1").has_value());
}

TEST_F(KernelManagerTest, RegistrarFailureOnCreateNamesKernelAndHost) {
    registrar.fail = true;

    try {
        manager->create(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"),
                        std::nullopt, std::nullopt, options());
        FAIL() << "expected RegistrarError";
    } catch (const RegistrarError& e) {
        EXPECT_EQ(e.kernel_id(), "k1");
        EXPECT_EQ(e.host(), "10.0.0.5");
    }
}

TEST_F(KernelManagerTest, MissingManifestErrorNamesKernelAndHost) {
    fs::remove(store->path());

    KernelDescriptor kernel("10.0.0.5", "k1", "envA", "python3.8");
    try {
        manager->create(kernel, std::nullopt, std::nullopt, options());
        FAIL() << "expected ManifestUnreadable";
    } catch (const ManifestUnreadable& e) {
        EXPECT_EQ(e.kernel_id(), "k1");
        EXPECT_EQ(e.host(), "10.0.0.5");
        EXPECT_NE(e.detail().find("rkl init"), std::string::npos);
    }
    EXPECT_TRUE(script->opened.empty());

    EXPECT_THROW(manager->remove(kernel), ManifestUnreadable);
}

// ── list / helpers ───────────────────────────────────────────

TEST_F(KernelManagerTest, ListExcludesHost) {
    seed(KernelDescriptor("10.0.0.5", "k1", "envA", "python3.8"));
    seed(KernelDescriptor("10.0.0.6", "k2", "envB", "python3.8"));

    EXPECT_EQ(manager->list().size(), 2u);
    auto filtered = manager->list(std::string("10.0.0.5"));
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].kernel_id(), "k2");
    EXPECT_TRUE(script->opened.empty());
}

TEST(KernelspecListTest, ParsesJson) {
    auto names = KernelManager::parse_kernelspec_list(
        R"({"kernelspecs": {"python3": {"resource_dir": "/a"}, "MyKernel": {"resource_dir": "/b"}}})");
    EXPECT_EQ(names, (std::set<std::string>{"python3", "mykernel"}));
}

TEST(KernelspecListTest, ParsesPlainTable) {
    auto names = KernelManager::parse_kernelspec_list(
        "Available kernels:\n"
        "  python3    /usr/local/share/jupyter/kernels/python3\n"
        "  k1         /home/ubuntu/envA/share/jupyter/kernels/k1\n");
    EXPECT_EQ(names, (std::set<std::string>{"python3", "k1"}));
}

TEST(KernelspecListTest, EmptyOutput) {
    EXPECT_TRUE(KernelManager::parse_kernelspec_list("").empty());
}

TEST(RemoteLayoutTest, VenvPaths) {
    auto layout = RemoteLayout::resolve(KernelDescriptor("h", "k1", "envA", "python3.8"), "/opt/envs/");
    ASSERT_TRUE(layout.venv_dir.has_value());
    EXPECT_EQ(*layout.venv_dir, "/opt/envs/envA");
    EXPECT_EQ(layout.python, "/opt/envs/envA/bin/python");
    EXPECT_EQ(layout.requirements_path, "/opt/envs/envA/requirements.txt");
}

TEST(RemoteLayoutTest, NoVenvUsesInterpreterOnPath) {
    auto layout = RemoteLayout::resolve(KernelDescriptor("h", "k1", std::nullopt, "python3"), "~/");
    EXPECT_FALSE(layout.venv_dir.has_value());
    EXPECT_EQ(layout.python, "python3");
    EXPECT_EQ(layout.requirements_path, "~/k1-requirements.txt");
}
