#include <gtest/gtest.h>

#include "backup/Manager.hpp"
#include "cloud/Transport.hpp"
#include "config/Config.hpp"
#include "fs/Hasher.hpp"
#include "sync/Engine.hpp"
#include "sync/MetadataStore.hpp"
#include "sync/ProcessProbe.hpp"
#include "sync/RecordLayout.hpp"
#include "sync/Watcher.hpp"
#include "support/FakeStore.hpp"
#include "support/TempDir.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <algorithm>

using namespace ts;
using namespace ts::sync;
using namespace ts::sync::model;
using ts::test::FakeStore;
using ts::test::TempDir;
using ts::test::readText;
using ts::test::writeText;
namespace stdfs = std::filesystem;

namespace {

// One device: its own config root, metadata and backups, talking to a shared store.
struct Machine {
    TempDir root{"termsync-machine"};
    config::Config cfg;
    std::vector<SyncItem> items;
    std::unique_ptr<fs::Hasher> hasher;
    std::unique_ptr<backup::Manager> backups;
    std::unique_ptr<MetadataStore> store;
    std::unique_ptr<cloud::Transport> transport;
    std::unique_ptr<Engine> engine;

    Machine(const std::shared_ptr<FakeStore>& remote, const std::string& deviceId,
            const std::string& strategy = "newest", const std::string& recordId = {}) {
        cfg.cloud.api_base = ts::test::STORE_BASE;
        cfg.cloud.record_id = recordId;
        cfg.sync.config_root = root.path();
        cfg.sync.conflict_strategy = strategy;
        cfg.sync.items = {{"keymaps.yaml", {}}, {"themes/", {}}};

        items = itemsFromConfig(cfg.sync);
        hasher = std::make_unique<fs::Hasher>(root.path());
        backups = std::make_unique<backup::Manager>(cfg.backupDir(), cfg.sync.max_backups, *hasher, items);
        store = std::make_unique<MetadataStore>(cfg.metadataPath(), cfg.sync.history_limit, deviceId);
        store->load();
        transport = std::make_unique<cloud::Transport>(cfg.cloud, cfg.backupDir(),
                                                       std::vector<std::shared_ptr<cloud::transport::Mechanism>>{remote});
        engine = std::make_unique<Engine>(cfg, items, *hasher, *backups, *transport, *store);
    }

    [[nodiscard]] std::string read(const std::string& rel) const { return readText(root / rel); }
    void write(const std::string& rel, const std::string& content) const { writeText(root / rel, content); }
    [[nodiscard]] bool has(const std::string& rel) const { return stdfs::exists(root / rel); }
};

class FakeProbe final : public ProcessProbe {
public:
    bool running = false;
    [[nodiscard]] bool isRunning() override { return running; }
};

}

class EngineTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeStore> remote = std::make_shared<FakeStore>();

    // Machine A with a full configuration, already published.
    std::unique_ptr<Machine> publishedMachine(const std::string& strategy = "newest") {
        auto a = std::make_unique<Machine>(remote, "device-a", strategy);
        a->write("config.yaml", "appearance:\n  font: Hack\nprofiles:\n  - name: ssh\n    host: a.example\n");
        a->write("keymaps.yaml", "copy: ctrl+c\n");
        a->write("themes/dark.css", "body { background: black }");
        a->write("themes/debug.log", "excluded");

        const auto report = a->engine->sync();
        EXPECT_EQ(report.outcome, Outcome::Synced) << report.message;
        return a;
    }

    std::unique_ptr<Machine> joiningMachine(const Machine& a, const std::string& strategy = "newest") {
        return std::make_unique<Machine>(remote, "device-b", strategy, a.transport->recordId());
    }
};

TEST_F(EngineTest, FirstSyncPublishesEveryItem) {
    const auto a = publishedMachine();
    const auto id = a->transport->recordId();
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(a->store->snapshot().record_id, id);

    const auto& files = remote->record(id)["files"];
    EXPECT_EQ(files["config.yaml"]["content"], a->read("config.yaml"));
    EXPECT_EQ(files["termsync-themes.zip"]["encoding"], "base64");
    EXPECT_TRUE(files.contains("termsync-keymaps.yaml.zip"));

    const auto manifest = nlohmann::json::parse(files[RecordLayout::MANIFEST_NAME]["content"].get<std::string>());
    EXPECT_EQ(manifest["version"], RecordLayout::MANIFEST_VERSION);
    EXPECT_EQ(manifest["device_id"], "device-a");
    EXPECT_EQ(manifest["items"]["themes"], *a->hasher->fingerprint(a->items[2]));

    for (const auto& item : a->items) {
        const auto state = a->store->get(item.name);
        ASSERT_TRUE(state.has_value()) << item.name;
        EXPECT_EQ(state->last_local, a->hasher->fingerprint(item));
    }
}

TEST_F(EngineTest, RepeatedSyncIsIdempotent) {
    const auto a = publishedMachine();
    const auto patchesBefore = remote->patches + remote->posts;

    const auto report = a->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::NoChanges);
    EXPECT_EQ(remote->patches + remote->posts, patchesBefore);
}

TEST_F(EngineTest, SecondMachineConverges) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);

    const auto report = b->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::Synced) << report.message;
    EXPECT_EQ(b->read("config.yaml"), a->read("config.yaml"));
    EXPECT_EQ(b->read("keymaps.yaml"), "copy: ctrl+c\n");
    EXPECT_EQ(b->read("themes/dark.css"), "body { background: black }");
    EXPECT_FALSE(b->has("themes/debug.log"));

    EXPECT_EQ(a->engine->localFingerprints(), b->engine->localFingerprints());
    EXPECT_EQ(b->engine->sync().outcome, Outcome::NoChanges);
    EXPECT_EQ(a->engine->sync().outcome, Outcome::NoChanges);
}

TEST_F(EngineTest, ChangesPropagateBetweenMachines) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    a->write("themes/light.css", "body { background: white }");
    a->write("themes/dark.css", "body { background: #111 }");
    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);

    const auto report = b->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::Synced);
    EXPECT_EQ(b->read("themes/light.css"), "body { background: white }");
    EXPECT_EQ(b->read("themes/dark.css"), "body { background: #111 }");

    // every download left a snapshot of what it replaced
    const auto entries = b->engine->listBackups();
    EXPECT_TRUE(std::ranges::any_of(entries, [](const auto& e) { return e.item == "themes" && e.reason == "pre-download"; }));
}

TEST_F(EngineTest, AuxiliaryDeletionPropagates) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    stdfs::remove(a->root / "keymaps.yaml");
    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);
    EXPECT_FALSE(remote->record(a->transport->recordId())["files"].contains("termsync-keymaps.yaml.zip"));

    EXPECT_EQ(b->engine->sync().outcome, Outcome::Synced);
    EXPECT_FALSE(b->has("keymaps.yaml"));
    EXPECT_EQ(b->engine->sync().outcome, Outcome::NoChanges);
}

TEST_F(EngineTest, PrimaryDocumentIsMergedWhenBothSidesChange) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    a->write("config.yaml", "appearance:\n  font: Hack\n  size: 14\nprofiles:\n  - name: ssh\n    host: a.example\n");
    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);

    b->write("config.yaml", "appearance:\n  font: Hack\nprofiles:\n  - name: ssh\n    host: a.example\n  - name: work\n    host: w.example\n");
    const auto report = b->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::Synced) << report.message;

    const auto merged = YAML::Load(b->read("config.yaml"));
    EXPECT_EQ(merged["appearance"]["size"].as<int>(), 14);
    EXPECT_EQ(merged["profiles"].size(), 2u);
    EXPECT_EQ(merged["profiles"][1]["name"].as<std::string>(), "work");

    EXPECT_EQ(remote->record(a->transport->recordId())["files"]["config.yaml"]["content"], b->read("config.yaml"));

    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);
    EXPECT_EQ(a->read("config.yaml"), b->read("config.yaml"));
}

TEST_F(EngineTest, UnparseableRemoteDocumentFallsBackToNewest) {
    const auto a = publishedMachine("merge");
    const auto b = joiningMachine(*a, "merge");
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);
    const auto id = a->transport->recordId();

    // a foreign writer left broken YAML behind, long before the local edit
    auto& rec = remote->record(id);
    rec["files"]["config.yaml"]["content"] = "appearance: [unclosed\n";
    rec["updated_at"] = util::timestampToString(978307200);
    b->write("config.yaml", "appearance:\n  font: Fira\n");

    const auto report = b->engine->sync();
    ASSERT_EQ(report.outcome, Outcome::Synced) << report.message;
    const auto primary = std::ranges::find_if(report.items, [](const auto& r) { return r.item == "config.yaml"; });
    ASSERT_NE(primary, report.items.end());
    EXPECT_EQ(primary->action, ActionType::Merge);
    EXPECT_NE(primary->detail.find("newest kept local"), std::string::npos) << primary->detail;

    EXPECT_EQ(b->read("config.yaml"), "appearance:\n  font: Fira\n");
    EXPECT_EQ(remote->record(id)["files"]["config.yaml"]["content"], b->read("config.yaml"));

    const auto fp = b->hasher->fingerprint(b->items[0]);
    const auto state = b->store->get("config.yaml");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->last_local, fp);
    EXPECT_EQ(state->last_remote, fp);

    // broken remote that is newer wins the whole-document choice, then fails validation and is rolled back
    remote->record(id)["files"]["config.yaml"]["content"] = "appearance: [unclosed\n";
    remote->record(id)["updated_at"] = util::timestampToString(4102444800);
    b->write("config.yaml", "appearance:\n  font: Iosevka\n");

    EXPECT_EQ(b->engine->sync().outcome, Outcome::Failed);
    EXPECT_EQ(b->read("config.yaml"), "appearance:\n  font: Iosevka\n");
    EXPECT_EQ(b->store->get("config.yaml")->last_local, fp);
}

TEST_F(EngineTest, InvalidDownloadIsRolledBack) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    const auto& keymaps = b->items[1];
    const auto before = b->store->get("keymaps.yaml");
    ASSERT_TRUE(before.has_value());
    const auto original = b->hasher->fingerprint(keymaps);

    a->write("keymaps.yaml", "copy: [ctrl+c\n");
    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);

    const auto report = b->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::Failed);
    const auto result = std::ranges::find_if(report.items, [](const auto& r) { return r.item == "keymaps.yaml"; });
    ASSERT_NE(result, report.items.end());
    EXPECT_EQ(result->action, ActionType::Download);
    EXPECT_FALSE(result->ok);

    EXPECT_EQ(b->read("keymaps.yaml"), "copy: ctrl+c\n");
    EXPECT_EQ(b->hasher->fingerprint(keymaps), original);

    const auto snapshots = b->engine->listBackups();
    EXPECT_TRUE(std::ranges::any_of(snapshots, [&](const auto& e) {
        return e.item == "keymaps.yaml" && e.reason == "pre-download" && !e.absent && e.fingerprint == original;
    }));

    const auto after = b->store->get("keymaps.yaml");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->last_local, before->last_local);
    EXPECT_EQ(after->last_remote, before->last_remote);
    EXPECT_EQ(after->history.size(), before->history.size());
}

TEST_F(EngineTest, ManualStrategyLeavesBothSidesUntouched) {
    const auto a = publishedMachine("manual");
    const auto b = joiningMachine(*a, "manual");
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    a->write("themes/dark.css", "from a");
    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);
    const auto remoteBefore = remote->record(a->transport->recordId())["files"]["termsync-themes.zip"];

    b->write("themes/dark.css", "from b");
    const auto report = b->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::Pending);
    EXPECT_EQ(b->read("themes/dark.css"), "from b");
    EXPECT_EQ(remote->record(a->transport->recordId())["files"]["termsync-themes.zip"], remoteBefore);
}

TEST_F(EngineTest, UnreachableStoreSavesUploadOffline) {
    const auto a = publishedMachine();
    const auto before = a->store->get("keymaps.yaml");

    a->write("keymaps.yaml", "copy: ctrl+shift+c\n");
    remote->writesOffline = true;

    const auto offline = a->engine->sync();
    EXPECT_EQ(offline.outcome, Outcome::OfflineSaved);
    ASSERT_TRUE(offline.fallbackFile.has_value());
    EXPECT_TRUE(stdfs::exists(*offline.fallbackFile));
    EXPECT_EQ(a->store->get("keymaps.yaml")->last_local, before->last_local);

    remote->writesOffline = false;
    EXPECT_EQ(a->engine->sync().outcome, Outcome::Synced);
    EXPECT_EQ(a->store->get("keymaps.yaml")->last_local, a->hasher->fingerprint(a->items[1]));
}

TEST_F(EngineTest, UnavailableStoreFailsWithoutWriting) {
    const auto a = publishedMachine();
    a->write("keymaps.yaml", "changed\n");
    remote->offline = true;

    const auto report = a->engine->sync();
    EXPECT_EQ(report.outcome, Outcome::Failed);
    EXPECT_NE(report.message.find("unavailable"), std::string::npos);
    EXPECT_EQ(a->read("keymaps.yaml"), "changed\n");
}

TEST_F(EngineTest, ForceDownloadNeedsARecord) {
    Machine fresh(remote, "device-c");
    fresh.write("config.yaml", "a: 1\n");

    const auto report = fresh.engine->forceDownload();
    EXPECT_EQ(report.outcome, Outcome::Failed);
    EXPECT_EQ(fresh.read("config.yaml"), "a: 1\n");
}

TEST_F(EngineTest, ForceDownloadOverwritesLocalChanges) {
    const auto a = publishedMachine();
    a->write("themes/dark.css", "local experiment");
    a->write("themes/extra.css", "local only");

    EXPECT_EQ(a->engine->forceDownload().outcome, Outcome::Synced);
    EXPECT_EQ(a->read("themes/dark.css"), "body { background: black }");
    EXPECT_FALSE(a->has("themes/extra.css"));
    EXPECT_TRUE(a->has("themes/debug.log"));
}

TEST_F(EngineTest, DamagedRecordFailsUntilForceUpload) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    remote->record(a->transport->recordId())["files"]["termsync-themes.zip"]["content"] = "%%% not base64 %%%";

    const auto damaged = b->engine->sync();
    EXPECT_EQ(damaged.outcome, Outcome::Failed);
    EXPECT_NE(damaged.message.find("force-upload"), std::string::npos);
    EXPECT_EQ(b->read("themes/dark.css"), "body { background: black }");

    EXPECT_EQ(a->engine->forceUpload().outcome, Outcome::Synced);
    EXPECT_EQ(b->engine->sync().outcome, Outcome::NoChanges);
}

TEST_F(EngineTest, RestoreAndRollbackThroughEngine) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    const auto snapshots = b->engine->listBackups();
    const auto pre = std::ranges::find_if(snapshots, [](const auto& e) { return e.item == "keymaps.yaml"; });
    ASSERT_NE(pre, snapshots.end());
    EXPECT_TRUE(pre->absent);

    const auto result = b->engine->restore(pre->id);
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(b->has("keymaps.yaml"));

    b->engine->rollback(result.rollbackOffer.id);
    EXPECT_EQ(b->read("keymaps.yaml"), "copy: ctrl+c\n");

    EXPECT_THROW((void)b->engine->restore("no-such-snapshot"), BackupError);
    EXPECT_THROW(b->engine->rollback("no-such-snapshot"), BackupError);
}

TEST_F(EngineTest, StatusReflectsLocalEdits) {
    const auto a = publishedMachine();
    a->write("keymaps.yaml", "edited\n");

    const auto s = a->engine->status();
    EXPECT_EQ(s.record_id, a->transport->recordId());
    EXPECT_EQ(s.device_id, "device-a");
    EXPECT_EQ(s.strategy, "newest");
    EXPECT_GT(s.last_sync, 0);
    EXPECT_TRUE(s.remote_updated_at.has_value());
    ASSERT_EQ(s.items.size(), 3u);

    for (const auto& item : s.items)
        EXPECT_EQ(item.changedLocally, item.name == "keymaps.yaml") << item.name;
}

TEST_F(EngineTest, PullAndPushOnlyMoveOneWay) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    a->write("keymaps.yaml", "from a\n");
    ASSERT_EQ(a->engine->push().outcome, Outcome::Synced);

    b->write("themes/dark.css", "from b");
    EXPECT_EQ(b->engine->pull().outcome, Outcome::Synced);
    EXPECT_EQ(b->read("keymaps.yaml"), "from a\n");

    // the local theme edit was not published by the pull
    EXPECT_EQ(a->engine->pull().outcome, Outcome::NoChanges);
    EXPECT_EQ(b->engine->push().outcome, Outcome::Synced);
    EXPECT_EQ(a->engine->pull().outcome, Outcome::Synced);
    EXPECT_EQ(a->read("themes/dark.css"), "from b");
}

TEST_F(EngineTest, PushMergesPrimaryChangedOnBothSides) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    a->write("config.yaml", "appearance:\n  font: Hack\n  size: 14\nprofiles:\n  - name: ssh\n    host: a.example\n");
    ASSERT_EQ(a->engine->push().outcome, Outcome::Synced);

    b->write("config.yaml", "appearance:\n  font: Hack\nprofiles:\n  - name: ssh\n    host: a.example\n  - name: work\n    host: w.example\n");
    const auto pushed = b->engine->push();
    EXPECT_EQ(pushed.outcome, Outcome::Synced) << pushed.message;

    const auto merged = YAML::Load(b->read("config.yaml"));
    EXPECT_EQ(merged["appearance"]["size"].as<int>(), 14);
    EXPECT_EQ(merged["profiles"].size(), 2u);

    EXPECT_EQ(a->engine->pull().outcome, Outcome::Synced);
    EXPECT_EQ(a->read("config.yaml"), b->read("config.yaml"));
}

TEST_F(EngineTest, WatcherPullsOnStartAndPushesOnStop) {
    const auto a = publishedMachine();
    const auto b = joiningMachine(*a);
    const auto probe = std::make_shared<FakeProbe>();
    Watcher watcher(*b->engine, probe, std::chrono::milliseconds(10));

    EXPECT_FALSE(watcher.poll().has_value());

    probe->running = true;
    const auto started = watcher.poll();
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(started->outcome, Outcome::Synced);
    EXPECT_TRUE(b->has("themes/dark.css"));
    EXPECT_FALSE(watcher.poll().has_value());

    probe->running = false;
    EXPECT_FALSE(watcher.poll().has_value());  // nothing edited while running

    probe->running = true;
    ASSERT_TRUE(watcher.poll().has_value());
    b->write("keymaps.yaml", "edited while running\n");
    probe->running = false;

    const auto stopped = watcher.poll();
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->outcome, Outcome::Synced);

    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);
    EXPECT_EQ(a->read("keymaps.yaml"), "edited while running\n");
}

TEST_F(EngineTest, WatcherStartedWhileApplicationRunsDoesNotPull) {
    const auto a = publishedMachine();
    const auto probe = std::make_shared<FakeProbe>();
    probe->running = true;
    Watcher watcher(*a->engine, probe, std::chrono::milliseconds(10));

    const auto gets = remote->gets;
    EXPECT_FALSE(watcher.poll().has_value());
    EXPECT_FALSE(watcher.poll().has_value());
    EXPECT_EQ(remote->gets, gets);

    a->write("keymaps.yaml", "edited before the watcher noticed\n");
    probe->running = false;
    const auto stopped = watcher.poll();
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->outcome, Outcome::Synced);
}

TEST_F(EngineTest, WatcherRetriesPushThatDidNotPublish) {
    const auto a = publishedMachine("manual");
    const auto b = joiningMachine(*a, "manual");
    ASSERT_EQ(b->engine->sync().outcome, Outcome::Synced);

    const auto probe = std::make_shared<FakeProbe>();
    Watcher watcher(*b->engine, probe, std::chrono::milliseconds(10));
    EXPECT_FALSE(watcher.poll().has_value());

    probe->running = true;
    ASSERT_TRUE(watcher.poll().has_value());

    a->write("config.yaml", "appearance:\n  font: Fira\n");
    ASSERT_EQ(a->engine->sync().outcome, Outcome::Synced);
    b->write("config.yaml", "appearance:\n  font: Iosevka\n");

    probe->running = false;
    const auto first = watcher.poll();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->outcome, Outcome::Pending);

    // nothing edited since, the unresolved conflict is still reported
    probe->running = true;
    ASSERT_TRUE(watcher.poll().has_value());
    probe->running = false;
    const auto second = watcher.poll();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->outcome, Outcome::Pending);
    EXPECT_EQ(b->read("config.yaml"), "appearance:\n  font: Iosevka\n");
}

TEST_F(EngineTest, WatcherLoopStopsPromptly) {
    const auto a = publishedMachine();
    const auto probe = std::make_shared<FakeProbe>();
    Watcher watcher(*a->engine, probe, std::chrono::milliseconds(5000));

    watcher.start();
    EXPECT_TRUE(watcher.isRunning());

    const auto begin = std::chrono::steady_clock::now();
    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
}
