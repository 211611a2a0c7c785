#include <gtest/gtest.h>

#include "sync/MetadataStore.hpp"
#include "support/TempDir.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

using namespace ts;
using namespace ts::sync;
using ts::test::TempDir;
using ts::test::readText;
using ts::test::writeText;
namespace stdfs = std::filesystem;

namespace {

constexpr auto FP_A = "0123456789abcdef0123456789abcdef";
constexpr auto FP_B = "fedcba9876543210fedcba9876543210";

}

class MetadataStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    stdfs::path file = dir / ".sync_metadata.json";
};

TEST_F(MetadataStoreTest, MissingFileStartsFresh) {
    MetadataStore store(file, 10, "device-1");
    store.load();

    EXPECT_FALSE(store.get("config.yaml").has_value());
    const auto meta = store.snapshot();
    EXPECT_EQ(meta.device_id, "device-1");
    EXPECT_TRUE(meta.record_id.empty());
    EXPECT_EQ(meta.lastSync(), 0);
    EXPECT_FALSE(stdfs::exists(file));
}

TEST_F(MetadataStoreTest, CommitPersistsAcrossReload) {
    {
        MetadataStore store(file, 10, "device-1");
        store.load();
        store.commit("config.yaml", FP_A, FP_A, "upload");
        store.commit("themes", std::nullopt, std::nullopt, "adopt");
        store.setRecordId("rec42");
    }

    MetadataStore reloaded(file, 10, "device-1");
    reloaded.load();

    const auto primary = reloaded.get("config.yaml");
    ASSERT_TRUE(primary.has_value());
    EXPECT_EQ(primary->last_local, FP_A);
    EXPECT_EQ(primary->last_remote, FP_A);
    EXPECT_GT(primary->last_sync, 0);
    ASSERT_EQ(primary->history.size(), 1u);
    EXPECT_EQ(primary->history.front().action, "upload");
    EXPECT_EQ(primary->history.front().device_id, "device-1");

    const auto themes = reloaded.get("themes");
    ASSERT_TRUE(themes.has_value());
    EXPECT_FALSE(themes->last_local.has_value());
    EXPECT_FALSE(themes->last_remote.has_value());

    EXPECT_EQ(reloaded.snapshot().record_id, "rec42");

    const auto raw = nlohmann::json::parse(readText(file));
    EXPECT_TRUE(raw["targets"]["themes"]["last_local"].is_null());
}

TEST_F(MetadataStoreTest, HistoryIsCapped) {
    MetadataStore store(file, 3, "device-1");
    store.load();

    for (int i = 0; i < 6; ++i) store.commit("config.yaml", FP_A, FP_B, "sync-" + std::to_string(i));

    const auto state = store.get("config.yaml");
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->history.size(), 3u);
    EXPECT_EQ(state->history.front().action, "sync-3");
    EXPECT_EQ(state->history.back().action, "sync-5");
}

TEST_F(MetadataStoreTest, CorruptFileIsMovedAside) {
    writeText(file, "{ this is not json");

    MetadataStore store(file, 10, "device-1");
    store.load();

    EXPECT_FALSE(store.get("config.yaml").has_value());
    EXPECT_FALSE(stdfs::exists(file));

    bool movedAside = false;
    for (const auto& de : stdfs::directory_iterator(dir.path()))
        if (de.path().filename().string().starts_with(".sync_metadata.json.corrupt-")) movedAside = true;
    EXPECT_TRUE(movedAside);

    // the store keeps working after recovery
    store.commit("config.yaml", FP_A, FP_A, "upload");
    EXPECT_TRUE(stdfs::exists(file));
}

TEST_F(MetadataStoreTest, FailedPersistLeavesMemoryUntouched) {
    writeText(dir / "blocker", "a file, not a directory");
    MetadataStore store(dir / "blocker" / "meta.json", 10, "device-1");
    store.load();

    EXPECT_THROW(store.commit("config.yaml", FP_A, FP_A, "upload"), MetadataError);
    EXPECT_FALSE(store.get("config.yaml").has_value());
}

TEST_F(MetadataStoreTest, LoadedRecordSpeaksForThisDevice) {
    writeText(file, R"({"device_id":"someone-else","record_id":"rec1","targets":{}})");

    MetadataStore store(file, 10, "device-1");
    store.load();
    EXPECT_EQ(store.snapshot().device_id, "device-1");
    EXPECT_EQ(store.snapshot().record_id, "rec1");
}

TEST(MetadataStoreDeviceTest, DeviceIdIsStableHex) {
    const auto id = MetadataStore::computeDeviceId();
    EXPECT_EQ(id.size(), 32u);
    for (const char c : id) EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(id, MetadataStore::computeDeviceId());
}
