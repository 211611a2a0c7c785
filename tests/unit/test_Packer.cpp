#include <gtest/gtest.h>

#include "archive/Packer.hpp"
#include "concurrency/ThreadPool.hpp"
#include "fs/Hasher.hpp"
#include "support/TempDir.hpp"
#include "util/errors.hpp"

#include <zip.h>

#include <algorithm>

using namespace ts;
using namespace ts::sync::model;
using ts::test::TempDir;
using ts::test::readText;
using ts::test::writeText;

namespace {

SyncItem dirItem(const std::string& name) {
    return {name, SyncItem::Kind::Directory, {"*.log", "*.tmp", "node_modules", ".gitkeep"}, false};
}

// Builds a stored (uncompressed) zip holding a single entry with an arbitrary name.
util::Blob zipWithEntry(const std::string& name, const std::string& content) {
    zip_error_t err;
    zip_error_init(&err);
    zip_source_t* buf = zip_source_buffer_create(nullptr, 0, 0, &err);
    zip_t* za = zip_open_from_source(buf, ZIP_TRUNCATE, &err);
    zip_source_keep(buf);

    zip_source_t* file = zip_source_buffer(za, content.data(), content.size(), 0);
    zip_file_add(za, name.c_str(), file, ZIP_FL_ENC_UTF_8);
    zip_close(za);

    zip_source_open(buf);
    zip_source_seek(buf, 0, SEEK_END);
    util::Blob out(static_cast<size_t>(zip_source_tell(buf)));
    zip_source_seek(buf, 0, SEEK_SET);
    zip_source_read(buf, out.data(), out.size());
    zip_source_close(buf);
    zip_source_free(buf);
    zip_error_fini(&err);
    return out;
}

}

TEST(PackerTest, RoundTripDropsExcludedFiles) {
    TempDir src, dst;
    writeText(src / "profiles/ssh.yaml", "host: example\n");
    writeText(src / "profiles/nested/local.yaml", "shell: zsh\n");
    writeText(src / "profiles/session.log", "ignored");
    writeText(src / "profiles/.gitkeep", "");
    writeText(src / "profiles/node_modules/pkg/index.js", "ignored");

    const fs::Hasher hasher(src.path());
    const auto blob = archive::Packer::pack(hasher, {dirItem("profiles")});
    ASSERT_TRUE(archive::Packer::looksLikeZip(blob));

    auto names = archive::Packer::entries(blob);
    std::ranges::sort(names);
    EXPECT_EQ(names, (std::vector<std::string>{"profiles/nested/local.yaml", "profiles/ssh.yaml"}));

    concurrency::ThreadPool pool(2);
    archive::Packer::unpack(blob, dst.path(), &pool);

    EXPECT_EQ(readText(dst / "profiles/ssh.yaml"), "host: example\n");
    EXPECT_EQ(readText(dst / "profiles/nested/local.yaml"), "shell: zsh\n");
    EXPECT_FALSE(std::filesystem::exists(dst / "profiles/session.log"));

    // non-excluded content hashes identically on both sides
    const fs::Hasher dstHasher(dst.path());
    EXPECT_EQ(hasher.fingerprint(dirItem("profiles")), dstHasher.fingerprint(dirItem("profiles")));
}

TEST(PackerTest, FileItemsUseTheirOwnName) {
    TempDir src;
    writeText(src / "keymaps.yaml", "paste: ctrl+v\n");

    const fs::Hasher hasher(src.path());
    const SyncItem item{"keymaps.yaml", SyncItem::Kind::File, {}, false};
    EXPECT_EQ(archive::Packer::entries(archive::Packer::pack(hasher, {item})), std::vector<std::string>{"keymaps.yaml"});
}

TEST(PackerTest, EmptyItemPacksToValidEmptyArchive) {
    TempDir src, dst;
    std::filesystem::create_directories(src / "themes");

    const fs::Hasher hasher(src.path());
    const auto blob = archive::Packer::pack(hasher, {dirItem("themes")});

    ASSERT_TRUE(archive::Packer::looksLikeZip(blob));
    EXPECT_TRUE(archive::Packer::entries(blob).empty());
    EXPECT_NO_THROW(archive::Packer::unpack(blob, dst.path()));
}

TEST(PackerTest, RejectsEntriesEscapingTheRoot) {
    TempDir dst;
    const auto evil = zipWithEntry("../evil.txt", "pwned");

    EXPECT_THROW(archive::Packer::unpack(evil, dst / "root"), IntegrityError);
    EXPECT_FALSE(std::filesystem::exists(dst / "evil.txt"));

    const auto absolute = zipWithEntry("/tmp/termsync-absolute.txt", "pwned");
    EXPECT_THROW(archive::Packer::unpack(absolute, dst.path()), IntegrityError);
}

TEST(PackerTest, RejectsGarbage) {
    TempDir dst;
    const util::Blob garbage = {'n', 'o', 't', ' ', 'a', ' ', 'z', 'i', 'p'};

    EXPECT_FALSE(archive::Packer::looksLikeZip(garbage));
    EXPECT_THROW(archive::Packer::unpack(garbage, dst.path()), IntegrityError);
    EXPECT_THROW(archive::Packer::entries(garbage), IntegrityError);
}
