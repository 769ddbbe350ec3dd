#include "SessionStore.hpp"
#include "FakeEngine.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.ensure_layout(dir / "downloads");
    }

    TempDir dir;
    SessionStore store{ dir / "state" };
};

TEST_F(SessionStoreTest, LayoutIsCreated) {
    EXPECT_TRUE(fs::is_directory(store.state_dir()));
    EXPECT_TRUE(fs::is_directory(store.resume_dir()));
    EXPECT_TRUE(fs::is_directory(dir / "downloads"));
}

TEST_F(SessionStoreTest, MissingSessionGivesDefaults) {
    auto state = store.load_session();

    EXPECT_FALSE(state.loaded);
    EXPECT_TRUE(state.settings.empty());
    EXPECT_TRUE(state.engine_state.empty());

    auto merged = merge_settings(default_settings(), state.settings);
    EXPECT_EQ(get_bool(merged, "enable_dht"), true);
    EXPECT_EQ(get_bool(merged, "enable_upnp"), true);
    EXPECT_EQ(get_bool(merged, "enable_natpmp"), true);
    EXPECT_FALSE(get_string(merged, "listen_interfaces").value_or("").empty());
}

TEST_F(SessionStoreTest, SessionRoundTrips) {
    SettingsMap settings{
        { "download_rate_limit", int64_t{ 512000 } },
        { "enable_dht", false },
        { "listen_interfaces", std::string("0.0.0.0:7000") },
    };
    std::string blob("dht\0state", 9);

    ASSERT_TRUE(store.save_session(settings, blob));

    auto state = store.load_session();
    EXPECT_TRUE(state.loaded);
    EXPECT_EQ(state.settings, settings);
    EXPECT_EQ(state.engine_state, blob);
    EXPECT_FALSE(fs::exists(fs::path(store.session_file()) += ".tmp"));
}

TEST_F(SessionStoreTest, CorruptSessionGivesDefaults) {
    write_text(store.session_file(), "d8:settingsi3e");

    SessionState state;
    EXPECT_NO_THROW(state = store.load_session());
    EXPECT_FALSE(state.loaded);
    EXPECT_TRUE(state.settings.empty());
}

TEST_F(SessionStoreTest, ResumeRecordReadsBackWithSameHash) {
    auto hash = make_hash(7);
    auto blob = fake_resume_blob(hash);

    ASSERT_TRUE(store.save_job_resume(hash, blob));
    EXPECT_TRUE(fs::exists(store.resume_file(hash)));

    auto scan = store.load_all_job_resumes();
    auto record = scan.next();

    ASSERT_TRUE(record);
    EXPECT_EQ(record->content_hash, hash);
    EXPECT_EQ(record->blob, blob);
    EXPECT_FALSE(scan.next());
    EXPECT_EQ(scan.skipped(), 0u);
}

TEST_F(SessionStoreTest, CorruptResumeFilesAreSkipped) {
    auto good = make_hash(1);
    ASSERT_TRUE(store.save_job_resume(good, fake_resume_blob(good)));

    write_text(store.resume_dir() / (make_hash(2) + ".fastresume"), "not bencode at all");
    write_text(store.resume_dir() / (make_hash(3) + ".fastresume"), "d4:name3:fooe");
    write_text(store.resume_dir() / "notes.txt", "ignored");

    auto scan = store.load_all_job_resumes();
    std::vector<std::string> hashes;
    EXPECT_NO_THROW({
        while (auto record = scan.next()) hashes.push_back(record->content_hash);
    });

    ASSERT_EQ(hashes.size(), 1u);
    EXPECT_EQ(hashes[0], good);
    EXPECT_EQ(scan.skipped(), 2u);
}

TEST_F(SessionStoreTest, MissingResumeDirectoryIsEmpty) {
    fs::remove_all(store.resume_dir());

    auto scan = store.load_all_job_resumes();
    EXPECT_FALSE(scan.next());
}

TEST_F(SessionStoreTest, RefusesMalformedHash) {
    EXPECT_FALSE(store.save_job_resume("../../etc/passwd", "x"));
    EXPECT_FALSE(store.save_job_resume("", "x"));
}

TEST_F(SessionStoreTest, RemoveDeletesRecord) {
    auto hash = make_hash(9);
    ASSERT_TRUE(store.save_job_resume(hash, fake_resume_blob(hash)));

    EXPECT_TRUE(store.remove_job_resume(hash));
    EXPECT_FALSE(fs::exists(store.resume_file(hash)));
    EXPECT_FALSE(store.remove_job_resume(hash));
}

TEST(SessionStoreHashTest, FallsBackToTruncatedV2Hash) {
    std::string v2(32, '\0');
    for (size_t i = 0; i < v2.size(); ++i) v2[i] = static_cast<char>(i + 1);

    BEncodeValue::Dict dict;
    dict.emplace("info-hash", BEncodeValue{ std::string(20, '\0') });
    dict.emplace("info-hash2", BEncodeValue{ v2 });

    auto hash = SessionStore::content_hash_of(bencode(BEncodeValue{ std::move(dict) }));
    ASSERT_TRUE(hash);
    EXPECT_EQ(*hash, to_hex(v2.substr(0, 20)));
}

TEST(SessionStoreHashTest, RejectsRecordsWithoutHash) {
    EXPECT_FALSE(SessionStore::content_hash_of("le"));
    EXPECT_FALSE(SessionStore::content_hash_of("d9:info-hash3:abce"));
    EXPECT_FALSE(SessionStore::content_hash_of("garbage"));
}
