#include <gtest/gtest.h>
#include <store/json_file_store.hpp>
#include <store/serializing_store.hpp>
#include <platform/file_lock.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>

namespace fs = std::filesystem;

class JsonFileStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("ktun_store_test_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    JsonFileKvStore make_store(int timeout_ms = 200) {
        return JsonFileKvStore(test_dir / "state.json", test_dir / ".lock", timeout_ms);
    }

    std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(JsonFileStoreTest, GetMissingThrowsKeyNotFound) {
    auto store = make_store();
    auto session = store.begin_session();
    try {
        session.get("nope");
        FAIL() << "expected KeyNotFound";
    } catch (const KeyNotFound& e) {
        EXPECT_EQ(e.key(), "nope");
    }
}

TEST_F(JsonFileStoreTest, KeyNotFoundIsOutOfRange) {
    auto store = make_store();
    auto session = store.begin_session();
    EXPECT_THROW(session.get("nope"), std::out_of_range);
}

TEST_F(JsonFileStoreTest, SetThenGet) {
    auto store = make_store();
    auto session = store.begin_session();
    session.set("a", {{"x", 1}});
    EXPECT_EQ(session.get("a")["x"], 1);
}

TEST_F(JsonFileStoreTest, SurvivesAcrossSessions) {
    auto store = make_store();
    {
        auto session = store.begin_session();
        session.set("a", "hello");
        session.set("b", 42);
    }
    auto session = store.begin_session();
    EXPECT_EQ(session.get("a"), "hello");
    EXPECT_EQ(session.get("b"), 42);
}

TEST_F(JsonFileStoreTest, CacheDiscardedOnClose) {
    auto store = make_store();
    {
        auto session = store.begin_session();
        session.set("a", 1);
    }

    // Another writer replaces the file between sessions.
    std::ofstream(test_dir / "state.json") << R"({"a": 2, "c": true})";

    auto session = store.begin_session();
    EXPECT_EQ(session.get("a"), 2);
    EXPECT_EQ(session.get("c"), true);
}

TEST_F(JsonFileStoreTest, RemoveAndList) {
    auto store = make_store();
    auto session = store.begin_session();
    session.set("a", 1);
    session.set("b", 2);
    session.set("c", 3);
    session.remove("b");

    auto keys = session.list();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "c"}));
    EXPECT_THROW(session.remove("b"), KeyNotFound);
}

TEST_F(JsonFileStoreTest, UntouchedSessionWritesNothing) {
    auto store = make_store();
    {
        auto session = store.begin_session();
    }
    EXPECT_FALSE(fs::exists(test_dir / "state.json"));
}

TEST_F(JsonFileStoreTest, ReadOnlySessionKeepsContent) {
    std::ofstream(test_dir / "state.json") << R"({"a": 1})";
    auto store = make_store();
    {
        auto session = store.begin_session();
        EXPECT_EQ(session.list().size(), 1u);
    }
    auto session = store.begin_session();
    EXPECT_EQ(session.get("a"), 1);
}

TEST_F(JsonFileStoreTest, ClosedSessionRejectsAccess) {
    auto store = make_store();
    auto session = store.begin_session();
    session.set("a", 1);
    session.close();
    EXPECT_FALSE(session.is_open());
    EXPECT_THROW(session.get("a"), std::logic_error);
    EXPECT_THROW(session.set("a", 2), std::logic_error);
    EXPECT_NO_THROW(session.close());
}

TEST_F(JsonFileStoreTest, CorruptFileIsAnError) {
    std::ofstream(test_dir / "state.json") << "{ not json";
    auto store = make_store();
    auto session = store.begin_session();
    EXPECT_THROW(session.get("a"), std::runtime_error);
}

TEST_F(JsonFileStoreTest, NonObjectTopLevelIsAnError) {
    std::ofstream(test_dir / "state.json") << "[1, 2]";
    auto store = make_store();
    auto session = store.begin_session();
    EXPECT_THROW(session.list(), std::runtime_error);
}

TEST_F(JsonFileStoreTest, SecondSessionTimesOut) {
    auto store = make_store(100);
    auto first = store.begin_session();
    EXPECT_THROW(store.begin_session(), LockTimeout);

    first.close();
    EXPECT_NO_THROW(store.begin_session());
}

TEST_F(JsonFileStoreTest, NoLockFileMeansNoLocking) {
    JsonFileKvStore store(test_dir / "state.json", std::nullopt, 100);
    auto first = store.begin_session();
    auto second = store.begin_session();
    EXPECT_FALSE(fs::exists(test_dir / ".lock"));
}

TEST_F(JsonFileStoreTest, SerializingStoreDecodeFailure) {
    auto store = make_store();
    auto session = store.begin_session();
    session.set("n", "not a number");

    SerializingStore<int> ints(session);
    EXPECT_THROW(ints.get("n"), std::runtime_error);
    EXPECT_THROW(ints.get("missing"), KeyNotFound);

    ints.set("m", 7);
    EXPECT_EQ(ints.get("m"), 7);
}
