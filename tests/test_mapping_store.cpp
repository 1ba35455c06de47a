#include <gtest/gtest.h>
#include <managers/mapping_store.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

class MappingStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path store_file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("roxy_store_test_" + std::to_string(getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        store_file = test_dir / "port_mappings.yaml";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_store(const std::string& content) {
        std::ofstream(store_file) << content;
    }

    static MappingSet sorted(MappingSet m) {
        std::sort(m.begin(), m.end(), [](const MappingRecord& a, const MappingRecord& b) {
            return a.external_port < b.external_port;
        });
        return m;
    }
};

TEST_F(MappingStoreTest, FirstPairGetsStartPortNextGetsStartPlusOne) {
    MappingStore store(store_file, 10000);

    auto a = store.resolve("192.168.1.10", "ssh");
    ASSERT_TRUE(a.is_ok()) << a.error;
    EXPECT_EQ(a.value, 10000);

    auto b = store.resolve("192.168.1.11", "http");
    ASSERT_TRUE(b.is_ok()) << b.error;
    EXPECT_EQ(b.value, 10001);
}

TEST_F(MappingStoreTest, ResolveIsIdempotent) {
    MappingStore store(store_file, 10000);

    auto first = store.resolve("host.example", "https");
    auto second = store.resolve("host.example", "https");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value, second.value);
    EXPECT_EQ(store.load().size(), 1u);
}

TEST_F(MappingStoreTest, SameHostDifferentProtocolIsDifferentMapping) {
    MappingStore store(store_file, 10000);
    EXPECT_EQ(store.resolve("h", "ssh").value, 10000);
    EXPECT_EQ(store.resolve("h", "telnet").value, 10001);
}

TEST_F(MappingStoreTest, ConcurrentResolveAllocatesOnce) {
    MappingStore store(store_file, 10000);
    store.resolve("seed", "ssh");

    const int N = 16;
    std::vector<int> ports(N, -1);
    std::vector<std::thread> threads;
    for (int i = 0; i < N; i++) {
        threads.emplace_back([&store, &ports, i]() {
            auto r = store.resolve("10.1.2.3", "http");
            ports[i] = r.is_ok() ? r.value : -1;
        });
    }
    for (auto& t : threads) t.join();

    std::set<int> distinct(ports.begin(), ports.end());
    ASSERT_EQ(distinct.size(), 1u);
    EXPECT_EQ(*distinct.begin(), 10001);

    auto all = store.load();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(std::count_if(all.begin(), all.end(), [](const MappingRecord& m) {
        return m.host == "10.1.2.3" && m.protocol == "http";
    }), 1);
}

TEST_F(MappingStoreTest, PersistLoadRoundTrip) {
    MappingStore store(store_file, 10000);
    MappingSet in = {
        {"10.0.0.1", "ssh", 10000},
        {"router.lan", "telnet", 10004},
        {"fe80::1", "https", 10002},
        {"name with spaces", "http", 10001},
    };

    ASSERT_TRUE(store.persist(in).is_ok());
    EXPECT_EQ(sorted(store.load()), sorted(in));

    // A fresh store over the same file sees the same set
    MappingStore reopened(store_file, 10000);
    EXPECT_EQ(sorted(reopened.load()), sorted(in));
}

TEST_F(MappingStoreTest, PersistRejectsSetsThatWouldNotLoadBack) {
    MappingStore store(store_file, 10000);
    MappingSet good = {{"10.0.0.1", "ssh", 10000}};
    ASSERT_TRUE(store.persist(good).is_ok());

    std::vector<MappingSet> bad = {
        {{"10.0.0.1", "ssh", 0}},
        {{"10.0.0.1", "ssh", 70000}},
        {{"", "ssh", 10000}},
        {{"10.0.0.1", "", 10000}},
        {{"10.0.0.1", "ssh", 10000}, {"10.0.0.2", "ssh", 10000}},
        {{"10.0.0.1", "ssh", 10000}, {"10.0.0.1", "ssh", 10001}},
    };
    for (const auto& set : bad) {
        EXPECT_TRUE(store.persist(set).is_err());
        // Stored set untouched
        EXPECT_EQ(store.load(), good);
    }
}

TEST_F(MappingStoreTest, UnsupportedProtocolAllocatesNothing) {
    MappingStore store(store_file, 10000);

    auto r = store.resolve("10.0.0.1", "ftp");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("unsupported protocol"), std::string::npos);
    EXPECT_FALSE(fs::exists(store_file));
    EXPECT_TRUE(store.load().empty());
}

TEST_F(MappingStoreTest, MissingFileLoadsEmpty) {
    MappingStore store(test_dir / "nope.yaml", 10000);
    EXPECT_TRUE(store.load().empty());
}

TEST_F(MappingStoreTest, EmptyFileLoadsEmpty) {
    write_store("");
    MappingStore store(store_file, 10000);
    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(store.resolve("a", "ssh").value, 10000);
}

TEST_F(MappingStoreTest, CorruptFileLoadsEmpty) {
    write_store("mappings: [ {host: a, port: 1\n  ::: not yaml");
    MappingStore store(store_file, 10000);
    EXPECT_TRUE(store.load().empty());

    // And the store recovers on the next write
    EXPECT_EQ(store.resolve("a", "ssh").value, 10000);
    EXPECT_EQ(store.load().size(), 1u);
}

TEST_F(MappingStoreTest, MalformedRecordsAreSkipped) {
    write_store(
        "mappings:\n"
        "  - {host: good, protocol: ssh, port: 10000}\n"
        "  - {protocol: ssh, port: 10001}\n"
        "  - {host: badport, protocol: ssh, port: lots}\n"
        "  - {host: range, protocol: ssh, port: 70000}\n"
        "  - {host: dupe, protocol: http, port: 10000}\n"
        "  - {host: good, protocol: ssh, port: 10009}\n"
        "  - just a string\n");
    MappingStore store(store_file, 10000);

    auto m = store.load();
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0], (MappingRecord{"good", "ssh", 10000}));
}

TEST_F(MappingStoreTest, UnknownProtocolRecordIsKept) {
    write_store(
        "mappings:\n"
        "  - {host: old, protocol: gopher, port: 10000}\n");
    MappingStore store(store_file, 10000);

    auto m = store.load();
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].protocol, "gopher");

    // It still occupies its port
    EXPECT_EQ(store.resolve("new", "ssh").value, 10001);
}

TEST_F(MappingStoreTest, RemoveDeletesAndNeverReusesPort) {
    MappingStore store(store_file, 10000);
    store.resolve("a", "ssh");
    store.resolve("b", "ssh");

    auto removed = store.remove("b", "ssh");
    ASSERT_TRUE(removed.is_ok());
    EXPECT_TRUE(removed.value);
    EXPECT_EQ(store.load().size(), 1u);
    EXPECT_EQ(store.high_water_mark(), 10001);

    EXPECT_EQ(store.resolve("c", "ssh").value, 10002);

    auto again = store.remove("b", "ssh");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value);
}

TEST_F(MappingStoreTest, PersistFailureIsReported) {
    // A regular file where the parent directory should be
    std::ofstream(test_dir / "blocker") << "x";
    MappingStore store(test_dir / "blocker" / "port_mappings.yaml", 10000);

    auto r = store.resolve("a", "ssh");
    EXPECT_TRUE(r.is_err());
    EXPECT_TRUE(store.load().empty());
    EXPECT_TRUE(store.persist({{"a", "ssh", 10000}}).is_err());
}
