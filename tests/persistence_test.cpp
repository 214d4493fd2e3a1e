#include <listing-sync/coordinator.hpp>
#include <listing-sync/persistence.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using namespace listing_sync;

namespace {

class JsonFileBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("listing-sync-backend-" + make_listing_id());
        std::filesystem::create_directories(dir_);
        file_ = dir_ / "listings.json";
    }

    void TearDown() override {
        auto ec = std::error_code{};
        std::filesystem::remove_all(dir_, ec);
    }

    auto read_file() const -> nlohmann::json {
        auto in = std::ifstream{file_};
        return nlohmann::json::parse(in);
    }

    std::filesystem::path dir_;
    std::filesystem::path file_;
};

}  // anonymous namespace

// -- JsonFileBackend ----------------------------------------------------------

TEST_F(JsonFileBackendTest, missing_file_loads_empty) {
    auto backend = JsonFileBackend{file_};
    EXPECT_TRUE(backend.load_all().empty());
}

TEST_F(JsonFileBackendTest, save_writes_whole_collection) {
    auto backend = JsonFileBackend{file_};
    backend.load_all();
    ASSERT_FALSE(backend.save(Listing{"a", {{"title", "A"}}}).has_value());
    ASSERT_FALSE(backend.save(Listing{"b", {{"title", "B"}}}).has_value());

    const auto doc = read_file();
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc[0]["id"], "b");
    EXPECT_EQ(doc[1]["title"], "A");
}

TEST_F(JsonFileBackendTest, save_existing_id_replaces) {
    auto backend = JsonFileBackend{file_};
    backend.save(Listing{"a", {{"title", "old"}}});
    backend.save(Listing{"a", {{"title", "new"}}});

    const auto doc = read_file();
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc[0]["title"], "new");
}

TEST_F(JsonFileBackendTest, remove_deletes_and_ignores_unknown) {
    auto backend = JsonFileBackend{file_};
    backend.save(Listing{"a"});
    backend.save(Listing{"b"});

    EXPECT_FALSE(backend.remove("a").has_value());
    EXPECT_FALSE(backend.remove("never-existed").has_value());
    EXPECT_EQ(read_file().size(), 1u);
}

TEST_F(JsonFileBackendTest, reload_returns_saved_listings) {
    {
        auto backend = JsonFileBackend{file_};
        backend.save(Listing{"a", {{"title", "A"}}});
        backend.save(Listing{"b", {{"title", "B"}}});
    }
    auto backend = JsonFileBackend{file_};
    const auto listings = backend.load_all();
    ASSERT_EQ(listings.size(), 2u);
    EXPECT_EQ(listings[0].id, "b");
    EXPECT_EQ(listings[1].title(), "A");
}

TEST_F(JsonFileBackendTest, malformed_file_loads_empty) {
    {
        auto out = std::ofstream{file_};
        out << "{ this is not json";
    }
    auto backend = JsonFileBackend{file_};
    EXPECT_TRUE(backend.load_all().empty());
}

TEST_F(JsonFileBackendTest, invalid_entries_are_skipped_on_load) {
    {
        auto out = std::ofstream{file_};
        out << R"([{"id":"a"},{"title":"no id"},{"id":"b"}])";
    }
    auto backend = JsonFileBackend{file_};
    EXPECT_EQ(backend.load_all().size(), 2u);
}

TEST_F(JsonFileBackendTest, unwritable_path_reports_persistence_error) {
    auto backend = JsonFileBackend{dir_ / "no-such-dir" / "listings.json"};
    auto error = backend.save(Listing{"a"});
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::persistence_error);
}

TEST_F(JsonFileBackendTest, failed_save_is_not_written_by_a_later_save) {
    auto backend = JsonFileBackend{file_};
    backend.load_all();

    // A directory where the temporary file should go makes the write fail.
    const auto blocker = std::filesystem::path{file_.string() + ".tmp"};
    std::filesystem::create_directory(blocker);
    ASSERT_TRUE(backend.save(Listing{"rejected"}).has_value());

    std::filesystem::remove(blocker);
    ASSERT_FALSE(backend.save(Listing{"accepted"}).has_value());

    auto reloaded = JsonFileBackend{file_};
    const auto listings = reloaded.load_all();
    ASSERT_EQ(listings.size(), 1u);
    EXPECT_EQ(listings[0].id, "accepted");
}

TEST_F(JsonFileBackendTest, failed_remove_keeps_listing) {
    auto backend = JsonFileBackend{file_};
    ASSERT_FALSE(backend.save(Listing{"a"}).has_value());
    ASSERT_FALSE(backend.save(Listing{"b"}).has_value());

    const auto blocker = std::filesystem::path{file_.string() + ".tmp"};
    std::filesystem::create_directory(blocker);
    ASSERT_TRUE(backend.remove("a").has_value());

    std::filesystem::remove(blocker);
    ASSERT_FALSE(backend.save(Listing{"c"}).has_value());
    EXPECT_EQ(read_file().size(), 3u);
}

TEST_F(JsonFileBackendTest, durable_server_restarts_without_rejected_listing) {
    const auto blocker = std::filesystem::path{file_.string() + ".tmp"};
    {
        auto backend = JsonFileBackend{file_};
        auto coordinator = ServerCoordinator{
            backend, {.persistence_policy = PersistencePolicy::durable}};
        coordinator.start();

        std::filesystem::create_directory(blocker);
        coordinator.handle(1, ListingAdded{Listing{"rejected"}});
        EXPECT_TRUE(coordinator.snapshot().empty());

        std::filesystem::remove(blocker);
        coordinator.handle(1, ListingAdded{Listing{"accepted"}});
        EXPECT_EQ(coordinator.snapshot().size(), 1u);
    }

    auto backend = JsonFileBackend{file_};
    auto restarted = ServerCoordinator{backend};
    restarted.start();
    EXPECT_EQ(restarted.snapshot(), (std::vector<Listing>{Listing{"accepted"}}));
}

// -- MemoryBackend ------------------------------------------------------------

TEST(MemoryBackend, load_all_returns_initial) {
    auto backend = MemoryBackend{{Listing{"a"}, Listing{"b"}}};
    EXPECT_EQ(backend.load_all().size(), 2u);
}

TEST(MemoryBackend, save_and_remove) {
    auto backend = MemoryBackend{};
    EXPECT_FALSE(backend.save(Listing{"a"}).has_value());
    EXPECT_FALSE(backend.remove("a").has_value());
    EXPECT_TRUE(backend.stored().empty());
    EXPECT_EQ(backend.save_calls(), 1u);
    EXPECT_EQ(backend.remove_calls(), 1u);
}

TEST(MemoryBackend, failing_rejects_writes) {
    auto backend = MemoryBackend{};
    backend.set_failing(true);

    auto error = backend.save(Listing{"a"});
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::persistence_error);
    EXPECT_TRUE(backend.remove("a").has_value());
    EXPECT_TRUE(backend.stored().empty());

    backend.set_failing(false);
    EXPECT_FALSE(backend.save(Listing{"a"}).has_value());
    EXPECT_EQ(backend.stored().size(), 1u);
}
