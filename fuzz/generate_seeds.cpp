// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <listing-sync/json.hpp>
#include <listing-sync/listing.hpp>

#include "wire/frame.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ls = listing_sync;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static void write_text_seed(const std::string& path, const nlohmann::json& doc) {
    auto ofs = std::ofstream{path};
    ofs << doc.dump();
}

int main() {
    namespace fs = std::filesystem;
    const auto frame_dir = std::string{"fuzz/corpus/frame"};
    const auto message_dir = std::string{"fuzz/corpus/message"};
    fs::create_directories(frame_dir);
    fs::create_directories(message_dir);

    const auto listing = ls::Listing{"1700000000000-seed0001", {{"title", "Seed listing"}}};

    // Seed 1: small uncompressed frame
    {
        const auto message = ls::encode(ls::ClientMessage{ls::ListingAdded{listing}});
        write_seed(frame_dir + "/seed_added.bin", ls::wire::encode_frame(message));
        write_text_seed(message_dir + "/seed_added.json", message);
    }

    // Seed 2: large sync that crosses the deflate threshold
    {
        auto listings = std::vector<ls::Listing>{};
        for (int i = 0; i < 64; ++i) {
            listings.push_back(ls::Listing{"seed-" + std::to_string(i),
                                           {{"title", "Listing number " + std::to_string(i)}}});
        }
        const auto message = ls::encode(ls::ServerMessage{ls::SyncAllListings{listings}});
        write_seed(frame_dir + "/seed_sync_all.bin", ls::wire::encode_frame(message));
        write_text_seed(message_dir + "/seed_sync_all.json", message);
    }

    // Seed 3: broadcast delete
    {
        const auto message = ls::encode(ls::ServerMessage{
            ls::UpdateListings{ls::ListingDeleted{listing.id}, ls::Timestamp{1700000000000}}});
        write_seed(frame_dir + "/seed_deleted.bin", ls::wire::encode_frame(message));
        write_text_seed(message_dir + "/seed_deleted.json", message);
    }

    // Seed 4: users-count
    {
        const auto message = ls::encode(ls::ServerMessage{ls::UsersCount{3}});
        write_seed(frame_dir + "/seed_users.bin", ls::wire::encode_frame(message));
        write_text_seed(message_dir + "/seed_users.json", message);
    }

    return 0;
}
