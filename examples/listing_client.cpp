// listing_client: interactive sync client over TCP
//
// Commands on stdin:
//   add <title>          create a listing
//   update <id> <title>  retitle a listing
//   delete <id>          delete a listing
//   list                 print the local replica
//   queue                print changes waiting for the server
//   quit

#include <listing-sync/listing_sync.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/streambuf.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <unistd.h>

namespace ls = listing_sync;
namespace asio = boost::asio;

namespace {

void print_listings(const ls::Replica& replica) {
    std::printf("%zu listings\n", replica.size());
    for (const auto& listing : replica.listings()) {
        std::printf("  %s  %s\n", listing.id.c_str(), listing.title().value_or("(untitled)").c_str());
    }
}

void print_queue(const ls::OfflineQueue& queue) {
    std::printf("%zu queued changes\n", queue.size());
    for (const auto& intent : queue.pending()) {
        std::printf("  %s  %s %s\n", intent.id.c_str(),
                    std::string{ls::action_name(intent.mutation)}.c_str(),
                    ls::target_id(intent.mutation).c_str());
    }
}

// Reads commands from stdin on the io_context thread.
class Console {
public:
    Console(asio::io_context& io, ls::ClientAgent& agent, ls::net::TcpClient& client)
        : io_{io}, agent_{agent}, client_{client}, input_{io, ::dup(STDIN_FILENO)} {}

    void start() { read_line(); }

private:
    void read_line() {
        asio::async_read_until(input_, buffer_, '\n',
                               [this](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                quit();
                return;
            }
            auto stream = std::istream{&buffer_};
            auto line = std::string{};
            std::getline(stream, line);
            if (execute(line)) read_line();
        });
    }

    // @return false to stop reading.
    auto execute(const std::string& line) -> bool {
        auto words = std::istringstream{line};
        auto command = std::string{};
        words >> command;

        if (command.empty()) return true;
        if (command == "quit") {
            quit();
            return false;
        }
        if (command == "list") {
            print_listings(agent_.replica());
        } else if (command == "queue") {
            print_queue(agent_.queue());
        } else if (command == "add") {
            auto title = rest_of(words);
            auto listing = agent_.create({{"title", title}});
            std::printf("added %s\n", listing.id.c_str());
        } else if (command == "update") {
            auto id = std::string{};
            words >> id;
            const auto* existing = agent_.replica().find(id);
            auto listing = existing ? *existing : ls::Listing{id, nlohmann::json::object()};
            listing.fields["title"] = rest_of(words);
            agent_.update(std::move(listing));
        } else if (command == "delete") {
            auto id = std::string{};
            words >> id;
            agent_.remove(id);
        } else {
            std::printf("unknown command: %s\n", command.c_str());
        }
        return true;
    }

    static auto rest_of(std::istringstream& words) -> std::string {
        auto rest = std::string{};
        std::getline(words >> std::ws, rest);
        return rest;
    }

    void quit() {
        client_.stop();
        io_.stop();
    }

    asio::io_context& io_;
    ls::ClientAgent& agent_;
    ls::net::TcpClient& client_;
    asio::posix::stream_descriptor input_;
    asio::streambuf buffer_;
};

}  // anonymous namespace

int main(int argc, char* argv[]) {
    auto config = std::optional<ls::ClientConfig>{};
    try {
        config = ls::parse_client_config(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "listing_client: %s\n", e.what());
        return 2;
    }
    if (!config) return 0;

    ls::setup_logging(config->log);

    try {
        auto store = std::make_shared<ls::JsonFileQueueStore>(config->queue_file);
        auto cache = std::make_shared<ls::JsonFileReplicaStore>(config->replica_file);
        auto agent = ls::ClientAgent{store, cache, {
            .on_status = [](ls::ConnectionStatus status) {
                std::printf("[status] %s\n", std::string{ls::to_string_view(status)}.c_str());
            },
            .on_synced = [](std::size_t delivered) {
                if (delivered > 0) std::printf("[sync] %zu offline changes synced\n", delivered);
            },
            .on_users_count = [](std::size_t count) {
                std::printf("[users] %zu online\n", count);
            },
        }};

        auto io = asio::io_context{1};
        auto client = ls::net::TcpClient{io, agent, {
            .host = config->host,
            .port = config->port,
            .backoff = config->backoff,
            .sync_timeout = config->sync_timeout,
        }};
        auto console = Console{io, agent, client};

        auto signals = asio::signal_set{io, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            client.stop();
            io.stop();
        });

        client.start();
        console.start();
        io.run();

        if (!agent.queue().empty()) {
            spdlog::info("{} changes saved to {} for the next session",
                         agent.queue().size(), config->queue_file);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
