#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "pqchat/config/config.hpp"
#include "pqchat/crypto/crypto.hpp"
#include "pqchat/errors.hpp"
#include "pqchat/hub/chat_event.hpp"
#include "pqchat/hub/connection_hub.hpp"
#include "pqchat/room/distribution_store.hpp"
#include "pqchat/room/message_store.hpp"
#include "pqchat/room/room_key_distributor.hpp"
#include "pqchat/service/chat_core.hpp"
#include "pqchat/utils/logging.hpp"

using namespace pqchat;

namespace {

struct DemoUser {
    UserId id;
    std::string password;
    identity::Identity keys;
    std::shared_ptr<hub::BufferedConnection> connection;
};

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"pqchat demo - in-process post-quantum room chat"};

    std::string config_path;
    std::string kem;
    std::string log_level = "info";
    bool interactive = false;
    size_t member_count = 3;
    std::string message = "hello quantum world";

    app.add_option("-c,--config", config_path, "Configuration file (INI)");
    app.add_option("--kem", kem, "KEM parameter set (overrides config)");
    app.add_option("-l,--log-level", log_level, "Log level: trace,debug,info,warn,error");
    app.add_flag("--interactive", interactive, "Use the interactive Argon2id profile");
    app.add_option("-n,--members", member_count, "Number of room members")
        ->check(CLI::Range(2, 16));
    app.add_option("-m,--message", message, "Message to send");

    CLI11_PARSE(app, argc, argv);

    utils::init_logging(utils::string_to_log_level(log_level));

    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    config::CoreConfig config;
    if (!config_path.empty()) {
        auto loaded = config::load_config(config_path);
        if (!loaded) {
            spdlog::error("Failed to load config from {}", config_path);
            return 1;
        }
        config = *loaded;
        utils::init_logging(utils::string_to_log_level(config.log_level), config.log_pattern);
    }
    if (!kem.empty()) {
        config.kem_algorithm = kem;
    }
    if (interactive) {
        config.pwhash = crypto::interactive_pwhash_params();
    }

    room::InMemoryDistributionStore distributions;
    room::InMemoryMessageStore messages;
    hub::ConnectionHub connection_hub;

    try {
        service::ChatCore core(config, distributions, messages, connection_hub);

        // Register everyone; derivations run on the KDF worker
        std::vector<DemoUser> users;
        for (size_t i = 0; i < member_count; ++i) {
            DemoUser user;
            user.id = 100 + i;
            user.password = "demo-password-" + std::to_string(i);
            user.connection = std::make_shared<hub::BufferedConnection>(i + 1);
            users.push_back(std::move(user));
        }
        for (auto& user : users) {
            user.keys = core.register_identity(user.password).get();
            spdlog::info("User {} registered ({} byte public key, {} byte wrapped key)",
                         user.id, user.keys.public_key.size(),
                         user.keys.wrapped_private_key.size());
        }

        // Room with everyone except the last user, who joins afterwards
        constexpr RoomId room = 1;
        room::RoomKeyDistributor::Members founders;
        for (size_t i = 0; i + 1 < users.size(); ++i) {
            founders.emplace(users[i].id, users[i].keys.public_key);
        }
        auto distribution = core.create_room(room, founders);
        spdlog::info("Room {} created with {} distributions", room, distribution.size());

        auto& sponsor = users.front();
        auto sponsor_key = core.unlock_identity(sponsor.password, sponsor.keys.wrapped_private_key).get();
        {
            auto& joiner = users.back();
            room::SponsorKeySource source(core.distributor(), sponsor.id, sponsor_key);
            core.add_member(room, joiner.id, joiner.keys.public_key, source);
            spdlog::info("User {} joined room {} sponsored by {}", joiner.id, room, sponsor.id);
        }

        for (auto& user : users) {
            connection_hub.connect(user.connection, room);
        }

        auto epoch_key = core.distributor().open_distribution(
            sponsor_key.span(), core.distribution(room, sponsor.id));
        std::vector<uint8_t> plaintext(message.begin(), message.end());
        auto stored = core.send_message(room, sponsor.id, epoch_key.span(), plaintext);
        spdlog::info("Message {} stored ({} bytes ciphertext)", stored.id, stored.ciphertext.size());

        // Every member unlocks their own key, opens their own entry and reads the push
        for (auto& user : users) {
            auto private_key = core.unlock_identity(user.password, user.keys.wrapped_private_key).get();
            auto member_key = core.distributor().open_distribution(
                private_key.span(), core.distribution(room, user.id));

            auto frame = user.connection->receive();
            if (!frame) {
                spdlog::error("User {} received nothing", user.id);
                return 1;
            }
            auto event = hub::parse_event(*frame);
            if (!event) {
                spdlog::error("User {} received a malformed frame", user.id);
                return 1;
            }
            auto opened = core.open_message(event->ciphertext, member_key.span());
            std::cout << "user " << user.id << " read: "
                      << std::string(opened.begin(), opened.end()) << "\n";
        }

        core.delete_room(room);
        connection_hub.shutdown();
    } catch (const Error& e) {
        spdlog::critical("Demo failed: {}", e.what());
        return 1;
    }

    spdlog::info("Demo finished");
    return 0;
}
