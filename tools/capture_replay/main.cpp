/**
 * capture_replay - Feed a recorded packet capture through a collector
 * session and write the resulting profiles.
 *
 * Usage: capture_replay --capture <file> [options]
 *
 * The roster file stands in for the live client's entity list:
 *   {
 *     "player_id": 1001,
 *     "zone": "West Ronfaure",            (name, or a numeric zone id)
 *     "entities": [
 *       {"id": 2001, "name": "Zeid II", "model_id": 3021, "index": 1,
 *        "npc": true, "party": true, "x": 0.0, "y": 0.0, "z": 0.0}
 *     ]
 *   }
 */

#include "game/collector_session.hpp"
#include "game/entity.hpp"
#include "game/name_resolver.hpp"
#include "network/capture_file.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

using namespace trustwatch;

namespace {

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " --capture <file> [options]\n"
              << "\n"
              << "Replay a packet capture through the trust behaviour collector.\n"
              << "\n"
              << "Required:\n"
              << "  --capture <file>    Capture file (u16 id, u16 length, chunk bytes)\n"
              << "\n"
              << "Options:\n"
              << "  --roster <json>     Entities, party and player id known before replay\n"
              << "  --config <json>     Collector config\n"
              << "  --names <json>      Resource names (weapon_skills, spells, ...)\n"
              << "  --zones <json>      Extra zone names {\"id\": \"name\"}\n"
              << "  --out <dir>         Output directory (overrides config)\n"
              << "  --report            Print the summary report after replay\n"
              << "  --verbose           Debug logging\n"
              << "  --help              Show this help\n";
}

bool loadRoster(const std::string& path, game::EntityManager& entities,
                game::CollectorSession& session) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open roster: ", path);
        return false;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Failed to parse roster JSON: ", e.what());
        return false;
    }
    if (!doc.is_object()) {
        LOG_ERROR("Roster root is not an object");
        return false;
    }

    try {
        entities.setPlayerId(doc.value("player_id", 0u));

        if (doc.contains("zone")) {
            const auto& zone = doc["zone"];
            if (zone.is_number_unsigned()) {
                session.onZoneChange(zone.get<uint16_t>());
            } else if (zone.is_string()) {
                session.onZoneChange(zone.get<std::string>());
            }
        }

        std::vector<uint32_t> party;
        if (doc.contains("entities") && doc["entities"].is_array()) {
            for (const auto& item : doc["entities"]) {
                game::EntityInfo info;
                info.id = item.value("id", 0u);
                info.index = item.value("index", static_cast<uint16_t>(0));
                info.name = item.value("name", std::string());
                info.modelId = item.value("model_id", 0u);
                info.isNpc = item.value("npc", false);
                if (item.contains("x") && item.contains("z")) {
                    info.position = glm::vec3(item.value("x", 0.0f), item.value("y", 0.0f),
                                              item.value("z", 0.0f));
                }
                entities.addEntity(info);
                if (item.value("party", false)) party.push_back(info.id);
            }
        }
        entities.setPartyMembers(party);
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERROR("Roster has a value of the wrong type: ", e.what());
        return false;
    }

    LOG_INFO("Loaded roster: ", entities.getEntityCount(), " entities, ",
             entities.partyMemberIds().size(), " party members");
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string capturePath;
    std::string rosterPath;
    std::string configPath;
    std::string namesPath;
    std::string zonesPath;
    std::string outDir;
    bool report = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--capture") == 0 && i + 1 < argc) {
            capturePath = argv[++i];
        } else if (std::strcmp(argv[i], "--roster") == 0 && i + 1 < argc) {
            rosterPath = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--names") == 0 && i + 1 < argc) {
            namesPath = argv[++i];
        } else if (std::strcmp(argv[i], "--zones") == 0 && i + 1 < argc) {
            zonesPath = argv[++i];
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            outDir = argv[++i];
        } else if (std::strcmp(argv[i], "--report") == 0) {
            report = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (capturePath.empty()) {
        std::cerr << "Error: --capture is required\n\n";
        printUsage(argv[0]);
        return 1;
    }

    core::CollectorConfig config;
    if (!configPath.empty() && !config.loadFromFile(configPath)) {
        return 1;
    }
    config.applyEnvironment();
    if (!outDir.empty()) config.outputDir = outDir;
    config.applyLogging();
    if (verbose) core::Logger::getInstance().setLogLevel(core::LogLevel::DEBUG);

    game::ResourceNameTable names;
    if (!namesPath.empty() && !names.loadFromFile(namesPath)) {
        return 1;
    }

    auto records = network::CaptureFile::read(capturePath);
    if (!records) {
        return 1;
    }

    game::EntityManager entities;
    game::CollectorSession session(config, entities, names);
    if (!zonesPath.empty()) {
        if (session.zoneManager().loadFromFile(zonesPath) == 0) {
            LOG_WARNING("No zone names loaded from ", zonesPath);
        }
    }
    if (!rosterPath.empty() && !loadRoster(rosterPath, entities, session)) {
        return 1;
    }

    session.start();
    for (const auto& record : *records) {
        network::Packet packet = record.toPacket();
        session.handlePacket(packet);
    }

    const auto& stats = session.stats();
    std::cout << "Replayed " << records->size() << " records: "
              << stats.actionsDecoded << " actions, "
              << stats.actionsDropped << " malformed, "
              << stats.announcementsSkipped << " announcements, "
              << stats.entityUpdates << " entity updates\n";

    if (report) {
        for (const auto& line : session.handleCommand("report")) {
            std::cout << line << "\n";
        }
    }

    if (!session.save()) {
        std::cerr << "Error: failed to write profiles to " << config.outputDir << "\n";
        return 1;
    }
    std::cout << "Profiles written to " << config.outputDir << "\n";
    return 0;
}
