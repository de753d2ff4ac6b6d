#include "game/collector_session.hpp"
#include "game/opcodes.hpp"
#include "game/entity_update_packet.hpp"
#include "stats/profile_writer.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace trustwatch {
namespace game {

namespace {

stats::ProfileLimits profileLimitsFrom(const core::CollectorConfig& config) {
    stats::ProfileLimits limits;
    limits.damageSampleCap = config.damageSampleCap;
    limits.damageTakenCap = config.damageTakenCap;
    return limits;
}

stats::SpawnLimits spawnLimitsFrom(const core::CollectorConfig& config) {
    stats::SpawnLimits limits;
    limits.positionCap = config.positionSampleCap;
    limits.minSpacing = config.minPositionSpacing;
    return limits;
}

// Magic messages whose param is damage dealt; the rest carry a status id
// or an amount healed.
bool isMagicDamageMessage(uint16_t message) {
    return message == 2 || message == 252 || message == 264;
}

bool carriesDamage(ActionCategory category, uint16_t message) {
    switch (category) {
        case ActionCategory::MELEE:
        case ActionCategory::RANGED:
        case ActionCategory::WEAPON_SKILL:
            return true;
        case ActionCategory::MAGIC:
            return isMagicDamageMessage(message);
        default:
            return false;
    }
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

CollectorSession::CollectorSession(const core::CollectorConfig& config,
                                   EntityManager& entities,
                                   const NameResolver& names)
    : config_(config),
      entities_(entities),
      classifier_(entities),
      aggregator_(names, profileLimitsFrom(config)),
      spawns_(spawnLimitsFrom(config)),
      damage_(classifier_, aggregator_),
      tracking_(config.trackOnStart) {
    zones_.initialize();
    classifier_.setRegistrationCallback(
        [this](EntityClass cls, const ClassifiedEntity& entity) { onEntityRegistered(cls, entity); });
}

// ============================================================
// Host events
// ============================================================

void CollectorSession::handlePacket(network::Packet& packet) {
    if (!tracking_) return;
    ++stats_.packetsSeen;

    switch (static_cast<Opcode>(packet.getId())) {
        case Opcode::SMSG_ACTION:
            handleAction(packet);
            break;
        case Opcode::SMSG_ENTITY_UPDATE:
            handleEntityUpdate(packet);
            break;
        case Opcode::SMSG_ZONE_IN:
            handleZoneIn(packet);
            break;
        default:
            break;
    }
}

void CollectorSession::handleAction(network::Packet& packet) {
    auto data = ActionPacketParser::parse(packet);
    if (!data) {
        ++stats_.actionsDropped;
        return;
    }
    ++stats_.actionsDecoded;

    ActionCategory category = data->actionCategory();
    if (isAnnouncement(category)) {
        // Readying/casting start carry no outcome; the completion packet follows
        ++stats_.announcementsSkipped;
        return;
    }

    switch (classifier_.classify(data->actorId)) {
        case EntityClass::TRUST: {
            const ClassifiedEntity* trust = classifier_.trustInfo(data->actorId);
            if (trust) recordActions(stats::ProfileKey::trust(trust->name), *data);
            break;
        }
        case EntityClass::MOB: {
            if (!config_.trackMobs) break;
            const ClassifiedEntity* mob = classifier_.mobInfo(data->actorId);
            if (mob) recordActions(stats::ProfileKey::mob(mob->zone, mob->name), *data);
            break;
        }
        case EntityClass::PLAYER:
            recordPlayerDamage(*data);
            break;
        case EntityClass::UNKNOWN:
            ++stats_.unknownActors;
            LOG_DEBUG("Action from unresolved actor ", data->actorId, " dropped");
            break;
    }
}

void CollectorSession::recordActions(const stats::ProfileKey& key, const ActionPacketData& data) {
    ActionCategory category = data.actionCategory();
    for (const auto& target : data.targets) {
        for (const auto& action : target.actions) {
            if (aggregator_.record(key, category, data.param, action.animation,
                                   action.param, action.addEffect)) {
                ++stats_.actionsRecorded;
            }
        }
    }
}

void CollectorSession::recordPlayerDamage(const ActionPacketData& data) {
    ActionCategory category = data.actionCategory();
    for (const auto& target : data.targets) {
        for (const auto& action : target.actions) {
            if (action.param == 0 || !carriesDamage(category, action.message)) continue;
            damage_.observeDamage(target.targetId, static_cast<int64_t>(action.param));
        }
    }
}

void CollectorSession::handleEntityUpdate(network::Packet& packet) {
    auto data = EntityUpdateParser::parse(packet);
    if (!data) return;
    ++stats_.entityUpdates;

    // 0x00E only describes NPCs, so a new id can be added straight away
    const EntityInfo* known = entities_.findEntity(data->entityId);
    if (known && !data->hasName() && !data->modelId) {
        if (data->position) entities_.updatePosition(data->entityId, *data->position);
    } else {
        EntityInfo info = known ? *known : EntityInfo{};
        info.id = data->entityId;
        info.index = data->index;
        if (!known) info.isNpc = true;
        if (data->hasName()) info.name = data->name;
        if (data->modelId) info.modelId = *data->modelId;
        if (data->position) info.position = data->position;
        entities_.addEntity(info);
    }

    if (classifier_.classify(data->entityId) != EntityClass::MOB) return;

    const EntityInfo* info = entities_.findEntity(data->entityId);
    if (!info || info->name.empty()) return;
    spawns_.observe(classifier_.currentZone(), info->name, info->modelId, info->position);
}

void CollectorSession::handleZoneIn(network::Packet& packet) {
    auto zoneId = ZoneInParser::parse(packet);
    if (!zoneId) return;
    onZoneChange(*zoneId);
}

void CollectorSession::update(float deltaTime) {
    if (!tracking_) return;

    timeSinceLastPartyScan_ += deltaTime;
    timeSinceLastSave_ += deltaTime;

    if (timeSinceLastPartyScan_ >= config_.partyScanInterval) {
        scanParty();
        timeSinceLastPartyScan_ = 0.0f;
    }

    if (timeSinceLastSave_ >= config_.autoSaveInterval) {
        if (!aggregator_.empty() && !save()) {
            LOG_WARNING("Auto-save failed; retrying in ", config_.autoSaveInterval, "s");
        }
        timeSinceLastSave_ = 0.0f;
    }
}

void CollectorSession::onZoneChange(const std::string& zoneName) {
    classifier_.onZoneChange(zoneName);
}

void CollectorSession::onZoneChange(uint16_t zoneId) {
    onZoneChange(zones_.getZoneName(zoneId));
}

void CollectorSession::onLogin() {
    LOG_INFO("Login detected. Tracking is ", tracking_ ? "on" : "off", ".");
    if (tracking_) scanParty();
}

void CollectorSession::onLogout() {
    if (!aggregator_.empty() && !save()) {
        LOG_WARNING("Logout: could not save collected data.");
    }
    classifier_.clearCaches();
    LOG_INFO("Logout: classifications cleared.");
}

void CollectorSession::onEntityRegistered(EntityClass cls, const ClassifiedEntity& entity) {
    // Trusts get an (empty) profile right away so status shows them waiting
    // for their first action; mobs only when they act or take damage.
    if (cls == EntityClass::TRUST) {
        aggregator_.ensureProfile(stats::ProfileKey::trust(entity.name), entity.modelId);
    }
}

// ============================================================
// Commands
// ============================================================

void CollectorSession::start() {
    tracking_ = true;
    timeSinceLastPartyScan_ = 0.0f;
    timeSinceLastSave_ = 0.0f;
    size_t found = scanParty();
    LOG_INFO("Tracking started. ", found, " new trust(s) in party.");
}

bool CollectorSession::stop() {
    tracking_ = false;
    if (!save()) {
        LOG_WARNING("Tracking stopped, but saving failed.");
        return false;
    }
    LOG_INFO("Tracking stopped. Data saved.");
    return true;
}

bool CollectorSession::save() {
    int written = stats::ProfileWriter::saveAll(aggregator_, config_.outputDir);
    if (written < 0) {
        LOG_ERROR("Failed to save profiles to ", config_.outputDir);
        return false;
    }
    if (spawns_.zoneCount() > 0 && stats::ProfileWriter::saveSpawnTables(spawns_, config_.outputDir) < 0) {
        LOG_ERROR("Failed to save spawn tables to ", config_.outputDir);
        return false;
    }
    LOG_INFO("Saved ", written, " profile(s) to ", config_.outputDir);
    return true;
}

void CollectorSession::reset() {
    aggregator_.reset();
    spawns_.reset();
    classifier_.clearCaches();
    stats_ = SessionStats{};
    LOG_INFO("All collected data reset.");
}

size_t CollectorSession::scanParty() {
    return classifier_.scanParty();
}

std::vector<std::string> CollectorSession::handleCommand(const std::string& commandLine) {
    std::istringstream in(commandLine);
    std::string command;
    in >> command;
    command = toLower(command);

    std::string argument;
    std::getline(in, argument);
    size_t first = argument.find_first_not_of(" \t");
    argument = first == std::string::npos ? "" : argument.substr(first);
    size_t last = argument.find_last_not_of(" \t");
    if (last != std::string::npos) argument.erase(last + 1);

    if (command == "start") {
        start();
        return {"Tracking started. Active trusts: " + std::to_string(classifier_.trustCount())};
    }
    if (command == "stop") {
        if (!stop()) return {"Tracking stopped. Save failed, see log for details."};
        return {"Tracking stopped. Data saved to " + config_.outputDir};
    }
    if (command == "status") {
        return statusLines();
    }
    if (command == "report" || command == "summary") {
        return stats::ProfileWriter::summaryLines(aggregator_);
    }
    if (command == "detail" || command == "info") {
        if (argument.empty()) return {"Usage: detail <name>"};
        return stats::ProfileWriter::detailLines(aggregator_, argument);
    }
    if (command == "save") {
        if (!save()) return {"Save failed, see log for details."};
        return {"Saved " + std::to_string(aggregator_.profileCount()) + " profile(s) to " + config_.outputDir};
    }
    if (command == "scan") {
        size_t found = scanParty();
        return {"Party scan: " + std::to_string(found) + " new trust(s), "
                + std::to_string(classifier_.trustCount()) + " active."};
    }
    if (command == "reset") {
        reset();
        return {"All data reset."};
    }
    if (command.empty() || command == "help") {
        return helpLines();
    }

    std::vector<std::string> lines{"Unknown command: " + command};
    std::vector<std::string> help = helpLines();
    lines.insert(lines.end(), help.begin(), help.end());
    return lines;
}

std::vector<std::string> CollectorSession::statusLines() const {
    std::vector<std::string> lines;
    lines.push_back(std::string("Tracking: ") + (tracking_ ? "ON" : "OFF"));
    lines.push_back("Zone: " + (classifier_.currentZone().empty() ? std::string("(none)") : classifier_.currentZone()));
    lines.push_back("Active trusts: " + std::to_string(classifier_.trustCount()));

    std::vector<const ClassifiedEntity*> trusts;
    for (const auto& entry : classifier_.trusts()) trusts.push_back(&entry.second);
    std::sort(trusts.begin(), trusts.end(),
              [](const ClassifiedEntity* a, const ClassifiedEntity* b) { return a->name < b->name; });
    for (const ClassifiedEntity* t : trusts) {
        lines.push_back("  " + t->name + " (Entity: " + std::to_string(t->id)
                        + ", Model: " + std::to_string(t->modelId) + ")");
    }

    lines.push_back("Mobs seen this zone: " + std::to_string(classifier_.mobCount()));
    lines.push_back("Profiles: " + std::to_string(aggregator_.profileCount()));
    lines.push_back("Packets: " + std::to_string(stats_.packetsSeen)
                    + " (actions " + std::to_string(stats_.actionsDecoded)
                    + ", malformed " + std::to_string(stats_.actionsDropped)
                    + ", announcements " + std::to_string(stats_.announcementsSkipped) + ")");
    return lines;
}

std::vector<std::string> CollectorSession::helpLines() const {
    return {
        "Commands:",
        "  start          - begin tracking and scan the party",
        "  stop           - stop tracking and save",
        "  status         - tracking state and active trusts",
        "  report         - summary of all profiles",
        "  detail <name>  - full breakdown for one profile",
        "  save           - write profiles to " + config_.outputDir,
        "  scan           - rescan the party for trusts",
        "  reset          - discard all collected data",
    };
}

} // namespace game
} // namespace trustwatch
