#include "stats/profile_writer.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace trustwatch {
namespace stats {

using game::CategoryBucket;

namespace {

constexpr CategoryBucket kExportedBuckets[] = {
    CategoryBucket::WEAPON_SKILLS,
    CategoryBucket::SPELLS,
    CategoryBucket::JOB_ABILITIES,
    CategoryBucket::MELEE_ANIMS,
    CategoryBucket::RANGED_ANIMS,
    CategoryBucket::DANCES,
    CategoryBucket::RUNES,
    CategoryBucket::MONSTER_ABILITIES,
    CategoryBucket::PET_ABILITIES,
};

std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string hexAnim(uint16_t anim) {
    std::ostringstream ss;
    ss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(3) << anim;
    return ss.str();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool isAnimBucket(CategoryBucket bucket) {
    return bucket == CategoryBucket::MELEE_ANIMS || bucket == CategoryBucket::RANGED_ANIMS;
}

nlohmann::json counterJson(CategoryBucket bucket, const CounterEntry& entry) {
    nlohmann::json j;
    if (isAnimBucket(bucket)) {
        j["animation_id"] = entry.animationId;
        j["count"] = entry.count;
        return j;
    }
    j["id"] = entry.id;
    j["name"] = entry.name;
    j["animation_id"] = entry.animationId;
    j["count"] = entry.count;
    if (bucket == CategoryBucket::WEAPON_SKILLS ||
        bucket == CategoryBucket::MONSTER_ABILITIES || bucket == CategoryBucket::PET_ABILITIES) {
        j["damage_samples"] = entry.damageSamples.samples();
    }
    return j;
}

const char* detailHeading(CategoryBucket bucket) {
    switch (bucket) {
        case CategoryBucket::WEAPON_SKILLS:     return "Weapon Skills:";
        case CategoryBucket::SPELLS:            return "Spells:";
        case CategoryBucket::JOB_ABILITIES:     return "Job Abilities:";
        case CategoryBucket::MELEE_ANIMS:       return "Melee Animations:";
        case CategoryBucket::RANGED_ANIMS:      return "Ranged Animations:";
        case CategoryBucket::DANCES:            return "Dances:";
        case CategoryBucket::RUNES:             return "Runes:";
        case CategoryBucket::MONSTER_ABILITIES: return "Monster Abilities:";
        case CategoryBucket::PET_ABILITIES:     return "Pet Abilities:";
        default:                                return "Other:";
    }
}

} // namespace

nlohmann::json ProfileWriter::toJson(const ProfileSnapshot& snapshot) {
    nlohmann::json doc;
    doc["name"] = snapshot.key.name;
    doc["kind"] = snapshot.key.kind == ProfileKind::MOB ? "mob" : "trust";
    if (snapshot.key.kind == ProfileKind::MOB) {
        doc["zone"] = snapshot.key.zone;
    }
    doc["model_id"] = snapshot.modelId;
    doc["total_samples"] = snapshot.totalSamples;
    doc["captured_at"] = utcTimestamp();

    for (CategoryBucket bucket : kExportedBuckets) {
        nlohmann::json arr = nlohmann::json::array();
        for (const CounterEntry& entry : snapshot.bucket(bucket)) {
            arr.push_back(counterJson(bucket, entry));
        }
        doc[game::bucketName(bucket)] = std::move(arr);
    }

    nlohmann::json effects = nlohmann::json::array();
    for (const AdditionalEffectEntry& ae : snapshot.additionalEffects) {
        effects.push_back({
            {"animation", ae.animation},
            {"effect", ae.effect},
            {"param", ae.param},
            {"message", ae.message},
            {"count", ae.count},
            {"source_category", ae.sourceCategory},
        });
    }
    doc["add_effects"] = std::move(effects);

    if (snapshot.key.kind == ProfileKind::MOB) {
        doc["damage_taken"] = {
            {"samples", snapshot.damageTaken},
            {"estimated_hp", snapshot.estimatedHp},
        };
    }
    return doc;
}

nlohmann::json ProfileWriter::summaryJson(const BehaviorAggregator& aggregator) {
    nlohmann::json trusts = nlohmann::json::array();
    nlohmann::json mobs = nlohmann::json::array();

    // std::map order: trusts before mobs, then zone, then name
    for (const auto& [key, profile] : aggregator.profiles()) {
        nlohmann::json row;
        row["name"] = key.name;
        row["model_id"] = profile.modelId();
        row["samples"] = profile.totalSamples();
        row["weapon_skills"] = profile.counterCount(CategoryBucket::WEAPON_SKILLS);
        row["spells"] = profile.counterCount(CategoryBucket::SPELLS);
        row["job_abilities"] = profile.counterCount(CategoryBucket::JOB_ABILITIES);
        if (key.kind == ProfileKind::MOB) {
            row["zone"] = key.zone;
            row["monster_abilities"] = profile.counterCount(CategoryBucket::MONSTER_ABILITIES);
            row["estimated_hp"] = profile.estimatedHp();
            mobs.push_back(std::move(row));
        } else {
            trusts.push_back(std::move(row));
        }
    }

    nlohmann::json doc;
    doc["saved_at"] = utcTimestamp();
    doc["trusts"] = std::move(trusts);
    doc["mobs"] = std::move(mobs);
    return doc;
}

nlohmann::json ProfileWriter::spawnTableJson(const std::string& zone, const ZoneSpawnTable& table) {
    std::vector<const ZoneEntityEntry*> entries;
    entries.reserve(table.size());
    for (const auto& [name, entry] : table) {
        entries.push_back(&entry);
    }
    std::stable_sort(entries.begin(), entries.end(), [](const ZoneEntityEntry* a, const ZoneEntityEntry* b) {
        return a->count > b->count;
    });

    nlohmann::json arr = nlohmann::json::array();
    for (const ZoneEntityEntry* entry : entries) {
        nlohmann::json positions = nlohmann::json::array();
        for (const glm::vec3& p : entry->positions) {
            positions.push_back(nlohmann::json::array({p.x, p.y, p.z}));
        }
        arr.push_back({
            {"name", entry->name},
            {"model_id", entry->modelId},
            {"count", entry->count},
            {"positions", std::move(positions)},
        });
    }

    nlohmann::json doc;
    doc["zone"] = zone;
    doc["entities"] = std::move(arr);
    return doc;
}

std::string ProfileWriter::sanitizeFilename(const std::string& name) {
    std::string kept;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || std::isspace(uc) || c == '-') {
            kept += c;
        }
    }
    std::string out;
    bool inSpace = false;
    for (char c : kept) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!inSpace) out += '_';
            inSpace = true;
        } else {
            out += c;
            inSpace = false;
        }
    }
    return out.empty() ? "unnamed" : out;
}

std::string ProfileWriter::fileNameFor(const ProfileKey& key) {
    if (key.kind == ProfileKind::MOB) {
        return "mob_" + sanitizeFilename(key.zone) + "__" + sanitizeFilename(key.name) + ".json";
    }
    return sanitizeFilename(key.name) + ".json";
}

bool ProfileWriter::writeJsonFile(const std::string& path, const nlohmann::json& doc) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("Could not write ", path);
        return false;
    }
    file << doc.dump(2) << '\n';
    if (!file.good()) {
        LOG_ERROR("Short write to ", path);
        return false;
    }
    return true;
}

int ProfileWriter::saveAll(const BehaviorAggregator& aggregator, const std::string& outputDir) {
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        LOG_ERROR("Could not create output directory ", outputDir, ": ", ec.message());
        return -1;
    }

    int written = 0;
    for (const auto& [key, profile] : aggregator.profiles()) {
        if (profile.totalSamples() == 0 && profile.damageTaken().empty()) continue;
        std::string path = (std::filesystem::path(outputDir) / fileNameFor(key)).string();
        if (writeJsonFile(path, toJson(profile.snapshot()))) {
            ++written;
        }
    }

    std::string summaryPath = (std::filesystem::path(outputDir) / "_summary.json").string();
    if (!writeJsonFile(summaryPath, summaryJson(aggregator))) {
        return -1;
    }

    if (written > 0) {
        LOG_INFO("Saved data for ", written, " profile(s) to: ", outputDir);
    }
    return written;
}

int ProfileWriter::saveSpawnTables(const SpawnTracker& tracker, const std::string& outputDir) {
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        LOG_ERROR("Could not create output directory ", outputDir, ": ", ec.message());
        return -1;
    }

    int written = 0;
    for (const auto& [zone, table] : tracker.zones()) {
        std::string path = (std::filesystem::path(outputDir) /
                            (sanitizeFilename(zone) + "_spawns.json")).string();
        if (writeJsonFile(path, spawnTableJson(zone, table))) {
            ++written;
        }
    }
    return written;
}

std::vector<std::string> ProfileWriter::summaryLines(const BehaviorAggregator& aggregator) {
    std::vector<std::string> lines;
    if (aggregator.empty()) {
        lines.push_back("No trust data collected yet. Summon some trusts and fight!");
        return lines;
    }

    size_t trusts = 0;
    for (const auto& [key, profile] : aggregator.profiles()) {
        if (key.kind == ProfileKind::TRUST) ++trusts;
    }

    lines.push_back("=== Trust Data Summary ===");
    lines.push_back("Trusts tracked: " + std::to_string(trusts) +
                    ", mobs tracked: " + std::to_string(aggregator.profileCount() - trusts));
    lines.push_back("");

    for (const auto& [key, profile] : aggregator.profiles()) {
        std::vector<std::string> parts;
        size_t ws = profile.counterCount(CategoryBucket::WEAPON_SKILLS);
        size_t sp = profile.counterCount(CategoryBucket::SPELLS);
        size_t ja = profile.counterCount(CategoryBucket::JOB_ABILITIES);
        size_t ma = profile.counterCount(CategoryBucket::MONSTER_ABILITIES);
        if (ws > 0) parts.push_back(std::to_string(ws) + " WS");
        if (sp > 0) parts.push_back(std::to_string(sp) + " spells");
        if (ja > 0) parts.push_back(std::to_string(ja) + " JA");
        if (ma > 0) parts.push_back(std::to_string(ma) + " TP moves");

        std::string detail;
        for (size_t i = 0; i < parts.size(); ++i) {
            detail += (i == 0 ? " [" : ", ") + parts[i];
        }
        if (!detail.empty()) detail += "]";

        std::string status = profile.totalSamples() > 0
            ? std::to_string(profile.totalSamples()) + " actions"
            : "waiting...";
        lines.push_back("  " + key.label() + ": " + status + detail);
    }
    lines.push_back("==========================");
    return lines;
}

std::vector<std::string> ProfileWriter::detailLines(const BehaviorAggregator& aggregator,
                                                    const std::string& search) {
    const BehaviorProfile* match = nullptr;
    for (const auto& [key, profile] : aggregator.profiles()) {
        if (key.name == search || key.label() == search) { match = &profile; break; }
    }
    if (!match) {
        std::string needle = lower(search);
        for (const auto& [key, profile] : aggregator.profiles()) {
            std::string name = lower(key.name);
            if (name == needle || name.find(needle) != std::string::npos) {
                match = &profile;
                break;
            }
        }
    }

    std::vector<std::string> lines;
    if (!match) {
        lines.push_back("No data for: " + search);
        return lines;
    }

    ProfileSnapshot snap = match->snapshot();
    lines.push_back("=== " + snap.key.label() + " ===");
    lines.push_back("Model ID: " + std::to_string(snap.modelId));
    lines.push_back("Total actions: " + std::to_string(snap.totalSamples));
    lines.push_back("");

    for (CategoryBucket bucket : kExportedBuckets) {
        const auto& entries = snap.bucket(bucket);
        if (entries.empty()) continue;
        lines.push_back(detailHeading(bucket));
        for (const CounterEntry& e : entries) {
            if (isAnimBucket(bucket)) {
                lines.push_back("  Anim:" + hexAnim(e.animationId) + " x" + std::to_string(e.count));
            } else {
                lines.push_back("  " + e.name + " [ID:" + std::to_string(e.id) +
                                " Anim:" + hexAnim(e.animationId) +
                                " x" + std::to_string(e.count) + "]");
            }
        }
    }

    if (!snap.additionalEffects.empty()) {
        lines.push_back("Additional Effects:");
        for (const AdditionalEffectEntry& ae : snap.additionalEffects) {
            lines.push_back("  Anim:" + hexAnim(ae.animation) +
                            " Param:" + std::to_string(ae.param) +
                            " Msg:" + std::to_string(ae.message) +
                            " x" + std::to_string(ae.count) +
                            " (from " + ae.sourceCategory + ")");
        }
    }

    if (snap.key.kind == ProfileKind::MOB && !snap.damageTaken.empty()) {
        lines.push_back("Damage taken: " + std::to_string(snap.damageTaken.size()) +
                        " hits, estimated HP >= " + std::to_string(snap.estimatedHp));
    }

    lines.push_back("==========================");
    return lines;
}

} // namespace stats
} // namespace trustwatch
