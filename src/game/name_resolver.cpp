#include "game/name_resolver.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

namespace trustwatch {
namespace game {

std::string placeholderName(ActionCategory category, uint32_t param) {
    std::string tag = placeholderTag(category);
    if (tag.empty()) {
        return "Unknown_" + std::to_string(param);
    }
    return "Unknown_" + tag + "_" + std::to_string(param);
}

std::string NameResolver::resolveOrPlaceholder(ActionCategory category, uint32_t param) const {
    if (auto name = resolve(category, param)) {
        if (!name->empty()) return *name;
    }
    return placeholderName(category, param);
}

std::optional<ResourceNameTable::Table> ResourceNameTable::tableFor(ActionCategory category) {
    switch (category) {
        case ActionCategory::WEAPON_SKILL:    return Table::WEAPON_SKILLS;
        case ActionCategory::MAGIC:           return Table::SPELLS;
        case ActionCategory::JOB_ABILITY:
        case ActionCategory::DANCE:
        case ActionCategory::RUNE:
        case ActionCategory::PET_ABILITY:     return Table::JOB_ABILITIES;
        case ActionCategory::MONSTER_ABILITY: return Table::MONSTER_ABILITIES;
        case ActionCategory::ITEM:            return Table::ITEMS;
        default:                              return std::nullopt;
    }
}

std::unordered_map<uint32_t, std::string>& ResourceNameTable::tableRef(Table table) {
    switch (table) {
        case Table::WEAPON_SKILLS:     return weaponSkills_;
        case Table::SPELLS:            return spells_;
        case Table::JOB_ABILITIES:     return jobAbilities_;
        case Table::MONSTER_ABILITIES: return monsterAbilities_;
        case Table::ITEMS:             return items_;
    }
    return items_;
}

const std::unordered_map<uint32_t, std::string>& ResourceNameTable::tableRef(Table table) const {
    return const_cast<ResourceNameTable*>(this)->tableRef(table);
}

std::optional<std::string> ResourceNameTable::resolve(ActionCategory category, uint32_t param) const {
    auto table = tableFor(category);
    if (!table) return std::nullopt;
    const auto& entries = tableRef(*table);
    auto it = entries.find(param);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

void ResourceNameTable::add(Table table, uint32_t id, const std::string& name) {
    tableRef(table)[id] = name;
}

bool ResourceNameTable::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open resource table: ", path);
        return false;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Failed to parse resource table JSON: ", e.what());
        return false;
    }
    if (!doc.is_object()) {
        LOG_ERROR("Resource table is not an object: ", path);
        return false;
    }

    static const std::pair<const char*, Table> sections[] = {
        {"weapon_skills", Table::WEAPON_SKILLS},
        {"spells", Table::SPELLS},
        {"job_abilities", Table::JOB_ABILITIES},
        {"monster_abilities", Table::MONSTER_ABILITIES},
        {"items", Table::ITEMS},
    };

    for (const auto& [section, table] : sections) {
        auto it = doc.find(section);
        if (it == doc.end() || !it->is_object()) continue;
        for (auto& [key, val] : it->items()) {
            if (!val.is_string()) continue;
            char* end = nullptr;
            unsigned long id = std::strtoul(key.c_str(), &end, 10);
            if (end == key.c_str()) continue;
            add(table, static_cast<uint32_t>(id), val.get<std::string>());
        }
    }

    LOG_INFO("Loaded resource names: ", size(), " entries from ", path);
    return true;
}

size_t ResourceNameTable::size() const {
    return weaponSkills_.size() + spells_.size() + jobAbilities_.size() +
           monsterAbilities_.size() + items_.size();
}

} // namespace game
} // namespace trustwatch
