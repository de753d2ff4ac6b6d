#pragma once

#include "game/action_category.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace trustwatch {
namespace game {

/**
 * Maps (category, param) to a display name, e.g. weapon skill 30 to
 * "Savage Blade".
 */
class NameResolver {
public:
    virtual ~NameResolver() = default;

    virtual std::optional<std::string> resolve(ActionCategory category, uint32_t param) const = 0;

    /** resolve(), or "Unknown_<tag>_<param>" when there is no entry. */
    std::string resolveOrPlaceholder(ActionCategory category, uint32_t param) const;
};

std::string placeholderName(ActionCategory category, uint32_t param);

/**
 * Resource tables held in memory. Job abilities, dances and runes share
 * the job ability table.
 */
class ResourceNameTable : public NameResolver {
public:
    enum class Table { WEAPON_SKILLS, SPELLS, JOB_ABILITIES, MONSTER_ABILITIES, ITEMS };

    std::optional<std::string> resolve(ActionCategory category, uint32_t param) const override;

    void add(Table table, uint32_t id, const std::string& name);

    /**
     * Load {"weapon_skills": {"30": "Savage Blade"}, "spells": {...},
     * "job_abilities": {...}, "monster_abilities": {...}, "items": {...}}.
     * Returns false if the file cannot be read or parsed.
     */
    bool loadFromFile(const std::string& path);

    size_t size() const;

private:
    static std::optional<Table> tableFor(ActionCategory category);

    std::unordered_map<uint32_t, std::string> weaponSkills_;
    std::unordered_map<uint32_t, std::string> spells_;
    std::unordered_map<uint32_t, std::string> jobAbilities_;
    std::unordered_map<uint32_t, std::string> monsterAbilities_;
    std::unordered_map<uint32_t, std::string> items_;

    std::unordered_map<uint32_t, std::string>& tableRef(Table table);
    const std::unordered_map<uint32_t, std::string>& tableRef(Table table) const;
};

} // namespace game
} // namespace trustwatch
