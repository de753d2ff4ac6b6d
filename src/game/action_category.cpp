#include "game/action_category.hpp"

namespace trustwatch {
namespace game {

ActionCategory toActionCategory(uint32_t raw) {
    if (raw > 15) return ActionCategory::NONE;
    return static_cast<ActionCategory>(raw);
}

CategoryBucket categoryBucket(ActionCategory category) {
    switch (category) {
        case ActionCategory::MELEE:           return CategoryBucket::MELEE_ANIMS;
        case ActionCategory::RANGED:          return CategoryBucket::RANGED_ANIMS;
        case ActionCategory::WEAPON_SKILL:    return CategoryBucket::WEAPON_SKILLS;
        case ActionCategory::MAGIC:           return CategoryBucket::SPELLS;
        case ActionCategory::JOB_ABILITY:     return CategoryBucket::JOB_ABILITIES;
        case ActionCategory::MONSTER_ABILITY: return CategoryBucket::MONSTER_ABILITIES;
        case ActionCategory::PET_ABILITY:     return CategoryBucket::PET_ABILITIES;
        case ActionCategory::DANCE:           return CategoryBucket::DANCES;
        case ActionCategory::RUNE:            return CategoryBucket::RUNES;
        case ActionCategory::READYING:
        case ActionCategory::CASTING_START:
        case ActionCategory::ITEM_START:
        case ActionCategory::RANGED_START:    return CategoryBucket::IGNORED;
        case ActionCategory::NONE:
        case ActionCategory::ITEM:
        case ActionCategory::UNUSED_10:       return CategoryBucket::SAMPLES_ONLY;
    }
    return CategoryBucket::SAMPLES_ONLY;
}

bool isAnnouncement(ActionCategory category) {
    return categoryBucket(category) == CategoryBucket::IGNORED;
}

bool recordsDamageSamples(ActionCategory category) {
    return category == ActionCategory::WEAPON_SKILL ||
           category == ActionCategory::MONSTER_ABILITY ||
           category == ActionCategory::PET_ABILITY;
}

const char* categoryName(ActionCategory category) {
    switch (category) {
        case ActionCategory::NONE:            return "none";
        case ActionCategory::MELEE:           return "melee";
        case ActionCategory::RANGED:          return "ranged";
        case ActionCategory::WEAPON_SKILL:    return "weapon_skill";
        case ActionCategory::MAGIC:           return "magic";
        case ActionCategory::ITEM:            return "item";
        case ActionCategory::JOB_ABILITY:     return "job_ability";
        case ActionCategory::READYING:        return "ws_readying";
        case ActionCategory::CASTING_START:   return "casting";
        case ActionCategory::ITEM_START:      return "item_start";
        case ActionCategory::UNUSED_10:       return "unused_10";
        case ActionCategory::MONSTER_ABILITY: return "monster_ability";
        case ActionCategory::RANGED_START:    return "ranged_start";
        case ActionCategory::PET_ABILITY:     return "pet_ability";
        case ActionCategory::DANCE:           return "dance";
        case ActionCategory::RUNE:            return "rune";
    }
    return "none";
}

const char* bucketName(CategoryBucket bucket) {
    switch (bucket) {
        case CategoryBucket::IGNORED:           return "ignored";
        case CategoryBucket::SAMPLES_ONLY:      return "samples_only";
        case CategoryBucket::MELEE_ANIMS:       return "melee_anims";
        case CategoryBucket::RANGED_ANIMS:      return "ranged_anims";
        case CategoryBucket::WEAPON_SKILLS:     return "weapon_skills";
        case CategoryBucket::SPELLS:            return "spells";
        case CategoryBucket::JOB_ABILITIES:     return "job_abilities";
        case CategoryBucket::MONSTER_ABILITIES: return "monster_abilities";
        case CategoryBucket::PET_ABILITIES:     return "pet_abilities";
        case CategoryBucket::DANCES:            return "dances";
        case CategoryBucket::RUNES:             return "runes";
    }
    return "samples_only";
}

const char* placeholderTag(ActionCategory category) {
    switch (category) {
        case ActionCategory::WEAPON_SKILL:    return "WS";
        case ActionCategory::MAGIC:           return "Spell";
        case ActionCategory::JOB_ABILITY:
        case ActionCategory::DANCE:
        case ActionCategory::RUNE:            return "JA";
        case ActionCategory::MONSTER_ABILITY: return "MobSkill";
        case ActionCategory::PET_ABILITY:     return "PetSkill";
        case ActionCategory::ITEM:            return "Item";
        default:                              return "";
    }
}

} // namespace game
} // namespace trustwatch
