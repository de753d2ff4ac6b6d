#pragma once

#include <cstdint>
#include <string>

namespace trustwatch {
namespace game {

/**
 * Category nibble of the action packet.
 *
 * READYING, CASTING_START, ITEM_START and RANGED_START announce an action
 * that has not resolved yet; only the completion carries usable data.
 */
enum class ActionCategory : uint8_t {
    NONE             = 0,
    MELEE            = 1,
    RANGED           = 2,
    WEAPON_SKILL     = 3,
    MAGIC            = 4,
    ITEM             = 5,
    JOB_ABILITY      = 6,
    READYING         = 7,
    CASTING_START    = 8,
    ITEM_START       = 9,
    UNUSED_10        = 10,
    MONSTER_ABILITY  = 11,
    RANGED_START     = 12,
    PET_ABILITY      = 13,
    DANCE            = 14,
    RUNE             = 15,
};

/**
 * Profile bucket an action category folds into.
 */
enum class CategoryBucket : uint8_t {
    IGNORED,          // announcements, never aggregated
    SAMPLES_ONLY,     // counted, no per-id table
    MELEE_ANIMS,
    RANGED_ANIMS,
    WEAPON_SKILLS,
    SPELLS,
    JOB_ABILITIES,
    MONSTER_ABILITIES,
    PET_ABILITIES,
    DANCES,
    RUNES,
};

/** Category from the 4-bit packet field. Values above 15 map to NONE. */
ActionCategory toActionCategory(uint32_t raw);

CategoryBucket categoryBucket(ActionCategory category);

bool isAnnouncement(ActionCategory category);

/** Whether positive magnitudes are kept as damage samples. */
bool recordsDamageSamples(ActionCategory category);

/** Stable lowercase tag ("weapon_skill", "magic", ...). */
const char* categoryName(ActionCategory category);

const char* bucketName(CategoryBucket bucket);

/** Tag used in synthesised names ("WS", "Spell", ...); empty when none. */
const char* placeholderTag(ActionCategory category);

} // namespace game
} // namespace trustwatch
