#include <romcat/romcat.hpp>

#include <climits>

static_assert(CHAR_BIT == 8, "char is expected to have 8 bits");
static_assert(sizeof(romcat::EntityID) == 8, "entity IDs are stored as SQLite 64-bit integers");

namespace romcat {} // namespace romcat
