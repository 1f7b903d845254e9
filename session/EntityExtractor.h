#ifndef GUARD_SESSION_ENTITY_EXTRACTOR_H
#define GUARD_SESSION_ENTITY_EXTRACTOR_H

#include <vector>
#include <string>
#include <folly/Range.h>

#include "SessionTypes.h"

/** Candidate that looked like an entity but failed its structural check. */
struct MalformedEntity {
  EntityType type;
  SourcePosition position;
  const char* reason;
};

struct Extraction {
  std::vector<ExtractedEntity> entities;
  std::vector<MalformedEntity> malformed;
};

/**
 * Extract typed entities from one transcript fragment.
 * Keeps no state between calls; the same text always yields the same
 * entities, ordered by position, with no two spans overlapping.
 */
Extraction extractEntities(folly::StringPiece text, uint64_t sequence = 0);

/** Display form of a value. Sensitive types keep only a short suffix. */
std::string maskEntity(EntityType type, folly::StringPiece value);

bool luhnValid(folly::StringPiece digits) noexcept;

/** GUARD_MALFORMED_ENTITY naming the type, sequence:offset and reason. */
GuardError toError(const MalformedEntity& bad);

#endif // GUARD_SESSION_ENTITY_EXTRACTOR_H
