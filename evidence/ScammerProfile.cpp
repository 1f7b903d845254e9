#include "ScammerProfile.h"

#include <algorithm>
#include <cctype>
#include <glog/logging.h>
#include <folly/Conv.h>
#include <folly/Format.h>
#include <folly/dynamic.h>
#include <folly/container/F14Set.h>

#include <session/EntityExtractor.h>
#include <session/ThreatScorer.h>

using folly::dynamic;
using folly::StringPiece;

static const EntityType identifierType[] = {
  EntityType::PAYMENT_HANDLE,
  EntityType::PHONE_NUMBER,
  EntityType::BANK_ACCOUNT,
  EntityType::EMAIL,
};

template <class Set>
static auto slotFor(Set& set, EntityType type) -> decltype(&set.emails) {
  switch (type) {
  case EntityType::PAYMENT_HANDLE: return &set.paymentHandles;
  case EntityType::PHONE_NUMBER: return &set.phoneNumbers;
  case EntityType::BANK_ACCOUNT: return &set.bankAccounts;
  case EntityType::EMAIL: return &set.emails;
  default: return nullptr;
  }
}

bool IdentifierSet::empty() const noexcept {
  return size() == 0;
}

size_t IdentifierSet::size() const noexcept {
  return paymentHandles.size() + phoneNumbers.size() +
         bankAccounts.size() + emails.size();
}

std::vector<std::string> IdentifierSet::keys() const {
  std::vector<std::string> out;
  for (EntityType type : identifierType) {
    for (const std::string& value : *slotFor(*this, type))
      out.push_back(folly::to<std::string>(toString(type), ':', value));
  }
  return out;
}

void IdentifierSet::merge(const IdentifierSet& other) {
  for (EntityType type : identifierType) {
    const auto* from = slotFor(other, type);
    slotFor(*this, type)->insert(from->begin(), from->end());
  }
}

folly::Optional<std::string> normalizeIdentifier(EntityType type, StringPiece value) {
  std::string out;
  switch (type) {
  case EntityType::PAYMENT_HANDLE:
  case EntityType::EMAIL:
    for (char c : value) {
      if (!isspace(static_cast<unsigned char>(c)))
        out.push_back(static_cast<char>(tolower(static_cast<unsigned char>(c))));
    }
    break;
  case EntityType::PHONE_NUMBER:
  case EntityType::BANK_ACCOUNT:
    for (char c : value) {
      if (isdigit(static_cast<unsigned char>(c)))
        out.push_back(c);
    }
    if (type == EntityType::PHONE_NUMBER && out.size() > 10)
      out.erase(0, out.size() - 10);
    break;
  default:
    return folly::none;
  }
  if (out.empty())
    return folly::none;
  return out;
}

IdentifierSet correlationIdentifiers(const EvidencePackage& pkg) {
  // The user's own numbers and handles must not link unrelated callers
  folly::F14FastSet<uint64_t> callerTurns;
  for (const TranscriptEntry& entry : pkg.input().transcript) {
    if (entry.speaker == Speaker::CALLER)
      callerTurns.insert(entry.sequence);
  }

  IdentifierSet set;
  for (const ExtractedEntity& e : pkg.input().entities) {
    if (!callerTurns.count(e.position.sequence))
      continue;
    if (auto value = normalizeIdentifier(e.type, e.original))
      slotFor(set, e.type)->insert(std::move(*value));
  }
  if (auto phone = normalizeIdentifier(EntityType::PHONE_NUMBER,
                                       pkg.input().session.phoneId))
    set.phoneNumbers.insert(std::move(*phone));
  return set;
}

dynamic toJson(const ScammerProfile& profile) {
  dynamic identifiers = dynamic::object;
  for (EntityType type : identifierType) {
    dynamic list = dynamic::array;
    for (const std::string& value : *slotFor(profile.identifiers, type))
      list.push_back(maskEntity(type, value));
    identifiers[toString(type)] = std::move(list);
  }

  return dynamic::object
    ("profile_id", profile.profileId)
    ("identifiers", std::move(identifiers))
    ("risk_score", profile.riskScore)
    ("risk_level", toString(profile.riskLevel))
    ("call_count", profile.callCount)
    ("reported_count", profile.reportedCount)
    ("first_seen", profile.firstSeen)
    ("last_seen", profile.lastSeen);
}

void ProfileIndex::rescore(ScammerProfile& profile) {
  double score = 0.6 * profile.peakScore +
                 0.1 * std::min<uint32_t>(profile.callCount, 3) +
                 0.1 * std::min<uint32_t>(profile.reportedCount, 3);
  profile.riskScore = std::min(1.0, score);
  profile.riskLevel = levelForScore(profile.riskScore);
}

bool isProfiled(const SessionRecord& session) noexcept {
  return session.outcome != "completed";
}

folly::Optional<std::string> ProfileIndex::ingest(const EvidencePackage& pkg) {
  const SessionRecord& session = pkg.input().session;
  if (!isProfiled(session))
    return folly::none;

  IdentifierSet ids = correlationIdentifiers(pkg);
  if (ids.empty())
    return folly::none;

  std::vector<std::string> keys = ids.keys();
  auto state = state_.wlock();

  auto known = state->byPackage.find(pkg.packageId());
  if (known != state->byPackage.end())
    return known->second;

  std::set<std::string> matched;
  for (const std::string& key : keys) {
    auto it = state->byIdentifier.find(key);
    if (it != state->byIdentifier.end())
      matched.insert(it->second);
  }

  std::string survivorId;
  if (matched.empty()) {
    survivorId = folly::sformat("SP-{:06d}", ++state->nextId);
    ScammerProfile& fresh = state->profiles[survivorId];
    fresh.profileId = survivorId;
    fresh.firstSeen = session.startedAt;
  } else {
    survivorId = *std::min_element(matched.begin(), matched.end(),
        [&](const std::string& a, const std::string& b) {
      const ScammerProfile& pa = state->profiles.at(a);
      const ScammerProfile& pb = state->profiles.at(b);
      return std::make_pair(pa.firstSeen, a) < std::make_pair(pb.firstSeen, b);
    });
  }

  ScammerProfile& survivor = state->profiles.at(survivorId);
  for (const std::string& otherId : matched) {
    if (otherId == survivorId)
      continue;
    auto other = state->profiles.find(otherId);
    ScammerProfile& absorbed = other->second;
    survivor.identifiers.merge(absorbed.identifiers);
    survivor.peakScore = std::max(survivor.peakScore, absorbed.peakScore);
    survivor.callCount += absorbed.callCount;
    survivor.reportedCount += absorbed.reportedCount;
    survivor.firstSeen = std::min(survivor.firstSeen, absorbed.firstSeen);
    survivor.lastSeen = std::max(survivor.lastSeen, absorbed.lastSeen);
    for (const std::string& id : absorbed.packages) {
      state->byPackage[id] = survivorId;
      survivor.packages.push_back(id);
    }
    for (const std::string& key : absorbed.identifiers.keys())
      state->byIdentifier[key] = survivorId;
    VLOG(1) << "Profile " << otherId << " merged into " << survivorId;
    state->profiles.erase(other);
  }

  survivor.identifiers.merge(ids);
  survivor.peakScore = std::max(survivor.peakScore, session.peakScore);
  survivor.callCount += 1;
  survivor.firstSeen = std::min(survivor.firstSeen, session.startedAt);
  survivor.lastSeen = std::max(survivor.lastSeen, session.endedAt);
  survivor.packages.push_back(pkg.packageId());
  for (const std::string& key : keys)
    state->byIdentifier[key] = survivorId;
  state->byPackage[pkg.packageId()] = survivorId;
  rescore(survivor);

  VLOG(1) << "Package " << pkg.packageId() << " correlated to " << survivorId
          << " (" << survivor.identifiers.size() << " identifiers, "
          << survivor.callCount << " calls)";
  return survivorId;
}

bool ProfileIndex::markReported(const std::string& packageId) {
  auto state = state_.wlock();
  auto it = state->byPackage.find(packageId);
  if (it == state->byPackage.end())
    return false;
  ScammerProfile& profile = state->profiles.at(it->second);
  profile.reportedCount += 1;
  rescore(profile);
  return true;
}

size_t ProfileIndex::expire(int64_t before) {
  auto state = state_.wlock();
  size_t dropped = 0;
  for (auto it = state->profiles.begin(); it != state->profiles.end();) {
    const ScammerProfile& profile = it->second;
    if (profile.lastSeen >= before) {
      ++it;
      continue;
    }
    for (const std::string& key : profile.identifiers.keys()) {
      auto owner = state->byIdentifier.find(key);
      if (owner != state->byIdentifier.end() && owner->second == profile.profileId)
        state->byIdentifier.erase(owner);
    }
    for (const std::string& packageId : profile.packages)
      state->byPackage.erase(packageId);
    VLOG(1) << "Profile " << profile.profileId << " expired";
    it = state->profiles.erase(it);
    ++dropped;
  }
  return dropped;
}

folly::Optional<ScammerProfile>
ProfileIndex::find(EntityType type, StringPiece value) const {
  auto normalized = normalizeIdentifier(type, value);
  if (!normalized)
    return folly::none;

  auto state = state_.rlock();
  auto it = state->byIdentifier.find(
      folly::to<std::string>(toString(type), ':', *normalized));
  if (it == state->byIdentifier.end())
    return folly::none;
  return state->profiles.at(it->second);
}

folly::Optional<ScammerProfile> ProfileIndex::get(const std::string& profileId) const {
  auto state = state_.rlock();
  auto it = state->profiles.find(profileId);
  if (it == state->profiles.end())
    return folly::none;
  return it->second;
}

size_t ProfileIndex::size() const {
  return state_.rlock()->profiles.size();
}
