#include <bridge/membership_sync.hpp>

InvalidKind::InvalidKind(const std::string& kind):
  std::runtime_error("Bad kind: " + kind)
{
}

namespace
{
  /**
   * Make sure we never act on a value that is not one of the enumerators,
   * for example one obtained by casting an integer.
   */
  SyncKind checked(const SyncKind kind)
  {
    switch (kind)
      {
      case SyncKind::Initial:
      case SyncKind::Incremental:
        return kind;
      }
    throw InvalidKind(std::to_string(static_cast<int>(kind)));
  }

  SyncDirection direction_of(const SyncRule::Scope scope)
  {
    if (scope == SyncRule::Scope::Room)
      return SyncDirection::MatrixToIrc;
    return SyncDirection::IrcToMatrix;
  }
}

SyncKind sync_kind_from_string(const std::string& kind)
{
  if (kind == "initial")
    return SyncKind::Initial;
  else if (kind == "incremental")
    return SyncKind::Incremental;
  throw InvalidKind(kind);
}

std::string to_string(const SyncKind kind)
{
  if (checked(kind) == SyncKind::Initial)
    return "initial";
  return "incremental";
}

SyncRule SyncRule::global(const SyncDirection direction, const SyncKind kind, const bool enabled)
{
  return {Scope::Global, {}, direction, checked(kind), enabled};
}

SyncRule SyncRule::room(const std::string& room_id, const SyncKind kind, const bool enabled)
{
  return {Scope::Room, room_id, direction_of(Scope::Room), checked(kind), enabled};
}

SyncRule SyncRule::channel(const std::string& channel, const SyncKind kind, const bool enabled)
{
  return {Scope::Channel, channel, direction_of(Scope::Channel), checked(kind), enabled};
}

bool SyncRule::overrides(const SyncDirection direction, const SyncKind kind, const std::string& entity) const
{
  if (this->scope == Scope::Global)
    return false;
  return this->direction == direction && this->kind == kind && this->entity == entity;
}

MembershipSyncPolicy::MembershipSyncPolicy(const bool enabled, std::vector<SyncRule> rules):
  enabled(enabled),
  rules(std::move(rules))
{
}

bool MembershipSyncPolicy::is_enabled() const
{
  return this->enabled;
}

const std::vector<SyncRule>& MembershipSyncPolicy::get_rules() const
{
  return this->rules;
}

bool MembershipSyncPolicy::get_default(const SyncDirection direction, const SyncKind kind) const
{
  bool res = false;
  for (const auto& rule: this->rules)
    if (rule.scope == SyncRule::Scope::Global && rule.direction == direction && rule.kind == kind)
      res = rule.enabled;
  return res;
}

bool MembershipSyncPolicy::should_sync(const SyncDirection direction, const SyncKind kind,
                                       const std::string& entity) const
{
  // An invalid kind is an error, even when nothing is synced
  checked(kind);
  if (!this->enabled)
    return false;

  bool res = this->get_default(direction, kind);
  if (entity.empty())
    return res;

  // Do not stop at the first match: room and channel rules clobber each
  // other, in order
  for (const auto& rule: this->rules)
    if (rule.overrides(direction, kind, entity))
      res = rule.enabled;
  return res;
}

bool MembershipSyncPolicy::should_sync(const SyncDirection direction, const std::string& kind,
                                       const std::string& entity) const
{
  return this->should_sync(direction, sync_kind_from_string(kind), entity);
}

bool MembershipSyncPolicy::should_sync_membership_to_irc(const SyncKind kind, const std::string& room_id) const
{
  return this->should_sync(SyncDirection::MatrixToIrc, kind, room_id);
}

bool MembershipSyncPolicy::should_sync_membership_to_matrix(const SyncKind kind, const std::string& channel) const
{
  return this->should_sync(SyncDirection::IrcToMatrix, kind, channel);
}
