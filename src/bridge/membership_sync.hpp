#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * The flow of the membership events. MatrixToIrc: whether the users
 * joined in a Matrix room are also joined in the IRC channel, checked per
 * room id. IrcToMatrix: whether the users joined in an IRC channel get a
 * virtual user joined in the Matrix room, checked per channel name.
 */
enum class SyncDirection
{
  MatrixToIrc,
  IrcToMatrix,
};

/**
 * Initial: the whole member list, when a room or channel is first
 * bridged. Incremental: each join or part happening after that.
 */
enum class SyncKind
{
  Initial,
  Incremental,
};

struct InvalidKind: public std::runtime_error
{
  explicit InvalidKind(const std::string& kind);
};

/**
 * "initial" or "incremental". Throws InvalidKind for anything else.
 */
SyncKind sync_kind_from_string(const std::string& kind);
std::string to_string(const SyncKind kind);

struct SyncRule
{
  enum class Scope
  {
    Global,
    Room,
    Channel,
  };

  static SyncRule global(const SyncDirection direction, const SyncKind kind, const bool enabled);
  /**
   * A MatrixToIrc rule for the given room id.
   */
  static SyncRule room(const std::string& room_id, const SyncKind kind, const bool enabled);
  /**
   * An IrcToMatrix rule for the given channel.
   */
  static SyncRule channel(const std::string& channel, const SyncKind kind, const bool enabled);

  bool overrides(const SyncDirection direction, const SyncKind kind, const std::string& entity) const;

  Scope scope;
  /**
   * The room id or the channel name. Empty for the Global scope.
   */
  std::string entity;
  SyncDirection direction;
  SyncKind kind;
  bool enabled;
};

/**
 * Decides whether the membership events of a room or a channel should be
 * bridged.
 *
 * The Global rules give the default for each direction and kind (false if
 * there is none). The Room and Channel rules override that default for
 * one entity. They are checked in the order they were configured and each
 * matching rule replaces the previous result: when two rules target the
 * same room or channel, the last one wins.
 *
 * If the membership lists are not enabled, nothing is ever synced.
 */
class MembershipSyncPolicy
{
public:
  MembershipSyncPolicy(const bool enabled, std::vector<SyncRule> rules);
  ~MembershipSyncPolicy() = default;
  MembershipSyncPolicy(const MembershipSyncPolicy&) = default;
  MembershipSyncPolicy(MembershipSyncPolicy&&) = default;
  MembershipSyncPolicy& operator=(const MembershipSyncPolicy&) = delete;
  MembershipSyncPolicy& operator=(MembershipSyncPolicy&&) = delete;

  bool is_enabled() const;
  const std::vector<SyncRule>& get_rules() const;

  /**
   * An empty entity means no specific room or channel: only the global
   * default is used.
   */
  bool should_sync(const SyncDirection direction, const SyncKind kind,
                   const std::string& entity="") const;
  bool should_sync(const SyncDirection direction, const std::string& kind,
                   const std::string& entity="") const;

  bool should_sync_membership_to_irc(const SyncKind kind, const std::string& room_id) const;
  bool should_sync_membership_to_matrix(const SyncKind kind, const std::string& channel) const;

private:
  bool get_default(const SyncDirection direction, const SyncKind kind) const;

  const bool enabled;
  const std::vector<SyncRule> rules;
};
