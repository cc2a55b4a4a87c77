/**
 * @file session.hpp
 * @brief HSM-driven peer session: discovery roster, dialing with bounded
 *        retries, connected-peer set and transport teardown/reinit.
 *
 * State hierarchy:
 *
 *   Session (root, handles events common to all states)
 *   +-- Disconnected  (initial)
 *   +-- Connecting
 *   +-- Connected
 *   +-- Failed
 *
 * Every transport callback becomes one HSM event. All mutations happen
 * under a single mutex; handlers only queue transport actions, which run
 * after the lock is released and the transition is fully applied.
 */

#ifndef MIRROR_SESSION_HPP_
#define MIRROR_SESSION_HPP_

#include "mirror/hsm.hpp"
#include "mirror/log.hpp"
#include "mirror/platform.hpp"
#include "mirror/transport.hpp"
#include "mirror/vocabulary.hpp"

#include <cstdint>
#include <mutex>

namespace mirror {

// ============================================================================
// Connection State
// ============================================================================

enum class ConnectionState : uint8_t {
  kDisconnected,
  kConnecting,
  kConnected,
  kFailed,
};

inline const char* ConnectionStateName(ConnectionState state) noexcept {
  switch (state) {
    case ConnectionState::kDisconnected: return "Disconnected";
    case ConnectionState::kConnecting:   return "Connecting";
    case ConnectionState::kConnected:    return "Connected";
    case ConnectionState::kFailed:       return "Failed";
  }
  return "";
}

// ============================================================================
// Configuration
// ============================================================================

enum SessionRole : uint8_t {
  kRoleAdvertiser = 1U << 0,
  kRoleBrowser = 1U << 1,
  kRoleBoth = kRoleAdvertiser | kRoleBrowser,
};

struct SessionConfig {
  FixedString<63> service_type = "mirror-mirror";
  uint32_t max_retries = 3;       ///< Total dial attempts per Invite().
  uint32_t invite_timeout_s = 30;
  bool accept_while_connected = true;
};

/** @brief Consistent copy of the session's observable state. */
struct SessionSnapshot {
  ConnectionState state = ConnectionState::kDisconnected;
  PeerList connected;
  PeerList available;
  PeerId selected;  ///< Invalid (value 0) when nothing is being dialed.
  uint32_t retry_count = 0;
};

/// Called after a state change has been applied; never under the lock.
using SessionObserverFn = void (*)(void* ctx, ConnectionState from,
                                   ConnectionState to);

/// Receives every inbound payload reported by the transport.
using SessionDataFn = void (*)(void* ctx, const PeerId& peer,
                               const uint8_t* data, size_t size);

// ============================================================================
// HSM Events
// ============================================================================

enum SessionEvent : uint32_t {
  kEvtInvite = 1,
  kEvtPeerConnected = 2,
  kEvtPeerConnecting = 3,
  kEvtPeerNotConnected = 4,
  kEvtInvitation = 5,
  kEvtDisconnect = 6,
  kEvtPeerFound = 7,
  kEvtPeerLost = 8,
  kEvtTransportFailed = 9,
  kEvtRestartFailed = 10,
  kEvtStarted = 11,
};

// ============================================================================
// SessionContext
// ============================================================================

/** @brief Transport work queued by a handler, run after unlock. */
struct SessionAction {
  enum Kind : uint8_t { kInvite, kReinit, kDisconnectAll };
  Kind kind;
  PeerId peer;
};

struct SessionContext {
  ConnectionState state;
  PeerList connected;
  PeerList available;
  PeerId selected;
  PeerId pending;  ///< Peer the Connecting state waits for.
  uint32_t retry_count;
  uint32_t max_retries;
  bool accept_while_connected;
  bool rejected;  ///< Set by a handler that refuses the current event.
  FixedVector<SessionAction, 4> actions;

  StateMachine<SessionContext, 8>* sm;
  int32_t idx_root;
  int32_t idx_disconnected;
  int32_t idx_connecting;
  int32_t idx_connected;
  int32_t idx_failed;

  SessionContext() noexcept
      : state(ConnectionState::kDisconnected), retry_count(0),
        max_retries(3), accept_while_connected(true), rejected(false),
        sm(nullptr), idx_root(-1), idx_disconnected(-1), idx_connecting(-1),
        idx_connected(-1), idx_failed(-1) {}

  void Queue(SessionAction::Kind kind, const PeerId& peer = PeerId()) {
    if (!actions.push_back(SessionAction{kind, peer})) {
      MIRROR_LOG_ERROR("Session", "action queue full, dropping action %u",
                       static_cast<unsigned>(kind));
    }
  }

  /// Transition unless already in `target`.
  TransitionResult GoTo(int32_t target) noexcept {
    if (sm->CurrentState() == target) {
      return TransitionResult::kHandled;
    }
    return sm->RequestTransition(target);
  }

  /// Connected peers gone: Disconnected, then teardown-and-reinit.
  TransitionResult DropToDisconnected() {
    selected = PeerId();
    retry_count = 0;
    Queue(SessionAction::kReinit);
    return GoTo(idx_disconnected);
  }
};

// ============================================================================
// HSM State Handlers
// ============================================================================

namespace detail {

inline const PeerId& EventPeer(const Event& event) noexcept {
  return *static_cast<const PeerId*>(event.data);
}

// Root: behaviour shared by every state.
inline TransitionResult SessionRoot(SessionContext& ctx, const Event& event) {
  switch (event.id) {
    case kEvtInvite: {
      ctx.selected = EventPeer(event);
      ctx.pending = ctx.selected;
      ctx.retry_count = 0;
      ctx.Queue(SessionAction::kInvite, ctx.selected);
      return ctx.GoTo(ctx.idx_connecting);
    }
    case kEvtPeerConnected: {
      const PeerId& peer = EventPeer(event);
      if (FindPeer(ctx.connected, peer) < 0 &&
          !ctx.connected.push_back(peer)) {
        MIRROR_LOG_WARN("Session", "peer table full, ignoring %s",
                        peer.name.c_str());
        return TransitionResult::kHandled;
      }
      ctx.retry_count = 0;
      return ctx.GoTo(ctx.idx_connected);
    }
    case kEvtPeerConnecting:
      if (!ctx.pending.IsValid()) {
        ctx.pending = EventPeer(event);
      }
      return ctx.GoTo(ctx.idx_connecting);
    case kEvtPeerNotConnected: {
      int32_t i = FindPeer(ctx.connected, EventPeer(event));
      if (i < 0) {
        // Stale report for a peer we already dropped.
        return TransitionResult::kHandled;
      }
      (void)ctx.connected.erase_unordered(static_cast<uint32_t>(i));
      if (ctx.connected.empty()) {
        return ctx.DropToDisconnected();
      }
      return ctx.GoTo(ctx.idx_connected);
    }
    case kEvtInvitation: {
      const PeerId& peer = EventPeer(event);
      if (ctx.state == ConnectionState::kConnected &&
          !ctx.accept_while_connected && FindPeer(ctx.connected, peer) < 0) {
        ctx.rejected = true;
        return TransitionResult::kHandled;
      }
      if (!ctx.pending.IsValid()) {
        ctx.pending = peer;
      }
      return ctx.GoTo(ctx.idx_connecting);
    }
    case kEvtDisconnect:
      ctx.selected = PeerId();
      ctx.connected.clear();
      ctx.retry_count = 0;
      ctx.Queue(SessionAction::kDisconnectAll);
      return ctx.GoTo(ctx.idx_disconnected);
    case kEvtPeerFound: {
      const PeerId& peer = EventPeer(event);
      if (FindPeer(ctx.available, peer) < 0) {
        (void)ctx.available.push_back(peer);
      }
      return TransitionResult::kHandled;
    }
    case kEvtPeerLost: {
      const PeerId& peer = EventPeer(event);
      int32_t i = FindPeer(ctx.available, peer);
      if (i >= 0) {
        (void)ctx.available.erase_unordered(static_cast<uint32_t>(i));
      }
      if (ctx.selected == peer && FindPeer(ctx.connected, peer) < 0) {
        ctx.selected = PeerId();
      }
      return TransitionResult::kHandled;
    }
    case kEvtTransportFailed:
      ctx.selected = PeerId();
      ctx.connected.clear();
      return ctx.DropToDisconnected();
    case kEvtRestartFailed:
      return ctx.GoTo(ctx.idx_failed);
    case kEvtStarted:
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

// Connecting: refuses new dials, retries failed ones.
inline TransitionResult SessionConnecting(SessionContext& ctx,
                                          const Event& event) {
  switch (event.id) {
    case kEvtInvite:
      ctx.rejected = true;
      return TransitionResult::kHandled;
    case kEvtPeerNotConnected: {
      const PeerId& peer = EventPeer(event);
      int32_t i = FindPeer(ctx.connected, peer);
      if (i >= 0) {
        (void)ctx.connected.erase_unordered(static_cast<uint32_t>(i));
      }
      if (ctx.pending.IsValid() && peer != ctx.pending) {
        // Late report for another peer; the dial in progress is unaffected.
        return TransitionResult::kHandled;
      }
      if (ctx.selected.IsValid() && peer == ctx.selected) {
        ++ctx.retry_count;
        if (ctx.retry_count < ctx.max_retries) {
          ctx.Queue(SessionAction::kInvite, ctx.selected);
          return TransitionResult::kHandled;
        }
      }
      if (!ctx.connected.empty()) {
        ctx.selected = PeerId();
        ctx.retry_count = 0;
        return ctx.GoTo(ctx.idx_connected);
      }
      return ctx.DropToDisconnected();
    }
    case kEvtPeerLost: {
      const PeerId& peer = EventPeer(event);
      if (ctx.selected != peer || FindPeer(ctx.connected, peer) >= 0) {
        return TransitionResult::kUnhandled;
      }
      int32_t i = FindPeer(ctx.available, peer);
      if (i >= 0) {
        (void)ctx.available.erase_unordered(static_cast<uint32_t>(i));
      }
      ctx.selected = PeerId();
      return ctx.GoTo(ctx.idx_disconnected);
    }
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult SessionFailed(SessionContext& ctx,
                                      const Event& event) {
  if (event.id == kEvtStarted) {
    return ctx.GoTo(ctx.idx_disconnected);
  }
  return TransitionResult::kUnhandled;
}

inline void OnEnterDisconnected(SessionContext& ctx) {
  ctx.state = ConnectionState::kDisconnected;
}

inline void OnEnterConnecting(SessionContext& ctx) {
  ctx.state = ConnectionState::kConnecting;
}

inline void OnEnterConnected(SessionContext& ctx) {
  ctx.state = ConnectionState::kConnected;
}

inline void OnEnterFailed(SessionContext& ctx) {
  ctx.state = ConnectionState::kFailed;
}

inline void OnExitConnecting(SessionContext& ctx) {
  ctx.pending = PeerId();
}

}  // namespace detail

// ============================================================================
// Session
// ============================================================================

/**
 * @brief Connection lifecycle owner and TransportListener for one adapter.
 *
 * Usage:
 * @code
 *   mirror::LoopbackHub hub;
 *   mirror::LoopbackTransport transport(hub, "phone");
 *   mirror::Session session(transport, mirror::SessionConfig{});
 *   session.Start(mirror::kRoleBoth);
 *   hub.Pump();
 *   session.Invite(session.Snapshot().available[0]);
 * @endcode
 */
class Session final : public TransportListener {
 public:
  Session(TransportAdapter& transport, const SessionConfig& config)
      : transport_(transport), config_(config), hsm_(ctx_) {
    ctx_.max_retries = (config.max_retries == 0U) ? 1U : config.max_retries;
    ctx_.accept_while_connected = config.accept_while_connected;
    InitializeHsm();
    transport_.SetListener(this);
  }

  ~Session() override { transport_.SetListener(nullptr); }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // ==========================================================================
  // Observers
  // ==========================================================================

  void SetObserver(SessionObserverFn fn, void* ctx = nullptr) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = fn;
    observer_ctx_ = ctx;
  }

  void SetDataHandler(SessionDataFn fn, void* ctx = nullptr) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    data_fn_ = fn;
    data_ctx_ = ctx;
  }

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /**
   * @brief Start advertising and/or browsing the configured service.
   *
   * A failure leaves the session in Failed; calling Start() again retries.
   */
  expected<void, SessionError> Start(uint8_t roles = kRoleBoth) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      roles_ = roles;
      started_ = true;
    }
    if (!StartRoles(roles)) {
      Post(kEvtRestartFailed, nullptr);
      return expected<void, SessionError>::error(
          SessionError::kTransportFailed);
    }
    Post(kEvtStarted, nullptr);
    return expected<void, SessionError>::success();
  }

  /** @brief Disconnect and stop all discovery roles. */
  void Stop() {
    Disconnect();
    transport_.StopAdvertising();
    transport_.StopBrowsing();
    std::lock_guard<std::mutex> lock(mutex_);
    roles_ = 0;
    started_ = false;
  }

  /**
   * @brief Dial `peer`. Refused while another dial is in progress.
   */
  expected<void, SessionError> Invite(const PeerId& peer) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!started_) {
        return expected<void, SessionError>::error(SessionError::kNotStarted);
      }
    }
    if (Post(kEvtInvite, &peer)) {
      MIRROR_LOG_DEBUG("Session", "invite %s refused: already connecting",
                       peer.name.c_str());
      return expected<void, SessionError>::error(
          SessionError::kAlreadyConnecting);
    }
    return expected<void, SessionError>::success();
  }

  /** @brief Drop every peer; the state is Disconnected on return. */
  void Disconnect() { (void)Post(kEvtDisconnect, nullptr); }

  // ==========================================================================
  // Send path
  // ==========================================================================

  /**
   * @brief Deliver `data` to every connected peer. Never retried.
   * @return kNotConnected unless Connected with at least one peer.
   */
  expected<void, TransportError> Send(const uint8_t* data, size_t size,
                                      Reliability reliability) {
    PeerList peers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ctx_.state != ConnectionState::kConnected || ctx_.connected.empty()) {
        return expected<void, TransportError>::error(
            TransportError::kNotConnected);
      }
      peers = ctx_.connected;
    }
    auto r = transport_.Send(data, size, peers.begin(), peers.size(),
                             reliability);
    if (!r.has_value()) {
      MIRROR_LOG_DEBUG("Session", "send of %zu bytes failed (%u)", size,
                       static_cast<unsigned>(r.get_error()));
    }
    return r;
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  ConnectionState State() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.state;
  }

  const char* StateName() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return hsm_.CurrentStateName();
  }

  bool IsConnected() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.state == ConnectionState::kConnected &&
           !ctx_.connected.empty();
  }

  uint32_t ConnectedCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_.connected.size();
  }

  SessionSnapshot Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot s;
    s.state = ctx_.state;
    s.connected = ctx_.connected;
    s.available = ctx_.available;
    s.selected = ctx_.selected;
    s.retry_count = ctx_.retry_count;
    return s;
  }

  const SessionConfig& Config() const noexcept { return config_; }
  TransportAdapter& Transport() noexcept { return transport_; }

  // ==========================================================================
  // TransportListener
  // ==========================================================================

  void OnPeerStateChanged(const PeerId& peer, PeerState state) override {
    MIRROR_LOG_DEBUG("Session", "peer %s -> %s", peer.name.c_str(),
                     PeerStateName(state));
    switch (state) {
      case PeerState::kConnected:
        (void)Post(kEvtPeerConnected, &peer);
        break;
      case PeerState::kConnecting:
        (void)Post(kEvtPeerConnecting, &peer);
        break;
      case PeerState::kNotConnected:
        (void)Post(kEvtPeerNotConnected, &peer);
        break;
    }
  }

  void OnDataReceived(const PeerId& peer, const uint8_t* data,
                      size_t size) override {
    SessionDataFn fn;
    void* ctx;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fn = data_fn_;
      ctx = data_ctx_;
    }
    if (fn != nullptr) {
      fn(ctx, peer, data, size);
    }
  }

  void OnPeerFound(const PeerId& peer) override {
    MIRROR_LOG_DEBUG("Session", "found peer %s", peer.name.c_str());
    (void)Post(kEvtPeerFound, &peer);
  }

  void OnPeerLost(const PeerId& peer) override {
    MIRROR_LOG_DEBUG("Session", "lost peer %s", peer.name.c_str());
    (void)Post(kEvtPeerLost, &peer);
  }

  bool OnInvitation(const PeerId& peer) override {
    const bool declined = Post(kEvtInvitation, &peer);
    MIRROR_LOG_INFO("Session", "invitation from %s %s", peer.name.c_str(),
                    declined ? "declined" : "accepted");
    return !declined;
  }

  void OnAdvertiseFailed(TransportError error) override {
    MIRROR_LOG_WARN("Session", "advertiser failed (%u)",
                    static_cast<unsigned>(error));
    (void)Post(kEvtTransportFailed, nullptr);
  }

  void OnBrowseFailed(TransportError error) override {
    MIRROR_LOG_WARN("Session", "browser failed (%u)",
                    static_cast<unsigned>(error));
    (void)Post(kEvtTransportFailed, nullptr);
  }

 private:
  using Hsm = StateMachine<SessionContext, 8>;
  using ActionList = FixedVector<SessionAction, 4>;

  /**
   * @brief Dispatch one event, then notify and run queued actions unlocked.
   * @return true if a handler rejected the event.
   */
  bool Post(uint32_t event_id, const void* data) {
    ConnectionState before;
    ConnectionState after;
    ActionList actions;
    SessionObserverFn observer;
    void* observer_ctx;
    bool rejected;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      before = ctx_.state;
      ctx_.rejected = false;
      hsm_.Dispatch(Event{event_id, data});
      after = ctx_.state;
      rejected = ctx_.rejected;
      actions = std::move(ctx_.actions);
      observer = observer_;
      observer_ctx = observer_ctx_;
    }
    if (before != after) {
      MIRROR_LOG_INFO("Session", "%s -> %s", ConnectionStateName(before),
                      ConnectionStateName(after));
      if (observer != nullptr) {
        observer(observer_ctx, before, after);
      }
    }
    RunActions(actions);
    return rejected;
  }

  void RunActions(const ActionList& actions) {
    for (const auto& action : actions) {
      switch (action.kind) {
        case SessionAction::kInvite: {
          auto r = transport_.Invite(action.peer, config_.invite_timeout_s);
          if (!r.has_value()) {
            MIRROR_LOG_WARN("Session", "invite %s failed",
                            action.peer.name.c_str());
            (void)Post(kEvtTransportFailed, nullptr);
          }
          break;
        }
        case SessionAction::kReinit:
          Reinit();
          break;
        case SessionAction::kDisconnectAll:
          transport_.DisconnectAll();
          break;
      }
    }
  }

  /// Teardown-and-reinit: fresh session, restart the active roles.
  void Reinit() {
    uint8_t roles;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      roles = roles_;
    }
    MIRROR_LOG_INFO("Session", "reinitializing transport (roles=%u)",
                    static_cast<unsigned>(roles));
    transport_.ResetSession();
    transport_.StopAdvertising();
    transport_.StopBrowsing();
    if (!StartRoles(roles)) {
      (void)Post(kEvtRestartFailed, nullptr);
    }
  }

  bool StartRoles(uint8_t roles) {
    const char* service = config_.service_type.c_str();
    if ((roles & kRoleAdvertiser) != 0U) {
      auto r = transport_.Advertise(service);
      if (!r.has_value()) {
        MIRROR_LOG_WARN("Session", "advertise '%s' failed", service);
        return false;
      }
    }
    if ((roles & kRoleBrowser) != 0U) {
      auto r = transport_.Browse(service);
      if (!r.has_value()) {
        MIRROR_LOG_WARN("Session", "browse '%s' failed", service);
        return false;
      }
    }
    return true;
  }

  void InitializeHsm() noexcept {
    ctx_.sm = &hsm_;

    ctx_.idx_root = hsm_.AddState({
        "Session", -1,
        detail::SessionRoot,
        nullptr, nullptr
    });

    ctx_.idx_disconnected = hsm_.AddState({
        "Disconnected", ctx_.idx_root,
        nullptr,
        detail::OnEnterDisconnected, nullptr
    });

    ctx_.idx_connecting = hsm_.AddState({
        "Connecting", ctx_.idx_root,
        detail::SessionConnecting,
        detail::OnEnterConnecting, detail::OnExitConnecting
    });

    ctx_.idx_connected = hsm_.AddState({
        "Connected", ctx_.idx_root,
        nullptr,
        detail::OnEnterConnected, nullptr
    });

    ctx_.idx_failed = hsm_.AddState({
        "Failed", ctx_.idx_root,
        detail::SessionFailed,
        detail::OnEnterFailed, nullptr
    });

    hsm_.SetInitialState(ctx_.idx_disconnected);
    hsm_.Start();
  }

  TransportAdapter& transport_;
  SessionConfig config_;
  SessionContext ctx_;
  Hsm hsm_;
  uint8_t roles_ = 0;
  bool started_ = false;
  SessionObserverFn observer_ = nullptr;
  void* observer_ctx_ = nullptr;
  SessionDataFn data_fn_ = nullptr;
  void* data_ctx_ = nullptr;
  mutable std::mutex mutex_;
};

}  // namespace mirror

#endif  // MIRROR_SESSION_HPP_
