/**
 * @file transport.hpp
 * @brief Peer transport adapter interface and an in-process loopback
 *        implementation.
 *
 * A transport advertises and browses a named service, dials peers,
 * delivers byte payloads to connected peers and reports everything else
 * (peer state changes, discovery, inbound data, failures) through a
 * TransportListener. All adapter calls return immediately; outcomes arrive
 * later as listener callbacks.
 *
 * LoopbackHub wires any number of LoopbackTransport instances together in
 * one process. Events are queued and delivered by LoopbackHub::Pump(), so
 * a test controls exactly when callbacks run.
 */

#ifndef MIRROR_TRANSPORT_HPP_
#define MIRROR_TRANSPORT_HPP_

#include "mirror/log.hpp"
#include "mirror/platform.hpp"
#include "mirror/quality.hpp"
#include "mirror/vocabulary.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

#ifndef MIRROR_MAX_PEERS
#define MIRROR_MAX_PEERS 8U
#endif

namespace mirror {

// ============================================================================
// PeerId
// ============================================================================

/**
 * @brief Opaque peer identifier. Equality compares `value` only; `name` is
 *        a display label.
 */
struct PeerId {
  uint64_t value = 0;
  FixedString<63> name;

  PeerId() noexcept = default;
  PeerId(uint64_t v, const char* display_name) noexcept
      : value(v), name(TruncateToCapacity, display_name) {}

  bool IsValid() const noexcept { return value != 0U; }

  bool operator==(const PeerId& other) const noexcept {
    return value == other.value;
  }
  bool operator!=(const PeerId& other) const noexcept {
    return value != other.value;
  }
};

using PeerList = FixedVector<PeerId, MIRROR_MAX_PEERS>;

/** @brief Index of `peer` in `list`, or -1. */
inline int32_t FindPeer(const PeerList& list, const PeerId& peer) noexcept {
  for (uint32_t i = 0; i < list.size(); ++i) {
    if (list[i] == peer) return static_cast<int32_t>(i);
  }
  return -1;
}

/** @brief Link state of one remote peer as reported by the transport. */
enum class PeerState : uint8_t {
  kNotConnected,
  kConnecting,
  kConnected,
};

inline const char* PeerStateName(PeerState state) noexcept {
  switch (state) {
    case PeerState::kNotConnected: return "notConnected";
    case PeerState::kConnecting:   return "connecting";
    case PeerState::kConnected:    return "connected";
  }
  return "";
}

// ============================================================================
// TransportListener
// ============================================================================

class TransportListener {
 public:
  virtual ~TransportListener() = default;

  virtual void OnPeerStateChanged(const PeerId& peer, PeerState state) = 0;
  virtual void OnDataReceived(const PeerId& peer, const uint8_t* data,
                              size_t size) = 0;
  virtual void OnPeerFound(const PeerId& peer) = 0;
  virtual void OnPeerLost(const PeerId& peer) = 0;

  /** @return true to accept the invitation. */
  virtual bool OnInvitation(const PeerId& peer) = 0;

  virtual void OnAdvertiseFailed(TransportError error) = 0;
  virtual void OnBrowseFailed(TransportError error) = 0;
};

// ============================================================================
// TransportAdapter
// ============================================================================

class TransportAdapter {
 public:
  virtual ~TransportAdapter() = default;

  /** @brief Listener for all callbacks; nullptr detaches. Not owned. */
  virtual void SetListener(TransportListener* listener) = 0;

  virtual const PeerId& LocalPeer() const noexcept = 0;

  virtual expected<void, TransportError> Advertise(const char* service) = 0;
  virtual void StopAdvertising() = 0;
  virtual expected<void, TransportError> Browse(const char* service) = 0;
  virtual void StopBrowsing() = 0;

  virtual expected<void, TransportError> Invite(const PeerId& peer,
                                                uint32_t timeout_s) = 0;

  /** @brief Fire-and-forget delivery of `data` to every listed peer. */
  virtual expected<void, TransportError> Send(const uint8_t* data, size_t size,
                                              const PeerId* peers,
                                              uint32_t peer_count,
                                              Reliability reliability) = 0;

  /** @brief Drop all links and start a fresh session object. */
  virtual void ResetSession() = 0;

  /** @brief Drop all links, notifying both sides. */
  virtual void DisconnectAll() = 0;
};

// ============================================================================
// LoopbackHub / LoopbackTransport
// ============================================================================

class LoopbackTransport;

/**
 * @brief In-process rendezvous for loopback transports.
 *
 * Owns the advertise/browse registry, the link table and a FIFO of pending
 * callbacks. Thread-safe; callbacks are delivered only from Pump(), never
 * while the hub lock is held. A transport and its listener must not be
 * destroyed while another thread is inside Pump().
 */
class LoopbackHub final {
 public:
  LoopbackHub() = default;
  LoopbackHub(const LoopbackHub&) = delete;
  LoopbackHub& operator=(const LoopbackHub&) = delete;

  /**
   * @brief Deliver queued events until the queue is empty.
   * @param max_events Upper bound on delivered events (0 = no bound).
   * @return Number of events delivered.
   */
  uint32_t Pump(uint32_t max_events = 0);

  uint32_t PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(queue_.size());
  }

  uint64_t DeliveredBytes() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_bytes_;
  }

 private:
  friend class LoopbackTransport;

  enum class EventKind : uint8_t {
    kPeerState,
    kData,
    kFound,
    kLost,
    kInvitation,
  };

  struct QueuedEvent {
    EventKind kind;
    uint64_t target;  ///< Receiving transport id.
    PeerId from;
    PeerState state;
    std::vector<uint8_t> data;
  };

  struct Member {
    LoopbackTransport* transport;
    PeerId id;
    FixedString<63> advertised;  ///< Empty when not advertising.
    FixedString<63> browsed;     ///< Empty when not browsing.
    std::vector<uint64_t> links;
  };

  PeerId Attach(LoopbackTransport* transport, const char* name);
  void Detach(uint64_t id);

  Member* FindMember(uint64_t id) noexcept {
    for (auto& m : members_) {
      if (m.id.value == id) return &m;
    }
    return nullptr;
  }

  bool IsLinked(const Member& m, uint64_t peer) const noexcept {
    for (uint64_t l : m.links) {
      if (l == peer) return true;
    }
    return false;
  }

  void Unlink(Member& a, uint64_t peer) noexcept {
    for (size_t i = 0; i < a.links.size(); ++i) {
      if (a.links[i] == peer) {
        a.links.erase(a.links.begin() + static_cast<std::ptrdiff_t>(i));
        return;
      }
    }
  }

  void Push(EventKind kind, uint64_t target, const PeerId& from,
            PeerState state = PeerState::kNotConnected,
            std::vector<uint8_t> data = {}) {
    queue_.push_back(QueuedEvent{kind, target, from, state, std::move(data)});
  }

  /// Drop every link of `m`; `notify_self` also queues events for `m`.
  void DropLinks(Member& m, bool notify_self) {
    for (uint64_t peer : m.links) {
      Member* other = FindMember(peer);
      if (other == nullptr) continue;
      Unlink(*other, m.id.value);
      Push(EventKind::kPeerState, other->id.value, m.id,
           PeerState::kNotConnected);
      if (notify_self) {
        Push(EventKind::kPeerState, m.id.value, other->id,
             PeerState::kNotConnected);
      }
    }
    m.links.clear();
  }

  mutable std::mutex mutex_;
  std::vector<Member> members_;
  std::deque<QueuedEvent> queue_;
  uint64_t next_id_ = 1;
  uint64_t delivered_bytes_ = 0;
};

/**
 * @brief TransportAdapter over a LoopbackHub.
 *
 * Failure injection (`FailNext*`) makes the next matching call fail once,
 * so callers can exercise their error paths without a real radio.
 */
class LoopbackTransport final : public TransportAdapter {
 public:
  LoopbackTransport(LoopbackHub& hub, const char* display_name)
      : hub_(hub), local_(hub.Attach(this, display_name)) {}

  ~LoopbackTransport() override { hub_.Detach(local_.value); }

  LoopbackTransport(const LoopbackTransport&) = delete;
  LoopbackTransport& operator=(const LoopbackTransport&) = delete;

  void SetListener(TransportListener* listener) override {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = listener;
  }

  const PeerId& LocalPeer() const noexcept override { return local_; }

  expected<void, TransportError> Advertise(const char* service) override {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    if (TakeFailure(fail_advertise_)) {
      return expected<void, TransportError>::error(
          TransportError::kAdvertiseFailed);
    }
    LoopbackHub::Member* self = hub_.FindMember(local_.value);
    self->advertised.assign(TruncateToCapacity, service);
    for (const auto& m : hub_.members_) {
      if (m.id != local_ && m.browsed == self->advertised) {
        hub_.Push(LoopbackHub::EventKind::kFound, m.id.value, local_);
      }
    }
    return expected<void, TransportError>::success();
  }

  void StopAdvertising() override {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    LoopbackHub::Member* self = hub_.FindMember(local_.value);
    if (self->advertised.empty()) return;
    for (const auto& m : hub_.members_) {
      if (m.id != local_ && m.browsed == self->advertised) {
        hub_.Push(LoopbackHub::EventKind::kLost, m.id.value, local_);
      }
    }
    self->advertised.clear();
  }

  expected<void, TransportError> Browse(const char* service) override {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    if (TakeFailure(fail_browse_)) {
      return expected<void, TransportError>::error(
          TransportError::kBrowseFailed);
    }
    LoopbackHub::Member* self = hub_.FindMember(local_.value);
    self->browsed.assign(TruncateToCapacity, service);
    for (const auto& m : hub_.members_) {
      if (m.id != local_ && m.advertised == self->browsed) {
        hub_.Push(LoopbackHub::EventKind::kFound, local_.value, m.id);
      }
    }
    return expected<void, TransportError>::success();
  }

  void StopBrowsing() override {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    hub_.FindMember(local_.value)->browsed.clear();
  }

  expected<void, TransportError> Invite(const PeerId& peer,
                                        uint32_t timeout_s) override {
    (void)timeout_s;  // Loopback invitations resolve on the next Pump().
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    LoopbackHub::Member* target = hub_.FindMember(peer.value);
    if (TakeFailure(fail_invite_) || target == nullptr ||
        target->advertised.empty()) {
      return expected<void, TransportError>::error(
          TransportError::kInviteFailed);
    }
    hub_.Push(LoopbackHub::EventKind::kPeerState, local_.value, target->id,
              PeerState::kConnecting);
    hub_.Push(LoopbackHub::EventKind::kInvitation, target->id.value, local_);
    return expected<void, TransportError>::success();
  }

  expected<void, TransportError> Send(const uint8_t* data, size_t size,
                                      const PeerId* peers, uint32_t peer_count,
                                      Reliability reliability) override {
    (void)reliability;  // In-process delivery never drops.
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    if (TakeFailure(fail_send_)) {
      return expected<void, TransportError>::error(TransportError::kSendFailed);
    }
    LoopbackHub::Member* self = hub_.FindMember(local_.value);
    for (uint32_t i = 0; i < peer_count; ++i) {
      if (!hub_.IsLinked(*self, peers[i].value)) {
        return expected<void, TransportError>::error(
            TransportError::kNotConnected);
      }
    }
    for (uint32_t i = 0; i < peer_count; ++i) {
      hub_.Push(LoopbackHub::EventKind::kData, peers[i].value, local_,
                PeerState::kConnected, std::vector<uint8_t>(data, data + size));
    }
    return expected<void, TransportError>::success();
  }

  void ResetSession() override {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    hub_.DropLinks(*hub_.FindMember(local_.value), false);
  }

  void DisconnectAll() override {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    hub_.DropLinks(*hub_.FindMember(local_.value), true);
  }

  // --------------------------------------------------------------------------
  // Failure injection
  // --------------------------------------------------------------------------

  void FailNextAdvertise() { SetFailure(fail_advertise_); }
  void FailNextBrowse() { SetFailure(fail_browse_); }
  void FailNextInvite() { SetFailure(fail_invite_); }
  void FailNextSend() { SetFailure(fail_send_); }

  /** @brief Report an asynchronous advertiser failure to the listener. */
  void RaiseAdvertiseFailure() {
    TransportListener* l = Listener();
    if (l != nullptr) l->OnAdvertiseFailed(TransportError::kAdvertiseFailed);
  }

  /** @brief Report an asynchronous browser failure to the listener. */
  void RaiseBrowseFailure() {
    TransportListener* l = Listener();
    if (l != nullptr) l->OnBrowseFailed(TransportError::kBrowseFailed);
  }

 private:
  friend class LoopbackHub;

  void SetFailure(bool& flag) {
    std::lock_guard<std::mutex> lock(hub_.mutex_);
    flag = true;
  }

  static bool TakeFailure(bool& flag) noexcept {
    const bool fail = flag;
    flag = false;
    return fail;
  }

  TransportListener* Listener() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    return listener_;
  }

  LoopbackHub& hub_;
  PeerId local_;
  std::mutex listener_mutex_;
  TransportListener* listener_ = nullptr;
  // Guarded by hub_.mutex_.
  bool fail_advertise_ = false;
  bool fail_browse_ = false;
  bool fail_invite_ = false;
  bool fail_send_ = false;
};

// ============================================================================
// LoopbackHub out-of-class definitions
// ============================================================================

inline PeerId LoopbackHub::Attach(LoopbackTransport* transport,
                                  const char* name) {
  std::lock_guard<std::mutex> lock(mutex_);
  PeerId id(next_id_++, name);
  members_.push_back(Member{transport, id, {}, {}, {}});
  return id;
}

inline void LoopbackHub::Detach(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Member* self = FindMember(id);
  if (self == nullptr) return;
  DropLinks(*self, false);
  if (!self->advertised.empty()) {
    for (const auto& m : members_) {
      if (m.id.value != id && m.browsed == self->advertised) {
        Push(EventKind::kLost, m.id.value, self->id);
      }
    }
  }
  for (size_t i = 0; i < members_.size(); ++i) {
    if (members_[i].id.value == id) {
      members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(i));
      break;
    }
  }
}

inline uint32_t LoopbackHub::Pump(uint32_t max_events) {
  uint32_t delivered = 0;
  while (max_events == 0U || delivered < max_events) {
    QueuedEvent evt;
    TransportListener* listener = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty()) break;
      evt = std::move(queue_.front());
      queue_.pop_front();
      Member* m = FindMember(evt.target);
      if (m == nullptr) continue;  // Receiver went away.
      // Resolved under the hub lock: Detach() cannot run concurrently.
      listener = m->transport->Listener();
      if (evt.kind == EventKind::kData) {
        delivered_bytes_ += evt.data.size();
      }
    }
    ++delivered;

    if (listener == nullptr) continue;

    switch (evt.kind) {
      case EventKind::kPeerState:
        listener->OnPeerStateChanged(evt.from, evt.state);
        break;
      case EventKind::kData:
        listener->OnDataReceived(evt.from, evt.data.data(), evt.data.size());
        break;
      case EventKind::kFound:
        listener->OnPeerFound(evt.from);
        break;
      case EventKind::kLost:
        listener->OnPeerLost(evt.from);
        break;
      case EventKind::kInvitation: {
        const bool accepted = listener->OnInvitation(evt.from);
        std::lock_guard<std::mutex> lock(mutex_);
        Member* host = FindMember(evt.target);
        Member* guest = FindMember(evt.from.value);
        if (host == nullptr || guest == nullptr) break;
        if (accepted) {
          if (!IsLinked(*host, guest->id.value)) {
            host->links.push_back(guest->id.value);
            guest->links.push_back(host->id.value);
          }
          Push(EventKind::kPeerState, host->id.value, guest->id,
               PeerState::kConnected);
          Push(EventKind::kPeerState, guest->id.value, host->id,
               PeerState::kConnected);
        } else {
          MIRROR_LOG_DEBUG("Loopback", "invitation from %s declined",
                           guest->id.name.c_str());
          Push(EventKind::kPeerState, guest->id.value, host->id,
               PeerState::kNotConnected);
        }
        break;
      }
    }
  }
  return delivered;
}

}  // namespace mirror

#endif  // MIRROR_TRANSPORT_HPP_
