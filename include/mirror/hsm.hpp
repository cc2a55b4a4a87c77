/**
 * @file hsm.hpp
 * @brief Header-only hierarchical state machine used by the session core.
 *
 * - Fixed state table, no heap allocation
 * - Plain function pointers for handlers and entry/exit actions
 * - Events bubble from the current state to its ancestors until handled
 * - Transitions exit up to the lowest common ancestor, then enter down
 *
 * The machine itself is not thread-safe; owners serialize Dispatch().
 */

#ifndef MIRROR_HSM_HPP_
#define MIRROR_HSM_HPP_

#include "mirror/platform.hpp"

#ifndef MIRROR_HSM_MAX_DEPTH
#define MIRROR_HSM_MAX_DEPTH 8
#endif

namespace mirror {

/**
 * @brief Event passed to state handlers.
 *
 * `data` points at an event-specific payload owned by the dispatcher and
 * valid only for the duration of Dispatch().
 */
struct Event {
  uint32_t id;
  const void* data;
};

enum class TransitionResult : uint8_t {
  kHandled,    ///< Event consumed.
  kUnhandled,  ///< Bubble to parent state.
  kTransition  ///< Transition requested via RequestTransition().
};

template <typename Context>
struct StateConfig {
  using HandlerFn = TransitionResult (*)(Context& ctx, const Event& event);
  using ActionFn = void (*)(Context& ctx);

  const char* name;      ///< Static lifetime.
  int32_t parent_index;  ///< -1 for a root state.
  HandlerFn handler;
  ActionFn on_entry;     ///< nullptr if none.
  ActionFn on_exit;      ///< nullptr if none.
};

template <typename Context, uint32_t MaxStates = 8>
class StateMachine final {
 public:
  static constexpr int32_t kNoState = -1;

  explicit StateMachine(Context& ctx) noexcept
      : ctx_(ctx),
        current_(kNoState),
        initial_(kNoState),
        count_(0),
        started_(false),
        pending_(kNoState) {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  /** @return Index of the new state, or kNoState if the table is full. */
  int32_t AddState(const StateConfig<Context>& config) noexcept {
    MIRROR_ASSERT(!started_);
    if (count_ >= MaxStates) {
      return kNoState;
    }
    states_[count_] = config;
    return static_cast<int32_t>(count_++);
  }

  void SetInitialState(int32_t index) noexcept {
    MIRROR_ASSERT(!started_);
    MIRROR_ASSERT(index >= 0 && static_cast<uint32_t>(index) < count_);
    initial_ = index;
  }

  /** @brief Enter the initial state and its ancestors, root first. */
  void Start() noexcept {
    MIRROR_ASSERT(!started_ && initial_ >= 0);
    started_ = true;
    current_ = initial_;
    EnterPath(kNoState, initial_);
  }

  /**
   * @brief Offer an event to the current state, bubbling to ancestors.
   *
   * A handler returning kTransition completes the requested transition
   * before Dispatch() returns. Events nobody handles are dropped.
   */
  void Dispatch(const Event& event) noexcept {
    MIRROR_ASSERT(started_);
    for (int32_t s = current_; s >= 0; s = states_[s].parent_index) {
      if (states_[s].handler == nullptr) {
        continue;
      }
      TransitionResult result = states_[s].handler(ctx_, event);
      if (result == TransitionResult::kHandled) {
        return;
      }
      if (result == TransitionResult::kTransition) {
        MIRROR_ASSERT(pending_ >= 0);
        int32_t target = pending_;
        pending_ = kNoState;
        TransitionTo(target);
        return;
      }
    }
  }

  /** @brief Call from a handler and return the result from it. */
  TransitionResult RequestTransition(int32_t target) noexcept {
    pending_ = target;
    return TransitionResult::kTransition;
  }

  int32_t CurrentState() const noexcept { return current_; }

  const char* CurrentStateName() const noexcept {
    return (current_ < 0) ? "" : states_[current_].name;
  }

  /** @brief True if current state is `index` or one of its descendants. */
  bool IsInState(int32_t index) const noexcept {
    for (int32_t s = current_; s >= 0; s = states_[s].parent_index) {
      if (s == index) return true;
    }
    return false;
  }

  bool IsStarted() const noexcept { return started_; }

 private:
  void TransitionTo(int32_t target) noexcept {
    if (current_ == target) {
      // Self-transition re-runs exit and entry of the same state.
      Exit(current_);
      Enter(current_);
      return;
    }
    int32_t lca = FindLca(current_, target);
    for (int32_t s = current_; s >= 0 && s != lca;
         s = states_[s].parent_index) {
      Exit(s);
    }
    EnterPath(lca, target);
    current_ = target;
  }

  /** Enter every state strictly below `from` down to `to`, top-down. */
  void EnterPath(int32_t from, int32_t to) noexcept {
    int32_t path[MIRROR_HSM_MAX_DEPTH];
    uint32_t len = 0;
    for (int32_t s = to; s >= 0 && s != from; s = states_[s].parent_index) {
      MIRROR_ASSERT(len < MIRROR_HSM_MAX_DEPTH);
      path[len++] = s;
    }
    while (len > 0) {
      Enter(path[--len]);
    }
  }

  void Enter(int32_t s) noexcept {
    if (states_[s].on_entry != nullptr) states_[s].on_entry(ctx_);
  }

  void Exit(int32_t s) noexcept {
    if (states_[s].on_exit != nullptr) states_[s].on_exit(ctx_);
  }

  int32_t Depth(int32_t s) const noexcept {
    int32_t depth = 0;
    for (; s >= 0; s = states_[s].parent_index) ++depth;
    return depth;
  }

  int32_t FindLca(int32_t a, int32_t b) const noexcept {
    int32_t da = Depth(a);
    int32_t db = Depth(b);
    for (; da > db; --da) a = states_[a].parent_index;
    for (; db > da; --db) b = states_[b].parent_index;
    while (a != b) {
      a = (a >= 0) ? states_[a].parent_index : kNoState;
      b = (b >= 0) ? states_[b].parent_index : kNoState;
    }
    return a;
  }

  Context& ctx_;
  int32_t current_;
  int32_t initial_;
  uint32_t count_;
  bool started_;
  int32_t pending_;
  StateConfig<Context> states_[MaxStates];
};

}  // namespace mirror

#endif  // MIRROR_HSM_HPP_
