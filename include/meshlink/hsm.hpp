/**
 * @file hsm.hpp
 * @brief Fixed-capacity hierarchical state machine.
 *
 * States form a tree declared through StateConfig (parent index -1 marks a
 * top-level state). An event is offered to the current state first and
 * bubbles toward the root while handlers return kUnhandled. A handler that
 * returns RequestTransition(target) causes exit actions from the current
 * state up to the common ancestor, then entry actions down to the target.
 *
 * No heap, no exceptions; handlers are plain function pointers taking the
 * user context by reference.
 */

#ifndef MESHLINK_HSM_HPP_
#define MESHLINK_HSM_HPP_

#include "meshlink/platform.hpp"

#include <cstdint>

#ifndef MESHLINK_HSM_MAX_DEPTH
#define MESHLINK_HSM_MAX_DEPTH 16
#endif

namespace meshlink {

struct Event {
  uint32_t id;
  const void* data;  ///< Optional payload, nullptr if unused.
};

enum class TransitionResult : uint8_t {
  kHandled,    ///< Consumed, no state change.
  kUnhandled,  ///< Offer to the parent state.
  kTransition  ///< Returned by RequestTransition().
};

template <typename Context>
struct StateConfig {
  using HandlerFn = TransitionResult (*)(Context& ctx, const Event& event);
  using EntryFn = void (*)(Context& ctx);
  using ExitFn = void (*)(Context& ctx);
  using GuardFn = bool (*)(const Context& ctx, const Event& event);

  const char* name;      ///< Static lifetime.
  int32_t parent_index;  ///< -1 for a top-level state.
  HandlerFn handler;
  EntryFn on_entry;      ///< nullptr if none
  ExitFn on_exit;        ///< nullptr if none
  GuardFn guard;         ///< State is skipped while the guard is false.
};

/**
 * @tparam Context   User context, must outlive the machine.
 * @tparam MaxStates Capacity of the state table.
 */
template <typename Context, uint32_t MaxStates = 16>
class StateMachine final {
 public:
  static constexpr int32_t kNoState = -1;

  explicit StateMachine(Context& ctx) noexcept
      : ctx_(ctx),
        current_(kNoState),
        initial_(kNoState),
        pending_(kNoState),
        count_(0U),
        transitions_(0U),
        dropped_(0U),
        started_(false) {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  /// @return Index of the new state, or kNoState when the table is full.
  int32_t AddState(const StateConfig<Context>& config) noexcept {
    MESHLINK_ASSERT(!started_);
    MESHLINK_ASSERT(config.parent_index < static_cast<int32_t>(count_));
    if (count_ >= MaxStates) {
      return kNoState;
    }
    states_[count_] = config;
    return static_cast<int32_t>(count_++);
  }

  void SetInitialState(int32_t index) noexcept {
    MESHLINK_ASSERT(!started_);
    MESHLINK_ASSERT(IsValid(index));
    initial_ = index;
  }

  /// @brief Enter the initial state, running entry actions outermost first.
  void Start() noexcept {
    MESHLINK_ASSERT(!started_);
    MESHLINK_ASSERT(IsValid(initial_));
    started_ = true;
    current_ = initial_;
    Chain chain;
    BuildChain(initial_, chain);
    for (uint32_t i = 0U; i < chain.len; ++i) {
      RunEntry(chain.idx[i]);
    }
  }

  /**
   * @brief Offer @p event to the current state and its ancestors.
   *
   * Events that no state consumes are counted in UnhandledCount().
   */
  void Dispatch(const Event& event) noexcept {
    MESHLINK_ASSERT(started_);
    for (int32_t s = current_; s >= 0; s = Parent(s)) {
      const StateConfig<Context>& sc = At(s);
      if (sc.guard != nullptr && !sc.guard(ctx_, event)) {
        continue;
      }
      if (sc.handler == nullptr) {
        continue;
      }
      const TransitionResult r = sc.handler(ctx_, event);
      if (r == TransitionResult::kHandled) {
        return;
      }
      if (r == TransitionResult::kTransition) {
        MESHLINK_ASSERT(IsValid(pending_));
        const int32_t target = pending_;
        pending_ = kNoState;
        TransitionTo(target);
        return;
      }
    }
    ++dropped_;
  }

  /// @brief Call from a handler and return its result.
  TransitionResult RequestTransition(int32_t target) noexcept {
    pending_ = target;
    return TransitionResult::kTransition;
  }

  int32_t CurrentState() const noexcept { return current_; }

  const char* CurrentStateName() const noexcept {
    return (current_ >= 0) ? At(current_).name : "";
  }

  /// @brief True if the current state is @p index or nested inside it.
  bool IsInState(int32_t index) const noexcept {
    for (int32_t s = current_; s >= 0; s = Parent(s)) {
      if (s == index) {
        return true;
      }
    }
    return false;
  }

  bool IsStarted() const noexcept { return started_; }
  uint32_t StateCount() const noexcept { return count_; }
  uint32_t TransitionCount() const noexcept { return transitions_; }
  uint32_t UnhandledCount() const noexcept { return dropped_; }

 private:
  // Ancestor chain, outermost first.
  struct Chain {
    int32_t idx[MESHLINK_HSM_MAX_DEPTH];
    uint32_t len;
  };

  void TransitionTo(int32_t target) noexcept {
    ++transitions_;
    const int32_t source = current_;
    if (source == target) {
      RunExit(source);
      RunEntry(source);
      return;
    }

    Chain from;
    Chain to;
    BuildChain(source, from);
    BuildChain(target, to);
    uint32_t common = 0U;
    while (common < from.len && common < to.len &&
           from.idx[common] == to.idx[common]) {
      ++common;
    }

    for (uint32_t i = from.len; i > common; --i) {
      RunExit(from.idx[i - 1U]);
    }
    // Entry actions may query the current state.
    current_ = target;
    for (uint32_t i = common; i < to.len; ++i) {
      RunEntry(to.idx[i]);
    }
  }

  void BuildChain(int32_t leaf, Chain& chain) const noexcept {
    int32_t rev[MESHLINK_HSM_MAX_DEPTH];
    uint32_t n = 0U;
    for (int32_t s = leaf; s >= 0; s = Parent(s)) {
      MESHLINK_ASSERT(n < MESHLINK_HSM_MAX_DEPTH);
      rev[n++] = s;
    }
    chain.len = n;
    for (uint32_t i = 0U; i < n; ++i) {
      chain.idx[i] = rev[n - 1U - i];
    }
  }

  void RunEntry(int32_t s) noexcept {
    if (At(s).on_entry != nullptr) {
      At(s).on_entry(ctx_);
    }
  }

  void RunExit(int32_t s) noexcept {
    if (At(s).on_exit != nullptr) {
      At(s).on_exit(ctx_);
    }
  }

  bool IsValid(int32_t s) const noexcept {
    return s >= 0 && static_cast<uint32_t>(s) < count_;
  }
  int32_t Parent(int32_t s) const noexcept { return At(s).parent_index; }
  const StateConfig<Context>& At(int32_t s) const noexcept {
    return states_[static_cast<uint32_t>(s)];
  }

  Context& ctx_;
  int32_t current_;
  int32_t initial_;
  int32_t pending_;
  uint32_t count_;
  uint32_t transitions_;
  uint32_t dropped_;
  bool started_;
  StateConfig<Context> states_[MaxStates];
};

}  // namespace meshlink

#endif  // MESHLINK_HSM_HPP_
