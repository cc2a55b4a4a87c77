/**
 * @file test_hsm.cpp
 * @brief Tests for mirror/hsm.hpp
 */

#include "mirror/hsm.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {

// ============================================================================
// Test machine
//
//   Link
//    +-- Idle
//    +-- Active
//        +-- Dialing
//        +-- Streaming
// ============================================================================

enum : uint32_t {
  kEvDial = 1,
  kEvAnswer = 2,
  kEvHangup = 3,
  kEvPing = 4,
  kEvRedial = 5,
  kEvUnknown = 99,
};

struct LinkContext;
using LinkSm = mirror::StateMachine<LinkContext, 8>;

struct LinkContext {
  std::vector<std::string> log;
  int pings = 0;
  LinkSm* sm = nullptr;
  int32_t idle = -1;
  int32_t active = -1;
  int32_t dialing = -1;
  int32_t streaming = -1;
};

void Log(LinkContext& ctx, const char* what) { ctx.log.emplace_back(what); }

mirror::TransitionResult LinkHandler(LinkContext& ctx,
                                     const mirror::Event& ev) {
  if (ev.id == kEvPing) {
    ++ctx.pings;
    return mirror::TransitionResult::kHandled;
  }
  return mirror::TransitionResult::kUnhandled;
}

mirror::TransitionResult IdleHandler(LinkContext& ctx,
                                     const mirror::Event& ev) {
  if (ev.id == kEvDial) return ctx.sm->RequestTransition(ctx.dialing);
  return mirror::TransitionResult::kUnhandled;
}

mirror::TransitionResult ActiveHandler(LinkContext& ctx,
                                       const mirror::Event& ev) {
  if (ev.id == kEvHangup) return ctx.sm->RequestTransition(ctx.idle);
  return mirror::TransitionResult::kUnhandled;
}

mirror::TransitionResult DialingHandler(LinkContext& ctx,
                                        const mirror::Event& ev) {
  if (ev.id == kEvAnswer) {
    const int* peer = static_cast<const int*>(ev.data);
    if (peer != nullptr && *peer < 0) {
      return mirror::TransitionResult::kHandled;  // refused
    }
    return ctx.sm->RequestTransition(ctx.streaming);
  }
  if (ev.id == kEvRedial) return ctx.sm->RequestTransition(ctx.dialing);
  return mirror::TransitionResult::kUnhandled;
}

void Build(LinkSm& sm, LinkContext& ctx) {
  ctx.sm = &sm;
  const int32_t root = sm.AddState(
      {"Link", -1, LinkHandler, [](LinkContext& c) { Log(c, "Link:entry"); },
       [](LinkContext& c) { Log(c, "Link:exit"); }});
  ctx.idle = sm.AddState(
      {"Idle", root, IdleHandler, [](LinkContext& c) { Log(c, "Idle:entry"); },
       [](LinkContext& c) { Log(c, "Idle:exit"); }});
  ctx.active = sm.AddState({"Active", root, ActiveHandler,
                            [](LinkContext& c) { Log(c, "Active:entry"); },
                            [](LinkContext& c) { Log(c, "Active:exit"); }});
  ctx.dialing = sm.AddState({"Dialing", ctx.active, DialingHandler,
                             [](LinkContext& c) { Log(c, "Dialing:entry"); },
                             [](LinkContext& c) { Log(c, "Dialing:exit"); }});
  ctx.streaming = sm.AddState(
      {"Streaming", ctx.active, nullptr,
       [](LinkContext& c) { Log(c, "Streaming:entry"); },
       [](LinkContext& c) { Log(c, "Streaming:exit"); }});
  sm.SetInitialState(ctx.idle);
}

mirror::Event Ev(uint32_t id, const void* data = nullptr) {
  return mirror::Event{id, data};
}

}  // namespace

// ============================================================================
// Tests
// ============================================================================

TEST_CASE("hsm - Start enters root then initial state", "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  REQUIRE_FALSE(sm.IsStarted());

  sm.Start();

  REQUIRE(sm.IsStarted());
  REQUIRE(ctx.log == std::vector<std::string>{"Link:entry", "Idle:entry"});
  CHECK(sm.CurrentState() == ctx.idle);
  CHECK(std::string(sm.CurrentStateName()) == "Idle");
}

TEST_CASE("hsm - Transition into a nested state enters the parent",
          "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  sm.Start();
  ctx.log.clear();

  sm.Dispatch(Ev(kEvDial));

  CHECK(ctx.log ==
        std::vector<std::string>{"Idle:exit", "Active:entry", "Dialing:entry"});
  CHECK(sm.IsInState(ctx.active));
  CHECK(sm.IsInState(ctx.dialing));
  CHECK_FALSE(sm.IsInState(ctx.idle));
}

TEST_CASE("hsm - Sibling transition stays below the common ancestor",
          "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  sm.Start();
  sm.Dispatch(Ev(kEvDial));
  ctx.log.clear();

  sm.Dispatch(Ev(kEvAnswer));

  CHECK(ctx.log ==
        std::vector<std::string>{"Dialing:exit", "Streaming:entry"});
  CHECK(sm.CurrentState() == ctx.streaming);
}

TEST_CASE("hsm - Events bubble to the parent", "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  sm.Start();
  sm.Dispatch(Ev(kEvDial));
  sm.Dispatch(Ev(kEvAnswer));
  ctx.log.clear();

  // Streaming has no handler; Active handles hangup.
  sm.Dispatch(Ev(kEvHangup));

  CHECK(ctx.log == std::vector<std::string>{"Streaming:exit", "Active:exit",
                                            "Idle:entry"});
  CHECK(sm.CurrentState() == ctx.idle);

  // Root handles ping from any state.
  sm.Dispatch(Ev(kEvPing));
  sm.Dispatch(Ev(kEvDial));
  sm.Dispatch(Ev(kEvPing));
  CHECK(ctx.pings == 2);
}

TEST_CASE("hsm - Handled event without transition keeps the state",
          "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  sm.Start();
  sm.Dispatch(Ev(kEvDial));
  ctx.log.clear();

  const int refused = -1;
  sm.Dispatch(Ev(kEvAnswer, &refused));

  CHECK(ctx.log.empty());
  CHECK(sm.CurrentState() == ctx.dialing);
}

TEST_CASE("hsm - Self transition re-runs exit and entry", "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  sm.Start();
  sm.Dispatch(Ev(kEvDial));
  ctx.log.clear();

  sm.Dispatch(Ev(kEvRedial));

  CHECK(ctx.log == std::vector<std::string>{"Dialing:exit", "Dialing:entry"});
  CHECK(sm.CurrentState() == ctx.dialing);
}

TEST_CASE("hsm - Unknown events are dropped", "[hsm]") {
  LinkContext ctx;
  LinkSm sm(ctx);
  Build(sm, ctx);
  sm.Start();
  ctx.log.clear();

  sm.Dispatch(Ev(kEvUnknown));

  CHECK(ctx.log.empty());
  CHECK(sm.CurrentState() == ctx.idle);
}

TEST_CASE("hsm - AddState reports a full table", "[hsm]") {
  LinkContext ctx;
  mirror::StateMachine<LinkContext, 2> sm(ctx);
  CHECK(sm.AddState({"a", -1, nullptr, nullptr, nullptr}) == 0);
  CHECK(sm.AddState({"b", 0, nullptr, nullptr, nullptr}) == 1);
  CHECK(sm.AddState({"c", 0, nullptr, nullptr, nullptr}) ==
        mirror::StateMachine<LinkContext, 2>::kNoState);
}
