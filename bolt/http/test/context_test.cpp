#include "bolt/context.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "bolt/handler.hpp"
#include "bolt/http-request.hpp"
#include "bolt/http-response.hpp"

namespace bolt {

class ContextTest : public ::testing::Test {
 protected:
  ContextTest() { ctx.reset(request, response); }

  // Handler recording its pre and post phases around next().
  Handler onion(const std::string& name) {
    return [this, name](Context& context) {
      events.push_back(name + "-pre");
      context.next();
      events.push_back(name + "-post");
    };
  }

  // Handler recording its call but never handing over.
  Handler terminal(const std::string& name) {
    return [this, name](Context&) {
      events.push_back(name + "-pre");
      events.push_back(name + "-post");
    };
  }

  HttpRequest request{"GET", "/users/42?verbose=1"};
  HttpResponse response;
  Context ctx{4};
  std::vector<std::string> events;
};

TEST_F(ContextTest, HandlesAreBound) {
  EXPECT_EQ(&ctx.request(), &request);
  EXPECT_EQ(&ctx.response(), &response);
  EXPECT_EQ(ctx.params().maxSize(), 4U);
  EXPECT_TRUE(ctx.params().empty());
  EXPECT_FALSE(ctx.halted());
  EXPECT_FALSE(ctx.exception());
}

TEST_F(ContextTest, OnionOrder) {
  const HandlerChain chain = MakeChain(onion("A"), onion("B"), onion("C"));
  ctx.run(chain);
  EXPECT_EQ(events, (std::vector<std::string>{"A-pre", "B-pre", "C-pre", "C-post", "B-post", "A-post"}));
}

TEST_F(ContextTest, HandlerNotCallingNextEndsChain) {
  const HandlerChain chain = MakeChain(onion("A"), terminal("B"), onion("C"));
  ctx.run(chain);
  EXPECT_EQ(events, (std::vector<std::string>{"A-pre", "B-pre", "B-post", "A-post"}));
}

TEST_F(ContextTest, NextAfterChainEndedIsNoOp) {
  const HandlerChain chain = MakeChain(
      [this](Context& context) {
        events.push_back("A-pre");
        context.next();
        context.next();
        events.push_back("A-post");
      },
      terminal("B"), onion("C"));
  ctx.run(chain);
  EXPECT_EQ(events, (std::vector<std::string>{"A-pre", "B-pre", "B-post", "A-post"}));
}

TEST_F(ContextTest, LastHandlerCallingNextIsHarmless) {
  const HandlerChain chain = MakeChain(onion("A"), onion("B"));
  ctx.run(chain);
  EXPECT_EQ(events, (std::vector<std::string>{"A-pre", "B-pre", "B-post", "A-post"}));
  ctx.next();
  EXPECT_EQ(events.size(), 4U);
}

TEST_F(ContextTest, HaltStopsLaterHandlersEvenIfEarlierOneCallsNextAgain) {
  const HandlerChain chain = MakeChain(
      [this](Context& context) {
        events.push_back("A-pre");
        context.next();
        // B halted: resuming from here must not reach C
        context.next();
        events.push_back("A-post");
      },
      [this](Context& context) {
        events.push_back("B");
        context.halt();
        context.next();
      },
      terminal("C"));
  ctx.run(chain);
  EXPECT_TRUE(ctx.halted());
  EXPECT_EQ(events, (std::vector<std::string>{"A-pre", "B", "A-post"}));
}

TEST_F(ContextTest, HaltBeforeNextInFirstHandler) {
  const HandlerChain chain = MakeChain(
      [this](Context& context) {
        context.halt();
        events.push_back("A");
        context.next();
      },
      terminal("B"));
  ctx.run(chain);
  EXPECT_EQ(events, (std::vector<std::string>{"A"}));
}

TEST_F(ContextTest, NextWithoutChainDoesNothing) {
  ctx.next();
  EXPECT_FALSE(ctx.halted());
}

TEST_F(ContextTest, RunClearsHaltedState) {
  const HandlerChain halting = MakeChain([](Context& context) { context.halt(); });
  ctx.run(halting);
  EXPECT_TRUE(ctx.halted());

  const HandlerChain chain = MakeChain(onion("A"), onion("B"));
  ctx.run(chain);
  EXPECT_FALSE(ctx.halted());
  EXPECT_EQ(events, (std::vector<std::string>{"A-pre", "B-pre", "B-post", "A-post"}));
}

TEST_F(ContextTest, StorePassesValuesDownTheChain) {
  const HandlerChain chain = MakeChain(
      [](Context& context) {
        context.set("user", std::string("alice"));
        context.set("attempts", 3);
        context.next();
      },
      [this](Context& context) {
        const std::string* pUser = context.get<std::string>("user");
        ASSERT_NE(pUser, nullptr);
        events.push_back(*pUser);
        // wrong type
        EXPECT_EQ(context.get<std::string>("attempts"), nullptr);
        const int* pAttempts = context.get<int>("attempts");
        ASSERT_NE(pAttempts, nullptr);
        EXPECT_EQ(*pAttempts, 3);
      });
  ctx.run(chain);
  EXPECT_EQ(events, (std::vector<std::string>{"alice"}));
  EXPECT_EQ(ctx.storeSize(), 2U);
}

TEST_F(ContextTest, StoreSetOverwritesAndErase) {
  ctx.set("k", 1);
  ctx.set("k", std::string("v"));
  EXPECT_EQ(ctx.storeSize(), 1U);
  EXPECT_EQ(ctx.get<int>("k"), nullptr);
  ASSERT_NE(ctx.get<std::string>("k"), nullptr);
  EXPECT_EQ(*ctx.get<std::string>("k"), "v");

  EXPECT_TRUE(ctx.contains("k"));
  EXPECT_TRUE(ctx.erase("k"));
  EXPECT_FALSE(ctx.erase("k"));
  EXPECT_FALSE(ctx.contains("k"));
  EXPECT_EQ(ctx.get<std::string>("missing"), nullptr);

  const Context& constCtx = ctx;
  EXPECT_EQ(constCtx.get<int>("missing"), nullptr);
}

TEST_F(ContextTest, StoreLongKeysAcrossRequests) {
  const std::string longKey(64, 'a');
  const std::string otherLongKey = longKey + "-other";

  for (int requestNb = 0; requestNb < 3; ++requestNb) {
    ctx.reset(request, response);
    ctx.set(longKey, requestNb);
    ctx.set(otherLongKey, std::string("x"));
    ctx.set("s", requestNb + 10);

    ASSERT_NE(ctx.get<int>(longKey), nullptr);
    EXPECT_EQ(*ctx.get<int>(longKey), requestNb);
    EXPECT_TRUE(ctx.contains("s"));
    EXPECT_FALSE(ctx.contains(std::string_view(longKey).substr(0, 10)));
    ASSERT_NE(ctx.get<std::string>(otherLongKey), nullptr);
    EXPECT_EQ(*ctx.get<int>("s"), requestNb + 10);

    EXPECT_TRUE(ctx.erase(otherLongKey));
    EXPECT_FALSE(ctx.contains(otherLongKey));
    EXPECT_TRUE(ctx.contains(longKey));
    EXPECT_EQ(ctx.storeSize(), 2U);
  }
}

TEST_F(ContextTest, ResetClearsPreviousRequest) {
  ctx.set("k", 1);
  const HandlerChain chain = MakeChain([](Context& context) { context.halt(); });
  ctx.run(chain);

  HttpRequest otherRequest("POST", "/other");
  HttpResponse otherResponse;
  ctx.reset(otherRequest, otherResponse);

  EXPECT_EQ(&ctx.request(), &otherRequest);
  EXPECT_EQ(&ctx.response(), &otherResponse);
  EXPECT_EQ(ctx.storeSize(), 0U);
  EXPECT_FALSE(ctx.contains("k"));
  EXPECT_TRUE(ctx.params().empty());
  EXPECT_FALSE(ctx.halted());
  // no chain bound anymore
  ctx.next();
}

TEST_F(ContextTest, ParamFallsBackToEmpty) { EXPECT_TRUE(ctx.param("id").empty()); }

}  // namespace bolt
