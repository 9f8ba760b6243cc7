#include <gtest/gtest.h>
#include <invar/engine.hpp>
#include <invar/testing/story_votes.hpp>

namespace invar {
namespace {

VerifierOptions test_options() {
    VerifierOptions options;
    options.threads = 2;
    options.samples = 500;
    options.seed = 0;
    return options;
}

std::vector<Value> ints(std::initializer_list<long> values) {
    std::vector<Value> result;
    for (long value : values) {
        result.push_back(Value::from_int(value));
    }
    return result;
}

class EngineTest : public ::testing::Test {
   protected:
    EngineTest() : engine(test_options()) {
        const VerificationReport& report = engine.load_schema(fixture.schema());
        EXPECT_TRUE(report.deployable());
        EXPECT_TRUE(engine.init_state(store).ok());
    }

    StoryVotes fixture;
    Engine engine;
    Store store;
};

TEST_F(EngineTest, InitStateCreatesEmptyBags) {
    const State state = store.snapshot();
    EXPECT_TRUE(state.get("votes").empty());
    EXPECT_TRUE(state.get("stories").empty());
}

TEST_F(EngineTest, InsertVoteUniqueness) {
    const VerificationReport& report = engine.report();
    const Verdict* verdict = report.find("insertVote", "uniqueVoteIds");
    ASSERT_TRUE(verdict);
    EXPECT_EQ(verdict->kind, VerdictKind::PROVEN);

    const Value story = fixture.story(store.new_id(), 1, 100, 0, 3, {}, {});
    EXPECT_TRUE(engine.apply_operation(store, "insertStory", {story}).ok());

    const Value vote = fixture.vote(store.new_id(), 1, 1, 100, 1);
    EXPECT_TRUE(engine.apply_operation(store, "insertVote", {vote}).ok());
    const State before = store.snapshot();
    const Status again = engine.apply_operation(store, "insertVote", {vote});
    EXPECT_EQ(again.code, ErrorCode::PRECONDITION_VIOLATION);
    EXPECT_EQ(store.snapshot(), before);
    EXPECT_EQ(before.get("votes").size(), 1UL);
}

TEST_F(EngineTest, InsertThenQueryRoundTrip) {
    const Value vote = fixture.vote(store.new_id(), 1, 5, 100, 1);
    ASSERT_TRUE(engine.apply_operation(store, "insertVote", {vote}).ok());
    const Value story = fixture.story(store.new_id(), 5, 100, 0, 3, {}, {vote});
    ASSERT_TRUE(engine.apply_operation(store, "insertStory", {story}).ok());

    const QueryResult result =
        engine.run_query(store, "selectStoryVotes", ints({200, 0, 1, 1}));
    ASSERT_TRUE(result.status.ok()) << result.status;
    ASSERT_EQ(result.rows.size(), 1UL);
    EXPECT_EQ(StoryVotes::row_story(result.rows[0]), story);
    EXPECT_EQ(StoryVotes::row_votes(result.rows[0]).count(vote), 1UL);

    const QueryResult again =
        engine.run_query(store, "selectStoryVotes", ints({200, 0, 1, 1}));
    EXPECT_EQ(again.rows, result.rows);
}

TEST_F(EngineTest, HiddenStoryIsExcluded) {
    const Value story =
        fixture.story(store.new_id(), 5, 100, 0, 3, {200}, {});
    ASSERT_TRUE(engine.apply_operation(store, "insertStory", {story}).ok());
    EXPECT_TRUE(
        engine.run_query(store, "selectStoryVotes", ints({200, 0, 0, 1}))
            .rows.empty());
    EXPECT_EQ(
        engine.run_query(store, "selectStoryVotes", ints({201, 0, 0, 1}))
            .rows.size(),
        1UL);
}

TEST_F(EngineTest, StoryWithUnknownVotesIsRejected) {
    const Value vote = fixture.vote(store.new_id(), 1, 5, 100, 1);
    const Value story = fixture.story(store.new_id(), 5, 100, 0, 3, {}, {vote});
    EXPECT_EQ(engine.apply_operation(store, "insertStory", {story}).code,
              ErrorCode::PRECONDITION_VIOLATION);
    EXPECT_TRUE(store.snapshot().get("stories").empty());
}

TEST_F(EngineTest, UnknownNamesAreNotFound) {
    EXPECT_EQ(engine.apply_operation(store, "deleteStory", {}).code,
              ErrorCode::NOT_FOUND);
    EXPECT_EQ(engine.run_query(store, "selectAll", {}).status.code,
              ErrorCode::NOT_FOUND);
    EXPECT_EQ(engine.run_query(store, "selectStoryVotes", ints({1})).status.code,
              ErrorCode::PARAMETER_ERROR);
}

TEST_F(EngineTest, SeedMustSatisfyInvariants) {
    const Value vote = fixture.vote(3, 1, 5, 100, 1);
    State seed;
    seed.set("votes", Bag({vote, fixture.vote(4, 1, 6, 101, 1)}));
    Store seeded;
    EXPECT_EQ(engine.init_state(seeded, seed).code, ErrorCode::INVALID_SEED);

    seed.set("votes", Bag({vote}));
    ASSERT_TRUE(engine.init_state(seeded, seed).ok());
    EXPECT_TRUE(seeded.snapshot().get("stories").empty());
    EXPECT_GT(seeded.new_id(), 3UL);

    State unknown;
    unknown.set("comments", Bag());
    EXPECT_EQ(engine.init_state(seeded, unknown).code, ErrorCode::INVALID_SEED);
}

TEST_F(EngineTest, SeedHandlesMustAgree) {
    State seed;
    seed.set("votes", Bag({fixture.vote(3, 1, 5, 100, 1)}));
    // The embedded copy of vote 3 carries another value.
    const Value embedded = fixture.vote(3, 1, 5, 100, -1);
    seed.set("stories",
             Bag({fixture.story(4, 5, 100, 0, 0, {}, {embedded})}));
    Store seeded;
    EXPECT_EQ(engine.init_state(seeded, seed).code, ErrorCode::INVALID_SEED);
}

TEST_F(EngineTest, EmbeddedVoteMustMatchStoredVote) {
    const Value vote = fixture.vote(store.new_id(), 1, 5, 100, 1);
    ASSERT_TRUE(engine.apply_operation(store, "insertVote", {vote}).ok());

    // Same identity as the stored vote, so membership holds, but another val.
    const Value forged = fixture.vote(vote.handle_id(), 1, 5, 100, -1);
    const Value story =
        fixture.story(store.new_id(), 5, 100, 0, 0, {}, {forged});
    const State before = store.snapshot();
    EXPECT_EQ(engine.apply_operation(store, "insertStory", {story}).code,
              ErrorCode::PARAMETER_ERROR);
    EXPECT_EQ(store.snapshot(), before);

    const Value honest =
        fixture.story(story.handle_id(), 5, 100, 0, 0, {}, {vote});
    EXPECT_TRUE(engine.apply_operation(store, "insertStory", {honest}).ok());
}

TEST_F(EngineTest, IllTypedSeedIsFatal) {
    State seed;
    seed.set("votes", Bag(ints({1})));
    Store seeded;
    EXPECT_THROW(engine.init_state(seeded, seed), TypeMismatch);
}

TEST(EngineOrphanTest, DisprovenSchemaIsNotDeployable) {
    StoryVotes fixture(false);
    Engine engine(test_options());
    const VerificationReport& report = engine.load_schema(fixture.schema());
    EXPECT_FALSE(report.deployable());
    EXPECT_EQ(report.judgment("insertVote"), Trool::FALSE);

    // The runtime safety net still holds the line.
    Store store;
    ASSERT_TRUE(engine.init_state(store).ok());
    const Value vote = fixture.vote(store.new_id(), 1, 5, 100, 1);
    EXPECT_EQ(engine.apply_operation(store, "insertVote", {vote}).code,
              ErrorCode::INVARIANT_VIOLATED_AT_RUNTIME);
    EXPECT_TRUE(store.snapshot().get("votes").empty());
}

}  // namespace
}  // namespace invar
