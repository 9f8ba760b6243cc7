#include <gtest/gtest.h>
#include <invar/query/query_engine.hpp>
#include <invar/testing/story_votes.hpp>

namespace invar {
namespace {

using namespace dsl;

std::vector<Value> ints(std::initializer_list<long> values) {
    std::vector<Value> result;
    for (long value : values) {
        result.push_back(Value::from_int(value));
    }
    return result;
}

class SelectStoryVotesTest : public ::testing::Test {
   protected:
    SelectStoryVotesTest()
        : query(*fixture.schema().find_query("selectStoryVotes")) {
        const Value up1 = fixture.vote(1, 1, 10, 100, 1);
        const Value down = fixture.vote(2, 2, 10, 101, -1);
        const Value up2 = fixture.vote(3, 3, 30, 100, 1);
        // Stories are declared out of id order to exercise the sort.
        const Value story30 = fixture.story(13, 30, 7, 0, 5, {}, {up2});
        const Value story10 = fixture.story(11, 10, 7, 0, 5, {}, {up1, down});
        const Value hidden = fixture.story(12, 20, 7, 0, 9, {100}, {});
        const Value merged = fixture.story(14, 40, 7, 1, 9, {}, {});
        const Value low = fixture.story(15, 50, 7, 0, 1, {}, {});
        state.set("votes", Bag({up1, down, up2}));
        state.set("stories", Bag({story30, story10, hidden, merged, low}));
    }

    StoryVotes fixture;
    const Query& query;
    State state;
};

TEST_F(SelectStoryVotesTest, FiltersAndNestsVotes) {
    const QueryResult result = run_query(query, ints({100, 0, 2, 1}), state);
    ASSERT_TRUE(result.status.ok()) << result.status;
    ASSERT_EQ(result.rows.size(), 2UL);

    const Value& first = StoryVotes::row_story(result.rows[0]);
    const Value& second = StoryVotes::row_story(result.rows[1]);
    EXPECT_EQ(first.handle_id(), 11UL);
    EXPECT_EQ(second.handle_id(), 13UL);
    EXPECT_EQ(StoryVotes::row_votes(result.rows[0]),
              Bag({fixture.vote(1, 1, 10, 100, 1)}));
    EXPECT_EQ(StoryVotes::row_votes(result.rows[1]).size(), 1UL);
}

TEST_F(SelectStoryVotesTest, HiddenStoryIsExcluded) {
    // Story 20 matches every filter except that user 100 hid it.
    const QueryResult hidden = run_query(query, ints({100, 0, 9, 1}), state);
    ASSERT_TRUE(hidden.status.ok());
    EXPECT_TRUE(hidden.rows.empty());

    const QueryResult visible = run_query(query, ints({101, 0, 9, 1}), state);
    ASSERT_TRUE(visible.status.ok());
    ASSERT_EQ(visible.rows.size(), 1UL);
    EXPECT_EQ(StoryVotes::row_story(visible.rows[0]).handle_id(), 12UL);
}

TEST_F(SelectStoryVotesTest, IsPure) {
    const State before = state;
    const QueryResult first = run_query(query, ints({101, 0, 0, -1}), state);
    const QueryResult second = run_query(query, ints({101, 0, 0, -1}), state);
    EXPECT_EQ(state, before);
    ASSERT_TRUE(first.status.ok());
    EXPECT_EQ(first.rows, second.rows);
    EXPECT_EQ(first.rows.size(), 4UL);
}

TEST_F(SelectStoryVotesTest, ParameterErrors) {
    const QueryResult arity = run_query(query, ints({1, 2, 3}), state);
    EXPECT_EQ(arity.status.code, ErrorCode::PARAMETER_ERROR);
    EXPECT_TRUE(arity.rows.empty());

    std::vector<Value> params = ints({1, 2, 3});
    params.push_back(Value::from_string("up"));
    const QueryResult type = run_query(query, params, state);
    EXPECT_EQ(type.status.code, ErrorCode::PARAMETER_ERROR);
}

TEST(QueryEngineTest, RowsKeepGeneratorOrderWithoutSortKey) {
    Query query;
    query.name = "evens";
    query.body = comprehension(var("x"), {gen("x", state("xs")),
                                          filter(ne(var("x"), int_lit(1)))});
    State state;
    state.set("xs", Bag(ints({4, 1, 2, 6})));
    const QueryResult result = run_query(query, {}, state);
    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(result.rows, ints({4, 2, 6}));
}

TEST(QueryEngineTest, DescendingSortIsStable) {
    Query query;
    query.name = "byHalf";
    query.body = comprehension(var("x"), {gen("x", state("xs"))});
    query.order_var = "r";
    query.order_key = bool_lit(true);
    query.descending = true;
    State state;
    state.set("xs", Bag(ints({3, 1, 2})));
    const QueryResult result = run_query(query, {}, state);
    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(result.rows, ints({3, 1, 2}));

    query.order_key = var("r");
    EXPECT_EQ(run_query(query, {}, state).rows, ints({3, 2, 1}));
}

TEST(QueryEngineTest, EvaluationErrorsAreReturned) {
    Query query;
    query.name = "bad";
    query.body = comprehension(var("x"), {gen("x", state("xs")),
                                          filter(var("x"))});
    State state;
    state.set("xs", Bag(ints({1})));
    const QueryResult result = run_query(query, {}, state);
    EXPECT_EQ(result.status.code, ErrorCode::EVALUATION_ERROR);
    EXPECT_TRUE(result.rows.empty());
}

}  // namespace
}  // namespace invar
