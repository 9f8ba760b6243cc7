#include <invar/testing/story_votes.hpp>

namespace invar {

using namespace dsl;

namespace {

ExprPtr val(ExprPtr handle, const std::string& field) {
    return dot(dot(handle, "val"), field);
}

}  // namespace

StoryVotes::StoryVotes(bool allow_orphan_votes) {
    const TypePtr int_type = Type::int_type();
    m_vote_val = Type::record("VoteVal", {{"id", int_type},
                                          {"story_id", int_type},
                                          {"user_id", int_type},
                                          {"value", int_type}});
    vote_type = Type::handle("Vote", m_vote_val);
    m_story_val = Type::record("StoryVal",
                               {{"id", int_type},
                                {"user_id", int_type},
                                {"merged_story_id", int_type},
                                {"score", int_type},
                                {"hidden_by", Type::bag(int_type)},
                                {"votes", Type::bag(vote_type)}});
    story_type = Type::handle("Story", m_story_val);

    m_schema.add_type(m_vote_val);
    m_schema.add_type(vote_type);
    m_schema.add_type(m_story_val);
    m_schema.add_type(story_type);
    m_schema.add_state("votes", Type::bag(vote_type));
    m_schema.add_state("stories", Type::bag(story_type));

    const ExprPtr votes = state("votes");
    const ExprPtr stories = state("stories");
    const ExprPtr v = var("v");
    const ExprPtr s = var("s");

    m_schema.add_invariant("uniqueVoteIds",
                           unique(val(var("x"), "id"), {gen("x", votes)}));
    m_schema.add_invariant("uniqueStoryIds",
                           unique(val(var("x"), "id"), {gen("x", stories)}));
    m_schema.add_invariant(
        "embeddedVotesExist",
        all(in(var("w"), votes),
            {gen("t", stories), gen("w", dot(dot(var("t"), "val"), "votes"))}));
    if (not allow_orphan_votes) {
        m_schema.add_invariant(
            "votesAreEmbedded",
            all(exists(var("t"), {gen("t", stories),
                                  filter(in(var("w"),
                                            dot(dot(var("t"), "val"),
                                                "votes")))}),
                {gen("w", votes)}));
    }

    {
        Operation op;
        op.name = "insertVote";
        op.params = {{"v", vote_type}};
        op.precondition = not_(exists(
            var("v0"),
            {gen("v0", votes), filter(eq(val(var("v0"), "id"), val(v, "id")))}));
        op.effects = {{Effect::INSERT, "votes", v}};
        m_schema.add_operation(op);
    }
    {
        Operation op;
        op.name = "insertStory";
        op.params = {{"s", story_type}};
        op.precondition = and_(
            not_(exists(var("s0"),
                        {gen("s0", stories),
                         filter(eq(val(var("s0"), "id"), val(s, "id")))})),
            all(in(var("w"), votes), {gen("w", val(s, "votes"))}));
        op.effects = {{Effect::INSERT, "stories", s}};
        m_schema.add_operation(op);
    }
    {
        Operation op;
        op.name = "removeVote";
        op.params = {{"v", vote_type}};
        op.precondition = and_(
            in(v, votes),
            all(not_(in(v, val(var("t"), "votes"))), {gen("t", stories)}));
        op.effects = {{Effect::REMOVE, "votes", v}};
        m_schema.add_operation(op);
    }

    {
        Query query;
        query.name = "selectStoryVotes";
        query.params = {{"p1", int_type},
                        {"p2", int_type},
                        {"p3", int_type},
                        {"p4", int_type}};
        const ExprPtr story_votes =
            comprehension(var("u"), {gen("u", val(s, "votes")),
                                     filter(eq(val(var("u"), "value"),
                                               var("p4")))});
        query.body = comprehension(
            record({{"story", s}, {"votes", story_votes}}),
            {gen("s", stories), filter(not_(in(var("p1"), val(s, "hidden_by")))),
             filter(eq(val(s, "merged_story_id"), var("p2"))),
             filter(ge(val(s, "score"), var("p3")))});
        query.order_var = "row";
        query.order_key = val(dot(var("row"), "story"), "id");
        m_schema.add_query(query);
    }
}

Value StoryVotes::vote(uint64_t handle, long id, long story_id, long user_id,
                       long value) const {
    return Value::handle(
        vote_type, handle,
        Value::record(m_vote_val,
                      {Value::from_int(id), Value::from_int(story_id),
                       Value::from_int(user_id), Value::from_int(value)}));
}

Value StoryVotes::story(uint64_t handle, long id, long user_id,
                        long merged_story_id, long score,
                        const std::vector<long>& hidden_by,
                        const std::vector<Value>& votes) const {
    std::vector<Value> hidden;
    for (long user : hidden_by) {
        hidden.push_back(Value::from_int(user));
    }
    return Value::handle(
        story_type, handle,
        Value::record(m_story_val,
                      {Value::from_int(id), Value::from_int(user_id),
                       Value::from_int(merged_story_id), Value::from_int(score),
                       Value::bag(Bag(std::move(hidden))),
                       Value::bag(Bag(votes))}));
}

}  // namespace invar
