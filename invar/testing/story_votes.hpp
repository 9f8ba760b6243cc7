// A news site with stories and votes, where each story embeds the votes cast
// on it and every vote also lives in a global bag.

#pragma once

#include <invar/model/schema.hpp>
#include <vector>

namespace invar {

class StoryVotes {
   public:
    // Unless orphan votes are allowed, every vote must be embedded in some
    // story, and inserting a bare vote cannot preserve that.
    explicit StoryVotes(bool allow_orphan_votes = true);

    const Schema& schema() const { return m_schema; }

    Value vote(uint64_t handle, long id, long story_id, long user_id,
               long value) const;
    Value story(uint64_t handle, long id, long user_id, long merged_story_id,
                long score, const std::vector<long>& hidden_by,
                const std::vector<Value>& votes) const;

    // Unwraps a Story handle from a selectStoryVotes row.
    static const Value& row_story(const Value& row) {
        return row.field("story");
    }
    static Bag row_votes(const Value& row) {
        return row.field("votes").as_bag();
    }

    TypePtr vote_type;
    TypePtr story_type;

   private:
    TypePtr m_vote_val;
    TypePtr m_story_val;
    Schema m_schema;
};

}  // namespace invar
