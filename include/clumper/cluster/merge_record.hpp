#pragma once

#include <cstddef>

//!\brief One accepted merge: two parent groups that were replaced by a child group.
struct merge_record
{
    size_t parent_a_id;
    size_t parent_b_id;
    size_t child_id;
    double distance;

    bool operator==(merge_record const & other) const = default;
};
