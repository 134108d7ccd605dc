#pragma once
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 compare.hpp — Result set equivalence
-------------------------------------------------------------------------------
Two result sets are equivalent when they have the same number of rows and,
after the ordering step, every pair of rows is row_equal (helpers.hpp).

Ordering step:
  - ordered   -> rows are compared position by position.
  - unordered -> both sides are sorted by row_to_string first. The text form
                 gives one total order across mixed column types.
-------------------------------------------------------------------------------
*/

bool compare_rows(const Rows& expected, const Rows& actual, bool is_ordered);

/// Same as above with a failed run (has_rows == false) treated as no rows.
bool compare_results(const QueryResult& expected, const QueryResult& actual, bool is_ordered);
