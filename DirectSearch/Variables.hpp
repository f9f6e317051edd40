/*==============================================================================
Variables

The evaluation engine and the projection algorithms work on real valued 
variables with double precision, and a point in the search space is a vector 
of such variables. The variable type is defined here and it is important to 
use the defined variable type instead of a standard double as its definition 
could change in the future.

The dimension of a search space is fixed for a single optimisation run, and 
all points compared or evaluated together must share the same dimension. The 
dimension type is therefore the size type of the variable vector.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_VARIABLES
#define DIRECT_SEARCH_VARIABLES

#include <vector>
#include <limits>

namespace DirectSearch
{
using VariableType   = double;
using Variables      = std::vector< VariableType >;
using Dimension      = typename Variables::size_type;

// An objective value that is not known, or an evaluation that failed, is 
// represented by positive infinity so that minimisation will never prefer it.

constexpr VariableType Unevaluated 
                       = std::numeric_limits< VariableType >::infinity();

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_VARIABLES
