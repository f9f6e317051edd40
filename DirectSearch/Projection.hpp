/*==============================================================================
Projection

A search strategy will often produce candidate points outside the feasible 
region defined by the linear constraints A x <= b, and this header defines the 
functions to project such a point back onto the feasible polyhedron.

The inner primitive is the orthogonal projection of a point x0 onto the affine
subspace A x = b, i.e. the intersection of the hyperplanes defined by the rows
of A [1]. If there are fewer rows than variables, m < n, the projection is 

  proj = [I - A' (A A')^-1 A] x0 + A' (A A')^-1 b
       = x0 - A' (A A')^-1 (A x0 - b)

which is computed in the latter form by solving the m x m system rather than 
forming the inverse. If there are at least as many rows as variables the 
system is solved directly, in the least squares sense if m > n. The rows of A 
must be linearly independent, and if they are not a Singular System exception 
is thrown. 

The projection onto the polyhedron uses an active set method: The most 
violated inequality, i.e. the one whose hyperplane has the largest orthogonal 
distance to the current candidate, is added to a working set of constraints
taken as equalities, and the start point is projected onto the affine subspace
of the working set. The procedure is repeated from the projected candidate 
until no inequality is violated by more than the tolerance. If the working set
becomes singular, it is cleared once and the procedure restarts from the last
candidate. A second consecutive singular working set means that the polyhedron
is degenerate or empty close to the candidate and the projection gives up. In 
this case the last valid candidate is returned together with a flag telling 
that it is not feasible, so that the calling search strategy can continue with
a degraded but usable point.

References:

[1] Carl D. Meyer: Matrix Analysis and Applied Linear Algebra, SIAM, 2000, 
    Section 5.13 on orthogonal projectors.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_PROJECTION
#define DIRECT_SEARCH_PROJECTION

#include <cstddef>                            // Standard size type
#include <optional>                           // Optional row index
#include <stdexcept>                          // Standard exceptions
#include <string>                             // Error messages

#include "Variables.hpp"                      // Basic definitions
#include "LinearConstraints.hpp"              // Constraint system A x <= b

namespace DirectSearch
{

// The default tolerance for considering an inequality as violated

constexpr VariableType ViolationTolerance = 1e-5;

// The exception thrown when the rows of an equality system are not linearly
// independent. 

class SingularSystem : public std::runtime_error
{
public:

  SingularSystem( const std::string & Message )
  : std::runtime_error( Message )
  {}
};

// Orthogonal projection onto the affine subspace A x = b

Variables OrthogonalProjection( const Variables & Start, 
                                const Matrix & A, const Vector & b );

// The most violated constraint is the row with the largest orthogonal distance
// (A[i] x - b[i]) / |A[i]| among the rows where A[i] x - b[i] > Tolerance. 
// Nothing is returned if no row is violated.

std::optional< Dimension > 
MostViolated( const Variables & Candidate, 
              const LinearConstraints & Constraints,
              VariableType Tolerance = ViolationTolerance );

// The result of a projection onto the polyhedron 

class Projection
{
public:

  Variables Position;
  bool      Feasible;
};

// The projection onto the polyhedron A x <= b. The iteration limit guards 
// against cycling on empty polyhedrons where the working set never becomes 
// singular. If it is zero, the limit is set to ten times the sum of rows and 
// columns of the system.

Projection Nearest( const Variables & Start, 
                    const LinearConstraints & Constraints,
                    VariableType Tolerance = ViolationTolerance,
                    std::size_t IterationLimit = 0 );

// The same projection for the two-sided system low <= A x <= up

Projection Nearest( const Variables & Start, const Matrix & A,
                    const Vector & LowerBound, const Vector & UpperBound,
                    VariableType Tolerance = ViolationTolerance );

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_PROJECTION
