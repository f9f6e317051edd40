/*==============================================================================
Projection

Implementation of the affine projection and the active set projection onto the
polyhedron.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <limits>                             // Machine precision
#include <sstream>                            // Formatted error messages

#include "Projection.hpp"

#ifdef DirectSearch_DEBUG
  #include "ConsolePrint.hpp"
#endif

namespace DirectSearch
{
/*==============================================================================

 Affine subspace projection

==============================================================================*/

Variables OrthogonalProjection( const Variables & Start, 
                                const Matrix & A, const Vector & b )
{
  if ( ( A.n_cols != Start.size() ) || ( A.n_rows != b.n_elem ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Projecting a point of dimension " << Start.size() 
                 << " onto a system of " << A.n_rows << " x " << A.n_cols
                 << " with " << b.n_elem << " right hand side values";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  // An empty system does not constrain the point

  if ( A.n_rows == 0 )
    return Start;

  Vector Solution;

  // A system with at least as many rows as columns determines the point 
  // fully, and it is solved directly without approximate solutions for rank
  // deficient systems.

  if ( A.n_rows >= A.n_cols )
  {
    if ( !arma::solve( Solution, A, b, arma::solve_opts::no_approx ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The " << A.n_rows << " x " << A.n_cols 
                   << " equality system is rank deficient";

      throw SingularSystem( ErrorMessage.str() );
    }

    return arma::conv_to< Variables >::from( Solution );
  }

  // The under-determined system is projected with the closed form. The Gram
  // matrix A A' is singular if the rows are linearly dependent, and this is 
  // tested with the reciprocal condition number before solving since the 
  // solver may otherwise return a meaningless solution for a numerically 
  // singular matrix.

  Vector X( Start );
  Matrix Gram = A * A.t();
  Vector Multipliers;

  if ( ( arma::rcond( Gram ) < std::numeric_limits< VariableType >::epsilon() )
       || !arma::solve( Multipliers, Gram, Vector( A * X - b ), 
                        arma::solve_opts::no_approx ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The " << A.n_rows << " rows of the equality system "
                 << "are not linearly independent";

    throw SingularSystem( ErrorMessage.str() );
  }

  Solution = X - A.t() * Multipliers;

  return arma::conv_to< Variables >::from( Solution );
}

/*==============================================================================

 Most violated constraint

==============================================================================*/
//
// The row norm is used to compare violations of rows of different scale. A 
// zero row with a negative bound can never be satisfied, and its distance is 
// taken as infinite.

std::optional< Dimension > 
MostViolated( const Variables & Candidate, 
              const LinearConstraints & Constraints, VariableType Tolerance )
{
  if ( Constraints.Empty() ) return std::nullopt;

  Vector Violations( Constraints.Violation( Candidate ) );

  std::optional< Dimension > WorstRow;
  VariableType               Farthest = 0.0;

  for ( Dimension i = 0; i < Violations.n_elem; i++ )
    if ( Violations( i ) > Tolerance )
    {
      VariableType RowNorm  = arma::norm( Constraints.A().row( i ), 2 ),
                   Distance = ( RowNorm > 0.0 ) 
                              ? Violations( i ) / RowNorm 
                              : std::numeric_limits< VariableType >::infinity();

      if ( !WorstRow || Distance > Farthest )
      {
        Farthest = Distance;
        WorstRow = i;
      }
    }

  return WorstRow;
}

/*==============================================================================

 Polyhedral projection

==============================================================================*/

Projection Nearest( const Variables & Start, 
                    const LinearConstraints & Constraints,
                    VariableType Tolerance, std::size_t IterationLimit )
{
  if ( Tolerance < 0.0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The violation tolerance must be non-negative, and "
                 << Tolerance << " is not allowed";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( Constraints.Empty() )
    return Projection{ Start, true };

  if ( IterationLimit == 0 )
    IterationLimit = 10 * ( Constraints.Rows() + Constraints.Columns() );

  // The working set of active constraints starts empty, and the reference 
  // point for the projections is the start point until the working set has 
  // to be reset.

  Variables    Reference( Start ), Candidate( Start );
  Matrix       ActiveA( 0, Constraints.Columns() );
  Vector       Activeb;
  unsigned int SingularCount = 0;

  for ( std::size_t Iteration = 0; Iteration < IterationLimit; Iteration++ )
  {
    std::optional< Dimension > 
    Violated = MostViolated( Candidate, Constraints, Tolerance );

    if ( !Violated )
    {
      #ifdef DirectSearch_DEBUG
        Theron::ConsolePrint DebugMessage;
        DebugMessage << "Projection feasible after " << Iteration 
                     << " iterations" << std::endl;
      #endif

      return Projection{ Candidate, true };
    }

    ActiveA.insert_rows( ActiveA.n_rows, Constraints.Row( *Violated ) );
    Activeb.resize( Activeb.n_elem + 1 );
    Activeb( Activeb.n_elem - 1 ) = Constraints.Bound( *Violated );

    try
    {
      Candidate     = OrthogonalProjection( Reference, ActiveA, Activeb );
      SingularCount = 0;
    }
    catch ( const SingularSystem & Error )
    {
      #ifdef DirectSearch_DEBUG
        Theron::ConsolePrint DebugMessage;
        DebugMessage << "Projection working set of " << ActiveA.n_rows 
                     << " rows is singular: " << Error.what() << std::endl;
      #endif

      if ( ++SingularCount == 2 )
        return Projection{ Candidate, false };

      Reference = Candidate;
      ActiveA.set_size( 0, Constraints.Columns() );
      Activeb.reset();
    }
  }

  #ifdef DirectSearch_DEBUG
    Theron::ConsolePrint DebugMessage;
    DebugMessage << "Projection stopped after " << IterationLimit 
                 << " iterations without reaching a feasible point" 
                 << std::endl;
  #endif

  return Projection{ Candidate, false };
}

Projection Nearest( const Variables & Start, const Matrix & A,
                    const Vector & LowerBound, const Vector & UpperBound,
                    VariableType Tolerance )
{
  return Nearest( Start, LinearConstraints( A, LowerBound, UpperBound ), 
                  Tolerance );
}

}      // End name space DirectSearch
