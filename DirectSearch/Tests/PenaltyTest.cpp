/*==============================================================================
Penalty test

This test program verifies the linear constraint system, both constructed 
from the one-sided and the two-sided form and built row by row, and the 
penalty objective wrapping another objective and penalising points violating
the constraints.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // Infinity tests
#include <limits>                             // Not-a-number
#include <memory>                             // Shared pointers
#include <stdexcept>                          // Standard exceptions

#include "LinearConstraints.hpp"
#include "Penalty.hpp"

#include "TestReport.hpp"
#include "TestFunctions.hpp"

using namespace DirectSearch;

// ----------------------------------------------------------------------------
// Linear constraints
//-----------------------------------------------------------------------------

void TwoSidedConstraints( Test::Report & Result )
{
  Matrix A = { { 1.0, 0.0 }, { 0.0, 1.0 } };
  Vector Low = { -1.0, -2.0 }, Up = { 1.0, 2.0 };

  LinearConstraints Box( A, Low, Up );

  Result.Check( Box.Rows() == 4 && Box.Columns() == 2 && !Box.Empty(),
                "The two-sided system has twice the rows" );
  Result.Check( Box.Row( 1 )( 1 ) == 1.0 && Box.Row( 3 )( 1 ) == -1.0,
                "The negated rows follow the given rows" );
  Result.Check( Box.Bound( 0 ) == 1.0 && Box.Bound( 2 ) == 1.0 && 
                Box.Bound( 3 ) == 2.0, "The lower bounds are negated" );
  Result.Check( Box.Range( 0 ) == 2.0 && Box.Range( 1 ) == 4.0 &&
                Box.Range( 2 ) == 2.0 && Box.Range( 3 ) == 4.0,
                "The ranges are recorded for both copies of a row" );

  Result.Check( Box.Feasible( { 0.5, -1.5 } ), "An interior point" );
  Result.Check( Box.Feasible( { 1.0, 2.0 } ), "A corner point" );
  Result.Check( Box.Feasible( { 1.0 + 1e-6, 0.0 } ), 
                "A point within the tolerance" );
  Result.Check( !Box.Feasible( { 1.5, 0.0 } ), "A point outside" );
  Result.Check( Box.Feasible( { 1.5, 0.0 }, 0.6 ), 
                "A point inside a larger tolerance" );

  Vector Violations = Box.Violation( { 2.0, 0.0 } );
  Result.Check( Violations.n_elem == 4 && Violations( 0 ) == 1.0 &&
                Violations( 2 ) == -3.0, "The row violations" );

  Result.Throws< std::out_of_range >( [&](){ Box.Row( 4 ); }, 
                                      "Row outside the system" );
  Result.Throws< std::out_of_range >( [&](){ Box.Range( 4 ); }, 
                                      "Range outside the system" );
  Result.Throws< std::invalid_argument >( [&](){ Box.Values( { 1.0 } ); },
                                          "Wrong number of variables" );

  Result.Throws< std::invalid_argument >( 
    [&](){ LinearConstraints Wrong( A, Up, Low ); },
    "Lower bounds above the upper bounds" );
  Result.Throws< std::invalid_argument >( 
    [&](){ LinearConstraints Wrong( A, Vector{ 1.0 }, Up ); },
    "Too few lower bounds" );
}

void OneSidedConstraints( Test::Report & Result )
{
  Matrix A = { { 1.0, 1.0 } };
  Vector b = { 1.0 };

  LinearConstraints HalfPlane( A, b );

  Result.Check( HalfPlane.Rows() == 1 && HalfPlane.Range( 0 ) == 1.0,
                "The one-sided system has unit ranges" );
  Result.Check( HalfPlane.Feasible( { 0.5, 0.5 } ) && 
                !HalfPlane.Feasible( { 1.0, 1.0 } ), 
                "Points on both sides of the plane" );

  Result.Throws< std::invalid_argument >( 
    [&](){ LinearConstraints Wrong( A, Vector{ 1.0, 2.0 } ); },
    "Too many bounds" );

  LinearConstraints Built;

  Result.Check( Built.Empty() && Built.Feasible( { 7.0 } ), 
                "An empty system accepts everything" );

  Built.Append( { 1.0, 0.0 }, 1.0 );
  Built.Append( { 0.0, 1.0 }, 2.0, 4.0 );

  Result.Check( Built.Rows() == 2 && Built.Columns() == 2 &&
                Built.Bound( 1 ) == 2.0 && Built.Range( 0 ) == 1.0 &&
                Built.Range( 1 ) == 4.0, "Rows can be appended" );
  Result.Check( !Built.Feasible( { 0.0, 3.0 } ), 
                "The appended rows constrain the variables" );

  Result.Throws< std::invalid_argument >( 
    [&](){ Built.Append( { 1.0 }, 0.0 ); }, "Appending a row too short" );
}

// ----------------------------------------------------------------------------
// Penalty objective
//-----------------------------------------------------------------------------

ObjectivePointer SphereObjective( void )
{
  return MakeFunction( []( const Variables & x ){ return Test::Sphere( x ); } );
}

void PenaltyValues( Test::Report & Result )
{
  Matrix A = { { 1.0, 0.0 }, { 0.0, 1.0 } };
  Vector Low = { -1.0, -1.0 }, Up = { 1.0, 1.0 };

  ObjectivePenalty Penalised( SphereObjective(), A, Low, Up, 2.0 );

  Result.Check( Penalised.GetWeight() == 2.0, "The weight is stored" );
  Result.Check( Penalised.Evaluate( { 0.5, 0.5 } ).Value == 0.5,
                "A feasible point is not penalised" );
  Result.Check( Penalised.Penalty( { 1.0, -1.0 } ) == 0.0,
                "A point on the boundary is not penalised" );

  // At (2,0) the row x <= 1 is violated by 1 with range 2, so the penalty 
  // is 2 * 1/2 = 1 and the value is 4 * ( 1 + 1 )

  Result.Near( Penalised.Penalty( { 2.0, 0.0 } ), 1.0, 1e-12, 
               "The penalty at (2,0)" );
  Result.Near( Penalised.Evaluate( { 2.0, 0.0 } ).Value, 8.0, 1e-12,
               "The penalised value at (2,0)" );

  // Violating both a lower and an upper bound

  Result.Near( Penalised.Penalty( { 3.0, -2.0 } ), 3.0, 1e-12,
               "The penalty sums the violated rows" );

  // A constant objective isolates the penalty factor. Moving x beyond the
  // upper bound increases the violation of one row only.

  auto Constant = MakeFunction( []( const Variables & ){ return 1.0; } );
  ObjectivePenalty ConstantPenalty( Constant, A, Low, Up, 2.0 );

  VariableType Previous = ConstantPenalty.Evaluate( { 1.0, 0.0 } ).Value;
  bool         NonDecreasing = true, AboveBase = true;

  Result.Check( Previous == 1.0, "The boundary point has the base value" );

  for ( VariableType x = 1.25; x < 10.0; x += 0.25 )
  {
    VariableType Value = ConstantPenalty.Evaluate( { x, 0.0 } ).Value;

    NonDecreasing = NonDecreasing && ( Value >= Previous );
    AboveBase     = AboveBase && ( Value > 1.0 );
    Previous      = Value;
  }

  Result.Check( NonDecreasing, 
                "A growing violation never decreases the penalised value" );
  Result.Check( AboveBase, "A violated row increases the value" );

  // The violation at x = 3 is 2 with range 2, giving 1 + 2 * 2/2 

  Result.Near( ConstantPenalty.Evaluate( { 3.0, 0.0 } ).Value, 3.0, 1e-12,
               "The penalty factor of a constant objective" );

  ObjectivePenalty Disabled( SphereObjective(), A, Low, Up, 0.0 );

  Result.Check( Disabled.Evaluate( { 2.0, 0.0 } ).Value == 4.0,
                "A zero weight returns the objective value unaltered" );
}

void PenaltyFailures( Test::Report & Result )
{
  Matrix A = { { 1.0, 0.0 } };
  Vector Low = { 0.0 }, Up = { 1.0 };

  auto Failing = std::make_shared< Test::CountingObjective >( 
    []( const Variables & x ){ return x.front() > 5.0; } );

  ObjectivePenalty Penalised( Failing, A, Low, Up, 1.0 );
  Evaluation       Value = Penalised.Evaluate( { 6.0, 0.0 } );

  Result.Check( Value.Failed() && std::isinf( Value.Value ) && 
                Value.Value > 0.0, "A failure is passed on" );

  auto Partial = MakeFunction( []( const Variables & ) -> VariableType {
    throw EvaluationError( "Partial evaluation", 3.0 );
  });

  ObjectivePenalty PartialPenalty( Partial, A, Low, Up, 1.0 );

  // The violation at x = 2 is 1 with range 1 so the value is 3 * ( 1 + 1 )

  Value = PartialPenalty.Evaluate( { 2.0, 0.0 } );
  Result.Check( Value.Failed() && Value.Value == 6.0,
                "A partial success is penalised" );

  Result.Throws< std::invalid_argument >( 
    [&](){ ObjectivePenalty Wrong( nullptr, A, Low, Up, 1.0 ); },
    "No objective to penalise" );
  Result.Throws< std::invalid_argument >( 
    [&](){ ObjectivePenalty Wrong( Failing, A, Low, Up, -1.0 ); },
    "A negative weight" );
  Result.Throws< std::invalid_argument >( 
    [&](){ ObjectivePenalty Wrong( Failing, A, Low, Up, 
                                   std::numeric_limits< double >::quiet_NaN() ); 
    }, "A weight that is not a number" );
  Result.Throws< std::invalid_argument >( 
    [&](){ ObjectivePenalty Wrong( Failing, A, Vector{ 0.0, 0.0 }, Up, 1.0 ); },
    "Bounds not matching the matrix" );

  Result.Throws< std::invalid_argument >( 
    [&](){ ObjectivePenalty Inverted( Failing, A, Up, Low, 1.0 ); },
    "Inverted bounds are detected at construction" );
  Result.Check( Failing->Count() == 1, 
                "Rejected penalties do not evaluate the objective" );
}

// ----------------------------------------------------------------------------
// Main
//-----------------------------------------------------------------------------

int main( void )
{
  Test::Report Result( "Penalty test" );

  TwoSidedConstraints( Result );
  OneSidedConstraints( Result );
  PenaltyValues( Result );
  PenaltyFailures( Result );

  return Result.ExitStatus();
}
