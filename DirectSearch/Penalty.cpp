/*==============================================================================
Penalty

Implementation of the penalty objective

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions

#include "Penalty.hpp"

namespace DirectSearch
{

// The constructor validates the arguments, but the conversion to the 
// one-sided form is deferred to the first evaluation.

ObjectivePenalty::ObjectivePenalty( 
  const ObjectivePointer & Wrapped, const Matrix & A, 
  const Vector & Low, const Vector & Up, VariableType PenaltyWeight )
: Objective(), TheObjective( Wrapped ), 
  Coefficients( A ), LowerBound( Low ), UpperBound( Up ),
  Constraints(), Initialised(), Weight( PenaltyWeight )
{
  std::ostringstream ErrorMessage;

  if ( !TheObjective )
    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The penalty objective must wrap an objective";
  else if ( !( Weight >= 0.0 ) )
    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The penalty weight must be non-negative and "
                 << Weight << " is not allowed";
  else if ( ( A.n_rows != Low.n_elem ) || ( A.n_rows != Up.n_elem ) )
    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The constraint matrix has " << A.n_rows << " rows but "
                 << Low.n_elem << " lower and " << Up.n_elem 
                 << " upper bounds are given";
  else if ( arma::any( Low > Up ) )
    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "A lower bound is larger than the corresponding upper "
                 << "bound and the constraints cannot be satisfied";

  if ( !ErrorMessage.str().empty() )
    throw std::invalid_argument( ErrorMessage.str() );
}

void ObjectivePenalty::Initialise( void )
{
  std::call_once( Initialised, [this](){
    Constraints = LinearConstraints( Coefficients, LowerBound, UpperBound );
  });
}

VariableType ObjectivePenalty::Penalty( const Variables & VariableValues )
{
  Initialise();

  if ( Constraints.Empty() ) return 0.0;

  Vector       Violations( Constraints.Violation( VariableValues ) );
  VariableType Sum = 0.0;

  for ( Dimension i = 0; i < Violations.n_elem; i++ )
    if ( Violations( i ) > 0.0 )
      Sum += Violations( i ) / Constraints.Range( i ) * Weight;

  return Sum;
}

Evaluation ObjectivePenalty::Evaluate( const Variables & VariableValues )
{
  Initialise();

  Evaluation Result( TheObjective->Evaluate( VariableValues ) );

  if ( Weight == 0.0 ) 
    return Result;

  Result.Value *= 1.0 + Penalty( VariableValues );

  return Result;
}

}      // End name space DirectSearch
