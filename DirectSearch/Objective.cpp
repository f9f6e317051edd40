/*==============================================================================
Objective function

Implementation of the function adapter and the evaluation helpers.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted error messages

#include "Objective.hpp"

namespace DirectSearch
{

void Evaluation::Rethrow( void ) const
{
  if ( Failure )
    std::rethrow_exception( Failure );
}

// The function must be valid, otherwise the objective would throw a bad 
// function call exception on the first evaluation.

Function::Function( const Mapping & GivenFunction )
: Objective(), TheFunction( GivenFunction )
{
  if ( !TheFunction )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The function objective requires a callable function";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

Evaluation Function::Evaluate( const Variables & VariableValues )
{
  try
  {
    return Evaluation::Success( TheFunction( VariableValues ) );
  }
  catch ( const EvaluationError & Error )
  {
    return Evaluation::Unsuccessful( std::current_exception(), Error.Value() );
  }
}

}      // End name space DirectSearch
