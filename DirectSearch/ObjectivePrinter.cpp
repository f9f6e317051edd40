/*==============================================================================
Objective printer

Implementation of the objective printer

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <iomanip>                            // Output precision
#include <limits>                             // Significant digits
#include <sstream>                            // Formatted output and errors
#include <stdexcept>                          // Standard exceptions

#include "ObjectivePrinter.hpp"

namespace DirectSearch
{

ObjectivePrinter::ObjectivePrinter( const ObjectivePointer & Wrapped, 
                                    std::ostream & OutputStream )
: Objective(), TheObjective( Wrapped ), Output( OutputStream ), 
  OutputLock(), Counter( 0 )
{
  if ( !TheObjective )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The objective printer must wrap an objective";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

// The line is formatted before the lock is acquired to keep the critical 
// section short. Values are written with enough digits to distinguish any 
// two different doubles.

Evaluation ObjectivePrinter::Evaluate( const Variables & VariableValues )
{
  Evaluation  Result( TheObjective->Evaluate( VariableValues ) );
  std::size_t CallNumber = ++Counter;

  std::ostringstream Line;

  Line << std::setprecision( std::numeric_limits< VariableType >::max_digits10 )
       << CallNumber << " ";

  for ( VariableType Value : VariableValues )
    Line << Value << " ";

  Line << "    " << Result.Value << "\n";

  std::lock_guard< std::mutex > Lock( OutputLock );
  Output << Line.str() << std::flush;

  return Result;
}

}      // End name space DirectSearch
