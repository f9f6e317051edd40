/*==============================================================================
Point

Implementation of the checked point accessors and the distance function.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <cmath>                              // For the square root
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions

#include "Point.hpp"

namespace DirectSearch
{

VariableType Point::At( Dimension i ) const
{
  if ( i < Coordinates.size() )
    return Coordinates[ i ];
  else
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Coordinate " << i << " requested which is outside "
                 << "of the legal range [0," << Coordinates.size() << ")";

    throw std::out_of_range( ErrorMessage.str() );
  }
}

VariableType Distance( const Point & First, const Point & Second )
{
  if ( First.Size() != Second.Size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The distance between a point of dimension " 
                 << First.Size() << " and a point of dimension "
                 << Second.Size() << " is not defined";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  VariableType SquaredSum = 0.0;

  for ( Dimension i = 0; i < First.Size(); i++ )
  {
    VariableType Difference = First[ i ] - Second[ i ];
    SquaredSum += Difference * Difference;
  }

  return std::sqrt( SquaredSum );
}

std::ostream & operator<< ( std::ostream & Output, const Point & ThePoint )
{
  Output << "[";

  for ( Dimension i = 0; i < ThePoint.Size(); i++ )
  {
    if ( i > 0 ) Output << ", ";
    Output << ThePoint[ i ];
  }

  Output << "] = " << ThePoint.Value;

  return Output;
}

}      // End name space DirectSearch
