/*==============================================================================
Point

A point is a position in the search space together with the objective value 
at that position. The position identifies the point and it is never changed 
once the point has been constructed: The coordinates are copied when the point 
is created and any request for the full position returns a copy. The value is 
on the other hand assigned after the point has been evaluated, and it is 
therefore a public member. A point that has not yet been evaluated has the 
value positive infinity so that a minimisation will never prefer it.

The Euclidean distance between two points is defined for points of the same 
dimension only, and it is considered a programming error to ask for the 
distance between points of different dimensions.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_POINT
#define DIRECT_SEARCH_POINT

#include <ostream>                            // For printing points
#include <vector>                             // For batches of points

#include "Variables.hpp"                      // Basic definitions

namespace DirectSearch
{

class Point
{
private:

  Variables Coordinates;

public:

  // The value is assigned by the evaluators

  VariableType Value;

  // Access to individual coordinates is checked and an out of range exception 
  // is thrown if the index is larger than the dimension of the point.

  VariableType At( Dimension i ) const;

  inline VariableType operator[] ( Dimension i ) const
  { return At( i ); }

  inline Dimension Size( void ) const
  { return Coordinates.size(); }

  // The position is returned as a copy so that the caller cannot modify the 
  // identity of the point.

  inline Variables Position( void ) const
  { return Coordinates; }

  // Constructors. The default constructor gives an empty point which is useful
  // for containers only.

  Point( const Variables & Position, VariableType TheValue = Unevaluated )
  : Coordinates( Position ), Value( TheValue )
  {}

  Point( void )
  : Coordinates(), Value( Unevaluated )
  {}

  Point( const Point & Other ) = default;
  Point( Point && Other ) = default;

  Point & operator= ( const Point & Other ) = default;
  Point & operator= ( Point && Other ) = default;
};

// Batches of points are passed to and from the evaluators as standard vectors

using Points = std::vector< Point >;

// The Euclidean (L2) distance between two points of the same dimension. An 
// invalid argument exception is thrown if the dimensions differ.

VariableType Distance( const Point & First, const Point & Second );

// Printing a point writes the coordinates in brackets followed by the value 

std::ostream & operator<< ( std::ostream & Output, const Point & ThePoint );

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_POINT
