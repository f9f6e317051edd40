/*==============================================================================
Mesh

Pattern search strategies discretise the search space onto a grid whose step
size is adapted as the search progresses, and a candidate point is snapped to
the nearest vertex of the grid before it is evaluated. The mesh itself belongs
to the search strategy, and only the interface used by this library is defined
here: A mesh maps a position to the nearest mesh vertex. 

A point is typically first projected onto the feasible polyhedron and then 
snapped to the mesh, giving a new point with the same value as the original 
point until it is evaluated.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_MESH
#define DIRECT_SEARCH_MESH

#include "Variables.hpp"                      // Basic definitions
#include "Point.hpp"                          // Points

namespace DirectSearch
{

class Mesh
{
public:

  // The nearest vertex must have the same dimension as the given position

  virtual Variables Nearest( const Variables & Position ) const = 0;

  Mesh( void )
  {}

  virtual ~Mesh( void )
  {}
};

// Snapping a point to the mesh creates a new point at the nearest vertex 
// carrying the value of the given point. An invalid argument exception is 
// thrown if the mesh changes the dimension of the position.

Point Nearest( const Point & ThePoint, const Mesh & TheMesh );

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_MESH
