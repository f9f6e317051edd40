/*==============================================================================
Mesh

Implementation of the mesh snapping of points

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions

#include "Mesh.hpp"

namespace DirectSearch
{

Point Nearest( const Point & ThePoint, const Mesh & TheMesh )
{
  Variables Vertex( TheMesh.Nearest( ThePoint.Position() ) );

  if ( Vertex.size() != ThePoint.Size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The mesh mapped a point of dimension " << ThePoint.Size()
                 << " to a vertex of dimension " << Vertex.size();

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return Point( Vertex, ThePoint.Value );
}

}      // End name space DirectSearch
