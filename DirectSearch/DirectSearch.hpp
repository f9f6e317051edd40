/*==============================================================================
Direct search

The direct search library provides the shared infrastructure of derivative 
free search strategies, like pattern search and particle swarms, over bounded
and linearly constrained domains. It contains two parts:

1. The evaluation engine: Points, the objective function interface with the 
   penalty and printing decorators, and the serial, parallel and caching 
   evaluators of batches of points.
2. The projection of infeasible points onto the polyhedron defined by linear 
   inequality constraints using an active set method built on the orthogonal
   projection onto affine subspaces.

The search strategies themselves and the mesh used to discretise the search 
space are not part of the library, but the interface of the mesh is defined.
This header includes all the headers of the library.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH
#define DIRECT_SEARCH

// -----------------------------------------------------------------------------
// Evaluation engine
// -----------------------------------------------------------------------------

#include "Variables.hpp"                      // Basic definitions
#include "Point.hpp"                          // Points and distances
#include "Fingerprint.hpp"                    // Point identities
#include "Objective.hpp"                      // Objective functions
#include "Penalty.hpp"                        // Constraint penalty decorator
#include "ObjectivePrinter.hpp"               // Printing decorator
#include "Evaluator.hpp"                      // Evaluator interface
#include "SerialEvaluator.hpp"                // Serial evaluation
#include "ParallelEvaluator.hpp"              // Evaluation by worker threads
#include "CacheEvaluator.hpp"                 // Cached evaluation

// -----------------------------------------------------------------------------
// Constraints and projection
// -----------------------------------------------------------------------------

#include "LinearConstraints.hpp"              // The system A x <= b
#include "Projection.hpp"                     // Projection onto A x <= b
#include "Mesh.hpp"                           // Mesh interface

#endif // DIRECT_SEARCH
