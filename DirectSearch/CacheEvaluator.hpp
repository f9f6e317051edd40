/*==============================================================================
Cache evaluator

Search strategies will frequently revisit points, in particular when the 
points are snapped to a mesh, and evaluating the objective function is 
normally the expensive part of the search. The cache evaluator therefore 
remembers the value of every point evaluated, and only forwards points not 
seen before to another evaluator.

The cache maps the fingerprint of the point position to the objective value. 
It grows for the duration of the optimisation run and nothing is ever evicted.
The cache is a separate object held by shared pointer, so the caller decides 
its lifetime: Typically a new cache is created for each optimisation run, but
a cache can deliberately be shared between evaluators. The cache has no 
internal locking, and concurrent evaluations using the same cache must be 
serialised by the caller.

For each point of the batch the fingerprint is looked up in the cache, and for
a hit the cached value is assigned to the point without evaluating the 
objective. The remaining points are forwarded to the other evaluator in one 
batch, where points occurring more than once in the batch are forwarded only 
once. The values returned are stored in the cache, and assigned back to the 
points of the batch by fingerprint, so the order of the results from the 
other evaluator does not matter. The number of evaluations reported is the 
number of evaluations done by the other evaluator, and cache hits are free.

If the other evaluator returns fewer points than it was given, an evaluation 
has failed and the evaluation stopped. The returned batch is then truncated 
after the position of the last point evaluated, so that no point that was 
not evaluated is returned. If no point at all was evaluated, the batch is 
returned as given with the cached values assigned, together with the failure.

Fingerprint collisions are assumed impossible and are not detected.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_CACHE_EVALUATOR
#define DIRECT_SEARCH_CACHE_EVALUATOR

#include <cstddef>                            // Standard size type
#include <memory>                             // Shared pointers
#include <optional>                           // Optional look-up results
#include <unordered_map>                      // The cache

#include "Variables.hpp"                      // Basic definitions
#include "Fingerprint.hpp"                    // Point identities
#include "Evaluator.hpp"                      // Evaluator interface

namespace DirectSearch
{
/*==============================================================================

 Evaluation cache

==============================================================================*/

class EvaluationCache
{
private:

  std::unordered_map< Fingerprint, VariableType, FingerprintHash > Values;

public:

  std::optional< VariableType > Lookup( const Fingerprint & Key ) const;

  inline void Store( const Fingerprint & Key, VariableType Value )
  { Values[ Key ] = Value; }

  inline bool Contains( const Fingerprint & Key ) const
  { return Values.find( Key ) != Values.end(); }

  inline std::size_t Size( void ) const
  { return Values.size(); }

  inline void Clear( void )
  { Values.clear(); }

  EvaluationCache( void )
  : Values()
  {}
};

using CachePointer = std::shared_ptr< EvaluationCache >;

/*==============================================================================

 Cache evaluator

==============================================================================*/

class CacheEvaluator : public Evaluator
{
private:

  EvaluatorPointer Forward;
  CachePointer     Cache;

public:

  virtual Result Evaluate( Objective & TheObjective, 
                           const Points & Batch ) override;

  inline CachePointer GetCache( void ) const
  { return Cache; }

  // The constructor takes the evaluator to forward new points to and an 
  // optional cache. A new cache is created if no cache is given.

  CacheEvaluator( const EvaluatorPointer & Inner, 
                  const CachePointer & TheCache = nullptr );

  CacheEvaluator( void ) = delete;

  virtual ~CacheEvaluator( void )
  {}
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_CACHE_EVALUATOR
