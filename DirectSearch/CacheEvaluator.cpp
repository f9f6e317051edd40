/*==============================================================================
Cache evaluator

Implementation of the evaluation cache and the cache evaluator

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions
#include <unordered_set>                      // Forwarded fingerprints
#include <vector>                             // Positions and keys

#include "CacheEvaluator.hpp"

#ifdef DirectSearch_DEBUG
  #include "ConsolePrint.hpp"
#endif

namespace DirectSearch
{
/*==============================================================================

 Evaluation cache

==============================================================================*/

std::optional< VariableType > 
EvaluationCache::Lookup( const Fingerprint & Key ) const
{
  auto Entry = Values.find( Key );

  if ( Entry == Values.end() )
    return std::nullopt;
  else
    return Entry->second;
}

/*==============================================================================

 Cache evaluator

==============================================================================*/

CacheEvaluator::CacheEvaluator( const EvaluatorPointer & Inner, 
                                const CachePointer & TheCache )
: Evaluator(), Forward( Inner ), 
  Cache( TheCache ? TheCache : std::make_shared< EvaluationCache >() )
{
  if ( !Forward )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The cache evaluator needs an evaluator for new points";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

Evaluator::Result 
CacheEvaluator::Evaluate( Objective & TheObjective, const Points & Batch )
{
  Result Outcome;

  Outcome.Evaluated = Batch;

  // The points are split into cache hits, which are assigned their value 
  // directly, and new points. The position in the batch of the first 
  // occurrence of each new point is recorded for the truncation.

  std::vector< Fingerprint >  Keys;
  std::vector< bool >         Hit;
  Points                      NewPoints;
  std::vector< Dimension >    FirstPosition;
  std::unordered_set< Fingerprint, FingerprintHash > Forwarded;

  Keys.reserve( Batch.size() );
  Hit.reserve( Batch.size() );

  for ( Dimension i = 0; i < Batch.size(); i++ )
  {
    Keys.push_back( Identity( Batch[ i ] ) );

    std::optional< VariableType > Cached = Cache->Lookup( Keys.back() );

    Hit.push_back( Cached.has_value() );

    if ( Cached )
      Outcome.Evaluated[ i ].Value = *Cached;
    else if ( Forwarded.insert( Keys.back() ).second )
    {
      NewPoints.push_back( Batch[ i ] );
      FirstPosition.push_back( i );
    }
  }

  #ifdef DirectSearch_DEBUG
    Theron::ConsolePrint DebugMessage;
    DebugMessage << "Cache evaluation of " << Batch.size() << " points with "
                 << NewPoints.size() << " new points and a cache of " 
                 << Cache->Size() << " values" << std::endl;
  #endif

  if ( NewPoints.empty() )
    return Outcome;

  Result NewResults( Forward->Evaluate( TheObjective, NewPoints ) );

  for ( const Point & Evaluated : NewResults.Evaluated )
    Cache->Store( Identity( Evaluated ), Evaluated.Value );

  for ( Dimension i = 0; i < Batch.size(); i++ )
    if ( !Hit[ i ] )
    {
      std::optional< VariableType > Computed = Cache->Lookup( Keys[ i ] );

      if ( Computed )
        Outcome.Evaluated[ i ].Value = *Computed;
    }

  Outcome.Evaluations = NewResults.Evaluations;
  Outcome.Failure     = NewResults.Failure;

  // The batch is shortened if not all new points were evaluated. If nothing 
  // was evaluated the batch is returned as given.

  if ( !NewResults.Evaluated.empty() && 
       ( NewResults.Evaluated.size() < NewPoints.size() ) )
    Outcome.Evaluated.resize( 
      FirstPosition[ NewResults.Evaluated.size() - 1 ] + 1 );

  return Outcome;
}

}      // End name space DirectSearch
