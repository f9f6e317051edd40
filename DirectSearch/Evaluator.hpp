/*==============================================================================
Evaluator

An evaluator evaluates a batch of points against an objective function. The 
search strategies produce candidate points in batches, and the evaluators 
decide how the batch is evaluated: Serially in the order given, in parallel 
by a pool of worker threads, or by first looking up the points in a cache of 
previously evaluated points and only forwarding the new points to another 
evaluator.

All evaluators share the same contract. The result of an evaluation contains 
the points annotated with their objective values, the number of objective 
function evaluations actually performed, and an aggregate failure if any of 
the evaluations failed. Points that could not be evaluated are omitted from 
the result points, they are not returned with a sentinel value.

If several evaluations fail, the failures are combined into one aggregate 
failure holding all the individual failures, and whose message tells how many
evaluations failed and gives the message of the first failure.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_EVALUATOR
#define DIRECT_SEARCH_EVALUATOR

#include <cstddef>                            // Standard size type
#include <exception>                          // Exception pointers
#include <memory>                             // Shared pointers
#include <vector>                             // Failure lists

#include "Point.hpp"                          // Points
#include "Objective.hpp"                      // Objective function

namespace DirectSearch
{
/*==============================================================================

 Aggregate failure

==============================================================================*/

class EvaluationFailures : public EvaluationError
{
public:

  using FailureList = std::vector< std::exception_ptr >;

private:

  FailureList Failures;

public:

  inline const FailureList & Individual( void ) const
  { return Failures; }

  EvaluationFailures( const FailureList & TheFailures, 
                      std::size_t BatchSize );
};

// The aggregation returns an empty pointer if there are no failures, the 
// failure itself if there is only one, and an aggregate failure otherwise.

std::exception_ptr 
AggregateFailures( const EvaluationFailures::FailureList & Failures,
                   std::size_t BatchSize );

/*==============================================================================

 Evaluator interface

==============================================================================*/

class Evaluator
{
public:

  class Result
  {
  public:

    Points             Evaluated;
    std::size_t        Evaluations;
    std::exception_ptr Failure;

    inline bool Failed( void ) const
    { return static_cast< bool >( Failure ); }

    inline void Rethrow( void ) const
    {
      if ( Failure )
        std::rethrow_exception( Failure );
    }

    Result( void )
    : Evaluated(), Evaluations( 0 ), Failure()
    {}
  };

  virtual Result Evaluate( Objective & TheObjective, 
                           const Points & Batch ) = 0;

  Evaluator( void )
  {}

  virtual ~Evaluator( void )
  {}
};

using EvaluatorPointer = std::shared_ptr< Evaluator >;

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_EVALUATOR
