/*==============================================================================
Parallel evaluator

Implementation of the parallel evaluation

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <future>                             // Task completion
#include <mutex>                              // Result protection
#include <vector>                             // Pending tasks

#include "ParallelEvaluator.hpp"

#ifdef DirectSearch_DEBUG
  #include "ConsolePrint.hpp"
#endif

namespace DirectSearch
{

Evaluator::Result 
ParallelEvaluator::Evaluate( Objective & TheObjective, const Points & Batch )
{
  Result                          Outcome;
  EvaluationFailures::FailureList Failures;
  std::mutex                      ResultLock;
  std::vector< std::future< void > > Pending;

  Outcome.Evaluated.reserve( Batch.size() );
  Pending.reserve( Batch.size() );

  for ( const Point & Candidate : Batch )
    Pending.push_back( Pool.Submit( 
      [&TheObjective, &Outcome, &Failures, &ResultLock, Candidate](){
        Evaluation Value( TheObjective.Evaluate( Candidate.Position() ) );

        std::lock_guard< std::mutex > Lock( ResultLock );

        Outcome.Evaluated.emplace_back( Candidate.Position(), Value.Value );

        if ( Value.Failed() )
          Failures.push_back( Value.Failure );
      }) );

  // All tasks must have completed before any exception is re-thrown since
  // the tasks refer to the local result structures.

  for ( std::future< void > & Task : Pending )
    Task.wait();

  for ( std::future< void > & Task : Pending )
    Task.get();

  #ifdef DirectSearch_DEBUG
    Theron::ConsolePrint DebugMessage;
    DebugMessage << "Parallel evaluation of " << Batch.size() << " points on "
                 << Pool.Size() << " workers gave " << Failures.size() 
                 << " failures" << std::endl;
  #endif

  Outcome.Evaluations = Outcome.Evaluated.size();
  Outcome.Failure     = AggregateFailures( Failures, Batch.size() );

  return Outcome;
}

}      // End name space DirectSearch
