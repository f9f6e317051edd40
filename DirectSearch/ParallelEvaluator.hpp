/*==============================================================================
Parallel evaluator

The parallel evaluator submits one task per point of the batch to a pool of 
worker threads, and waits for all tasks to complete before returning. The 
number of concurrent evaluations is therefore bounded by the number of workers
in the pool, but all points of the batch will be evaluated. The result points
are collected in the order the evaluations complete, which is generally not 
the order of the points in the batch. A caller needing positional 
correspondence must evaluate serially or match the points by position.

A failing evaluation does not cancel the other evaluations and the failing 
point is returned with the value reported for the failure. The failures are 
aggregated in the result. 

The objective function must be safe to call concurrently from the worker 
threads. An exception thrown by the objective, which is not reported as an 
evaluation failure, is considered a programming error and it is re-thrown to
the caller once all the tasks of the batch have completed.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_PARALLEL_EVALUATOR
#define DIRECT_SEARCH_PARALLEL_EVALUATOR

#include <cstddef>                            // Standard size type
#include <thread>                             // Hardware concurrency

#include "Evaluator.hpp"                      // Evaluator interface
#include "ThreadPool.hpp"                     // Bounded worker pool

namespace DirectSearch
{

class ParallelEvaluator : public Evaluator
{
private:

  ThreadPool Pool;

public:

  virtual Result Evaluate( Objective & TheObjective, 
                           const Points & Batch ) override;

  inline std::size_t Workers( void ) const
  { return Pool.Size(); }

  // The default number of workers is the number of hardware threads, which
  // may not be known in which case there will be only one worker.

  static inline std::size_t HardwareWorkers( void )
  {
    unsigned int Threads = std::thread::hardware_concurrency();
    return Threads > 0 ? Threads : 1;
  }

  ParallelEvaluator( std::size_t NumberOfWorkers = HardwareWorkers() )
  : Evaluator(), Pool( NumberOfWorkers )
  {}

  ParallelEvaluator( const ParallelEvaluator & Other ) = delete;

  virtual ~ParallelEvaluator( void )
  {}
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_PARALLEL_EVALUATOR
