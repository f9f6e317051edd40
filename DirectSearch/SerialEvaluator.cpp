/*==============================================================================
Serial evaluator

Implementation of the serial evaluation

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include "SerialEvaluator.hpp"

namespace DirectSearch
{

Evaluator::Result 
SerialEvaluator::Evaluate( Objective & TheObjective, const Points & Batch )
{
  Result                          Outcome;
  EvaluationFailures::FailureList Failures;

  Outcome.Evaluated.reserve( Batch.size() );

  for ( const Point & Candidate : Batch )
  {
    Evaluation Value( TheObjective.Evaluate( Candidate.Position() ) );

    Outcome.Evaluated.emplace_back( Candidate.Position(), Value.Value );
    Outcome.Evaluations++;

    if ( Value.Failed() )
    {
      Failures.push_back( Value.Failure );

      if ( !ContinueOnError ) break;
    }
  }

  Outcome.Failure = AggregateFailures( Failures, Batch.size() );

  return Outcome;
}

}      // End name space DirectSearch
