/*==============================================================================
Evaluator

Implementation of the failure aggregation shared by the evaluators

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted messages
#include <string>                             // Messages

#include "Evaluator.hpp"

namespace DirectSearch
{

// The message of the first failure is recovered by re-throwing it. Objectives
// may report failures that are not standard exceptions, and these are only 
// described as unknown in the message. The failure itself is kept in the list.

namespace 
{
  std::string FailureMessage( const std::exception_ptr & Failure )
  {
    try
    {
      std::rethrow_exception( Failure );
    }
    catch ( const std::exception & Error )
    {
      return Error.what();
    }
    catch (...)
    {
      return "unknown failure";
    }
  }

  std::string AggregateMessage( 
    const EvaluationFailures::FailureList & Failures, std::size_t BatchSize )
  {
    std::ostringstream Message;

    Message << Failures.size() << " of " << BatchSize 
            << " evaluations failed";

    if ( !Failures.empty() )
      Message << ", the first failure was: " 
              << FailureMessage( Failures.front() );

    return Message.str();
  }
}

EvaluationFailures::EvaluationFailures( const FailureList & TheFailures,
                                        std::size_t BatchSize )
: EvaluationError( AggregateMessage( TheFailures, BatchSize ) ),
  Failures( TheFailures )
{}

std::exception_ptr 
AggregateFailures( const EvaluationFailures::FailureList & Failures,
                   std::size_t BatchSize )
{
  switch ( Failures.size() )
  {
    case 0:
      return nullptr;
    case 1:
      return Failures.front();
    default:
      return std::make_exception_ptr( 
                  EvaluationFailures( Failures, BatchSize ) );
  }
}

}      // End name space DirectSearch
