/*==============================================================================
Evaluator test

This test program verifies the serial and the parallel evaluators, the 
function adapter for plain functions, and the objective printer decorator. 
The counting objective evaluates the sphere function and fails for positions 
given by a predicate, which allows the failure policies of the evaluators to 
be tested.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <algorithm>                          // Sorting results
#include <cmath>                              // Infinity tests
#include <sstream>                            // Printer output
#include <stdexcept>                          // Standard exceptions
#include <string>                             // Output lines

#include "DirectSearch.hpp"

#include "TestReport.hpp"
#include "TestFunctions.hpp"

using namespace DirectSearch;

// ----------------------------------------------------------------------------
// Utilities
//-----------------------------------------------------------------------------
//
// A batch of one dimensional points at 0, 1, ..., N-1 

Points Batch( std::size_t N )
{
  Points TheBatch;

  for ( std::size_t i = 0; i < N; i++ )
    TheBatch.emplace_back( Variables{ static_cast< VariableType >( i ) } );

  return TheBatch;
}

// The number of individual failures in an aggregate failure, or one for a 
// single failure

std::size_t FailureCount( const Evaluator::Result & Outcome )
{
  if ( !Outcome.Failed() ) return 0;

  try
  {
    Outcome.Rethrow();
  }
  catch ( const EvaluationFailures & Aggregate )
  {
    return Aggregate.Individual().size();
  }
  catch ( const EvaluationError & )
  {
    return 1;
  }

  return 0;
}

// ----------------------------------------------------------------------------
// Function adapter
//-----------------------------------------------------------------------------

void FunctionAdapter( Test::Report & Result )
{
  Function Square( []( const Variables & x ){ return Test::Sphere( x ); } );

  Evaluation Value = Square.Evaluate( { 1.0, 2.0 } );
  Result.Check( !Value.Failed() && Value.Value == 5.0, 
                "The function adapter returns the function value" );

  Function Partial( []( const Variables & x ) -> VariableType {
    if ( x.front() < 0.0 )
      throw EvaluationError( "Negative argument", 42.0 );
    else
      throw EvaluationError( "Positive argument" );
  });

  Value = Partial.Evaluate( { -1.0 } );
  Result.Check( Value.Failed() && Value.Value == 42.0,
                "A failure may report a finite value" );

  Value = Partial.Evaluate( { 1.0 } );
  Result.Check( Value.Failed() && std::isinf( Value.Value ),
                "A failure reports infinity by default" );

  Result.Throws< EvaluationError >( [&](){ Value.Rethrow(); }, 
                                    "Re-throwing the failure" );

  Function Broken( []( const Variables & x ) -> VariableType {
    return x.at( 5 );
  });

  Result.Throws< std::out_of_range >( [&](){ Broken.Evaluate( { 1.0 } ); },
                                      "Programming errors are propagated" );

  Result.Throws< std::invalid_argument >( 
    [](){ Function Empty( nullptr ); }, "A function without target" );
}

// ----------------------------------------------------------------------------
// Serial evaluator
//-----------------------------------------------------------------------------

void SerialEvaluation( Test::Report & Result )
{
  Test::CountingObjective Objective;
  SerialEvaluator         Serial;

  Evaluator::Result Outcome = Serial.Evaluate( Objective, Batch( 5 ) );

  Result.Check( !Outcome.Failed(), "No failures for the sphere function" );
  Result.Check( Outcome.Evaluations == 5 && Outcome.Evaluated.size() == 5,
                "All points are evaluated" );

  bool Ordered = true;

  for ( std::size_t i = 0; i < Outcome.Evaluated.size(); i++ )
    Ordered = Ordered && ( Outcome.Evaluated[i][0] == VariableType( i ) ) 
                      && ( Outcome.Evaluated[i].Value == VariableType( i*i ) );

  Result.Check( Ordered, "The serial results are in the batch order" );

  Outcome = Serial.Evaluate( Objective, Points() );
  Result.Check( Outcome.Evaluated.empty() && Outcome.Evaluations == 0 &&
                !Outcome.Failed(), "An empty batch gives an empty result" );
}

void SerialTruncation( Test::Report & Result )
{
  Test::CountingObjective 
  Objective( []( const Variables & x ){ return x.front() == 3.0; } );

  SerialEvaluator   Serial;
  Evaluator::Result Outcome = Serial.Evaluate( Objective, Batch( 8 ) );

  Result.Check( Outcome.Evaluated.size() == 4, 
                "A failure at point 3 returns 4 points" );
  Result.Check( Outcome.Evaluations == 4 && Objective.Count() == 4,
                "Only 4 evaluations are done" );
  Result.Check( std::isinf( Outcome.Evaluated.back().Value ),
                "The failing point has infinite value" );
  Result.Check( FailureCount( Outcome ) == 1, 
                "The single failure is returned" );
  Result.Check( !Serial.ContinuesOnError(), 
                "The default is to stop at the first failure" );
}

void SerialContinuation( Test::Report & Result )
{
  Test::CountingObjective 
  Objective( []( const Variables & x ){ 
    return x.front() == 2.0 || x.front() == 5.0; 
  });

  SerialEvaluator   Serial( true );
  Evaluator::Result Outcome = Serial.Evaluate( Objective, Batch( 8 ) );

  Result.Check( Outcome.Evaluated.size() == 8 && Outcome.Evaluations == 8,
                "All points are evaluated when continuing on failures" );
  Result.Check( FailureCount( Outcome ) == 2, 
                "The two failures are aggregated" );
  Result.Check( std::isinf( Outcome.Evaluated[2].Value ) && 
                std::isinf( Outcome.Evaluated[5].Value ) &&
                Outcome.Evaluated[7].Value == 49.0,
                "Failing points have infinite values, others are evaluated" );

  Result.Throws< EvaluationFailures >( [&](){ Outcome.Rethrow(); },
                                       "Re-throwing the aggregate failure" );
}

// ----------------------------------------------------------------------------
// Parallel evaluator
//-----------------------------------------------------------------------------

void ParallelEvaluation( Test::Report & Result )
{
  Test::CountingObjective 
  Objective( []( const Variables & x ){ 
    return static_cast< long >( x.front() ) % 7 == 0; 
  });

  ParallelEvaluator Parallel( 4 );

  Result.Check( Parallel.Workers() == 4, "The pool has 4 workers" );

  const std::size_t N = 50;

  for ( unsigned int Round = 0; Round < 3; Round++ )
  {
    Evaluator::Result Outcome = Parallel.Evaluate( Objective, Batch( N ) );

    Result.Check( Outcome.Evaluated.size() == N && Outcome.Evaluations == N,
                  "All points are returned despite failures" );
    Result.Check( FailureCount( Outcome ) == 8, 
                  "The 8 multiples of 7 below 50 fail" );

    std::sort( Outcome.Evaluated.begin(), Outcome.Evaluated.end(), 
               []( const Point & A, const Point & B ){ return A[0] < B[0]; } );

    bool Complete = true;

    for ( std::size_t i = 0; i < N; i++ )
    {
      VariableType x = Outcome.Evaluated[i][0];
      Complete = Complete && ( x == VariableType( i ) ) &&
        ( i % 7 == 0 ? std::isinf( Outcome.Evaluated[i].Value ) 
                     : Outcome.Evaluated[i].Value == x * x );
    }

    Result.Check( Complete, "Every point is evaluated exactly once" );
  }

  Result.Check( Objective.Count() == 3 * N, 
                "The objective is called once per point" );

  Evaluator::Result Outcome = Parallel.Evaluate( Objective, Points() );
  Result.Check( Outcome.Evaluated.empty() && !Outcome.Failed(),
                "An empty batch gives an empty result" );

  Result.Throws< std::invalid_argument >( [](){ ParallelEvaluator None( 0 ); },
                                          "A pool without workers" );
  Result.Check( ParallelEvaluator::HardwareWorkers() >= 1, 
                "There is at least one hardware worker" );
}

void ParallelProgrammingError( Test::Report & Result )
{
  Function Broken( []( const Variables & x ) -> VariableType {
    if ( x.front() == 3.0 )
      throw std::logic_error( "Broken objective" );
    return x.front();
  });

  ParallelEvaluator Parallel( 2 );

  Result.Throws< std::logic_error >( 
    [&](){ Parallel.Evaluate( Broken, Batch( 6 ) ); },
    "A programming error in a task is passed to the caller" );

  Evaluator::Result Outcome = Parallel.Evaluate( Broken, Batch( 3 ) );
  Result.Check( Outcome.Evaluated.size() == 3, 
                "The pool is usable after a programming error" );
}

// ----------------------------------------------------------------------------
// Objective printer
//-----------------------------------------------------------------------------

void Printer( Test::Report & Result )
{
  std::ostringstream Output;

  auto Counting = std::make_shared< Test::CountingObjective >( 
    []( const Variables & x ){ return x.front() < 0.0; } );
  ObjectivePrinter Printing( Counting, Output );

  Evaluation Value = Printing.Evaluate( { 1.0, 2.0 } );
  Result.Check( Value.Value == 5.0 && !Value.Failed(), 
                "The printer does not change the value" );

  Value = Printing.Evaluate( { -1.0, 2.0 } );
  Result.Check( Value.Failed() && std::isinf( Value.Value ), 
                "The printer passes the failure on" );

  Result.Check( Printing.Count() == 2 && Counting->Count() == 2,
                "The printer counts the calls" );

  std::istringstream Lines( Output.str() );
  std::string        FirstLine, SecondLine;

  std::getline( Lines, FirstLine );
  std::getline( Lines, SecondLine );

  Result.Check( FirstLine == "1 1 2     5", "First line is " + FirstLine );
  Result.Check( SecondLine == "2 -1 2     inf", 
                "Second line is " + SecondLine );

  // Points differing beyond the default precision print differently

  std::ostringstream PreciseOutput;
  ObjectivePrinter   Precise( MakeFunction( 
    []( const Variables & x ){ return x.front(); } ), PreciseOutput );

  Precise.Evaluate( { 1.0000001 } );
  Precise.Evaluate( { 1.0000002 } );

  std::istringstream PreciseLines( PreciseOutput.str() );
  std::string        FirstPrecise, SecondPrecise;

  std::getline( PreciseLines, FirstPrecise );
  std::getline( PreciseLines, SecondPrecise );

  Result.Check( FirstPrecise.substr( 2 ) != SecondPrecise.substr( 2 ),
                "Close points give different lines: " + FirstPrecise + 
                " and " + SecondPrecise );
  Result.Check( FirstPrecise.find( "1.0000001" ) != std::string::npos,
                "The coordinate is printed in full: " + FirstPrecise );

  // The printer can be evaluated concurrently

  std::ostringstream ParallelOutput;
  ObjectivePrinter   Shared( Counting, ParallelOutput );
  ParallelEvaluator  Parallel( 4 );

  Parallel.Evaluate( Shared, Batch( 20 ) );

  std::istringstream ParallelLines( ParallelOutput.str() );
  std::string        Line;
  std::size_t        LineCount = 0;

  while ( std::getline( ParallelLines, Line ) )
    LineCount++;

  Result.Check( Shared.Count() == 20 && LineCount == 20,
                "One line per concurrent evaluation" );

  Result.Throws< std::invalid_argument >( 
    [](){ ObjectivePrinter Nothing( nullptr ); }, 
    "A printer without objective" );
}

// ----------------------------------------------------------------------------
// Main
//-----------------------------------------------------------------------------

int main( void )
{
  Test::Report Result( "Evaluator test" );

  FunctionAdapter( Result );
  SerialEvaluation( Result );
  SerialTruncation( Result );
  SerialContinuation( Result );
  ParallelEvaluation( Result );
  ParallelProgrammingError( Result );
  Printer( Result );

  return Result.ExitStatus();
}
