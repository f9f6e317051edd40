/*==============================================================================
Serial evaluator

The serial evaluator evaluates the points of the batch one by one in the order
given, and the result points are in the same order. By default the evaluation
stops at the first failing evaluation and the result contains the points 
evaluated up to and including the failing point, which will have the value 
reported for the failure (normally positive infinity). If the evaluator is 
asked to continue on failures, all points will be evaluated and the failures 
will be aggregated in the returned result.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_SERIAL_EVALUATOR
#define DIRECT_SEARCH_SERIAL_EVALUATOR

#include "Evaluator.hpp"                      // Evaluator interface

namespace DirectSearch
{

class SerialEvaluator : public Evaluator
{
private:

  const bool ContinueOnError;

public:

  virtual Result Evaluate( Objective & TheObjective, 
                           const Points & Batch ) override;

  inline bool ContinuesOnError( void ) const
  { return ContinueOnError; }

  SerialEvaluator( bool ContinueOnFailure = false )
  : Evaluator(), ContinueOnError( ContinueOnFailure )
  {}

  virtual ~SerialEvaluator( void )
  {}
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_SERIAL_EVALUATOR
