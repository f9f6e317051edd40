/*==============================================================================
Objective function

The objective is the real function to optimise. It takes a vector of real 
values as argument and returns a real number for the objective function at 
that point. The optimisation is always a minimisation, and lower values are 
better.

An evaluation may fail, for instance if the objective is computed by an 
external simulator that does not converge. A failed evaluation must return 
positive infinity so that no minimisation logic will ever prefer it, together 
with the failure. It is also possible that an evaluation returns a finite value 
together with a failure, i.e. partial success, and callers should therefore 
use the value and not the presence of a failure to rank points. The evaluation
class holds both the value and the failure as a standard exception pointer 
that can be re-thrown when the caller wants to inspect it.

The objective is an abstract capability with only one method, and the 
concrete objectives, the decorators adding penalties or observing the values, 
and the plain function adapter are all freely composable since they share the 
same interface. A decorator holds the objective it wraps as a shared pointer 
and forwards the calls.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_OBJECTIVE
#define DIRECT_SEARCH_OBJECTIVE

#include <exception>                          // Exception pointers
#include <functional>                         // Function adapter
#include <memory>                             // Shared pointers
#include <stdexcept>                          // Standard exceptions
#include <string>                             // Error messages

#include "Variables.hpp"                      // Basic definitions

namespace DirectSearch
{
/*==============================================================================

 Evaluation error

==============================================================================*/
//
// An objective function should throw this exception to indicate that the 
// evaluation failed. The value to report for the failed evaluation is by 
// default positive infinity, but a finite value may be given for partial 
// success.

class EvaluationError : public std::runtime_error
{
private:

  VariableType ReportedValue;

public:

  inline VariableType Value( void ) const
  { return ReportedValue; }

  EvaluationError( const std::string & Message, 
                   VariableType TheValue = Unevaluated )
  : std::runtime_error( Message ), ReportedValue( TheValue )
  {}
};

/*==============================================================================

 Evaluation

==============================================================================*/

class Evaluation
{
public:

  VariableType       Value;
  std::exception_ptr Failure;

  inline bool Failed( void ) const
  { return static_cast< bool >( Failure ); }

  // The failure can be re-thrown to be caught by the caller. Nothing happens
  // if the evaluation succeeded.

  void Rethrow( void ) const;

  // Factory functions for the two outcomes of an evaluation

  static inline Evaluation Success( VariableType TheValue )
  { return Evaluation( TheValue, nullptr ); }

  static inline Evaluation Unsuccessful( std::exception_ptr TheFailure,
                                         VariableType TheValue = Unevaluated )
  { return Evaluation( TheValue, TheFailure ); }

  Evaluation( VariableType TheValue, std::exception_ptr TheFailure )
  : Value( TheValue ), Failure( TheFailure )
  {}

  Evaluation( void )
  : Value( Unevaluated ), Failure()
  {}
};

/*==============================================================================

 Objective function base class

==============================================================================*/

class Objective
{
public:

  // The evaluation must be safe to call concurrently if the objective is used
  // with the parallel evaluator.

  virtual Evaluation Evaluate( const Variables & VariableValues ) = 0;

  Objective( void )
  {}

  virtual ~Objective( void )
  {}
};

// Objectives are shared between the evaluators and the decorators

using ObjectivePointer = std::shared_ptr< Objective >;

/*==============================================================================

 Function

==============================================================================*/
//
// The simplest objective is a plain function, a lambda or a functor, mapping
// the variable values to the objective value. A plain function cannot fail by
// itself, but it may throw an evaluation error, which is then converted to a 
// failed evaluation. All other exceptions are considered programming errors 
// and they are passed on to the caller.

class Function : public Objective
{
public:

  using Mapping = std::function< VariableType( const Variables & ) >;

private:

  Mapping TheFunction;

public:

  virtual Evaluation Evaluate( const Variables & VariableValues ) override;

  Function( const Mapping & GivenFunction );
  Function( void ) = delete;

  virtual ~Function( void )
  {}
};

// Convenience function to create a shared function objective

inline ObjectivePointer MakeFunction( const Function::Mapping & GivenFunction )
{ return std::make_shared< Function >( GivenFunction ); }

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_OBJECTIVE
