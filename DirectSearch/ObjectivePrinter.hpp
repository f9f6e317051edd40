/*==============================================================================
Objective printer

The objective printer is a decorator that observes the evaluations of another 
objective. It counts the calls and writes one line per evaluation with the 
call number, the variable values and the resulting objective value to the 
given output stream. The value and the failure of the wrapped objective are 
returned unaltered.

The printer can be used with the parallel evaluator. The counter is atomic 
and the lines are written under a lock so that the output of concurrent 
evaluations is not interleaved, but the lines may not come in the order of 
the call numbers.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_OBJECTIVE_PRINTER
#define DIRECT_SEARCH_OBJECTIVE_PRINTER

#include <atomic>                             // Thread safe counter
#include <cstddef>                            // Standard size type
#include <iostream>                           // Default output stream
#include <mutex>                              // Protecting the output

#include "Variables.hpp"                      // Basic definitions
#include "Objective.hpp"                      // Objective function

namespace DirectSearch
{

class ObjectivePrinter : public Objective
{
private:

  ObjectivePointer           TheObjective;
  std::ostream &             Output;
  std::mutex                 OutputLock;
  std::atomic< std::size_t > Counter;

public:

  virtual Evaluation Evaluate( const Variables & VariableValues ) override;

  inline std::size_t Count( void ) const
  { return Counter.load(); }

  ObjectivePrinter( const ObjectivePointer & Wrapped, 
                    std::ostream & OutputStream = std::cout );

  ObjectivePrinter( void ) = delete;
  ObjectivePrinter( const ObjectivePrinter & Other ) = delete;

  virtual ~ObjectivePrinter( void )
  {}
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_OBJECTIVE_PRINTER
