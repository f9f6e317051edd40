/*==============================================================================
Penalty

The penalty objective is a decorator that wraps another objective and 
increases the objective value for points violating a set of two-sided linear
constraints low <= A x <= up. The constraints are converted to the one-sided 
form A x <= b by the linear constraints class, which also keeps the range 
up[i] - low[i] of each row. The conversion is done the first time the 
objective is evaluated.

For every violated row, the violation is normalised by the range of the 
constraint so that constraints of different scale contribute comparably, and
the penalty is the weighted sum of the normalised violations. The penalised 
value is then

  value = base * ( 1 + weight * sum_i violation[i] / range[i] )

The penalty is multiplicative so that it scales with the magnitude of the 
objective. It should be noted that this assumes positive objective values for
the penalty to increase the value. A weight of zero disables the penalty and 
the value of the wrapped objective is returned unaltered. A failure reported 
by the wrapped objective is passed on with the penalised value.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_PENALTY
#define DIRECT_SEARCH_PENALTY

#include <mutex>                              // Thread safe initialisation

#include "Variables.hpp"                      // Basic definitions
#include "Objective.hpp"                      // Objective function
#include "LinearConstraints.hpp"              // Constraint system

namespace DirectSearch
{

class ObjectivePenalty : public Objective
{
private:

  ObjectivePointer TheObjective;

  // The two-sided system as given, and the one-sided system created from it
  // on first use. The once flag ensures that the conversion is done only once
  // also when the objective is evaluated concurrently.

  const Matrix Coefficients;
  const Vector LowerBound, UpperBound;

  LinearConstraints Constraints;
  std::once_flag    Initialised;

  VariableType Weight;

  void Initialise( void );

public:

  virtual Evaluation Evaluate( const Variables & VariableValues ) override;

  // The penalty of a point is the weighted sum of the normalised violations
  // i.e. the factor multiplied with the base value is one plus this penalty.

  VariableType Penalty( const Variables & VariableValues );

  inline VariableType GetWeight( void ) const
  { return Weight; }

  // The constructor takes the objective to wrap, the two-sided constraint 
  // system and the weight. The weight must be non-negative, and the matrix 
  // and the bound vectors must have the same number of rows. 

  ObjectivePenalty( const ObjectivePointer & Wrapped, const Matrix & A,
                    const Vector & Low, const Vector & Up,
                    VariableType PenaltyWeight );

  ObjectivePenalty( void ) = delete;
  ObjectivePenalty( const ObjectivePenalty & Other ) = delete;

  virtual ~ObjectivePenalty( void )
  {}
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_PENALTY
