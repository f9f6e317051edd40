/*==============================================================================
Linear constraints

The search space is confined by a system of linear inequality constraints 
A x <= b where A is an m x n matrix and b is a vector of m bounds. Each row of 
the system is a half space, and a variable assignment x is feasible if it 
satisfies all rows. 

Many problems state the constraints as two-sided ranges, low <= A x <= up. 
These are converted to the one-sided form by stacking the matrix and its 
negation, [A; -A] x <= [up; -low], doubling the number of rows. The range of 
each original row, up[i] - low[i], is lost by this conversion, but it is 
needed to normalise the violation of each row when computing penalties, and it
is therefore stored for both stacked copies of the row. Rows of a one-sided
system have unit range. 

The matrices and vectors are Armadillo [1] objects. Armadillo stores matrices 
in column order, but the rows are the natural unit for the constraints and 
the row-wise access functions are therefore provided.

References:

[1] Conrad Sanderson and Ryan Curtin: Armadillo: a template-based C++ library
		for linear algebra. Journal of Open Source Software, Vol. 1, pp. 26, 2016. 
		http://arma.sourceforge.net/

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_LINEAR_CONSTRAINTS
#define DIRECT_SEARCH_LINEAR_CONSTRAINTS

#include <armadillo>                          // Matrix library

#include "Variables.hpp"                      // Basic definitions

namespace DirectSearch
{

using Matrix    = arma::Mat< VariableType >;
using Vector    = arma::Col< VariableType >;
using RowVector = arma::Row< VariableType >;

class LinearConstraints
{
private:

  Matrix Coefficients;
  Vector Bounds, Ranges;

  // Utility function to throw if the given variable vector does not have the 
  // same dimension as the number of columns of the system

  void CheckDimension( const Variables & VariableValues ) const;

public:

  // Size of the system

  inline Dimension Rows( void ) const
  { return Coefficients.n_rows; }

  inline Dimension Columns( void ) const
  { return Coefficients.n_cols; }

  inline bool Empty( void ) const
  { return Coefficients.n_rows == 0; }

  // Direct access to the system, primarily for the projection algorithms

  inline const Matrix & A( void ) const
  { return Coefficients; }

  inline const Vector & b( void ) const
  { return Bounds; }

  // Access to individual rows. An out of range exception is thrown if the 
  // row index is not less than the number of rows.

  RowVector    Row  ( Dimension i ) const;
  VariableType Bound( Dimension i ) const;
  VariableType Range( Dimension i ) const;

  // Rows can be appended to the system. The first row defines the number of
  // columns if the system is empty, and later rows must have the same length.

  void Append( const Variables & Row, VariableType Bound, 
               VariableType Range = 1.0 );

  // Evaluating the system for a given variable vector gives A x, and the
  // violation is A x - b. A positive violation of a row means that the 
  // row is not satisfied.

  Vector Values   ( const Variables & VariableValues ) const;
  Vector Violation( const Variables & VariableValues ) const;

  // A variable vector is feasible if no row is violated by more than the 
  // given tolerance

  bool Feasible( const Variables & VariableValues, 
                 VariableType Tolerance = 1e-5 ) const;

  // Constructors for the one-sided form A x <= b and the two-sided form 
  // low <= A x <= up. The dimensions of the matrix and the vectors must agree
  // and for the two-sided form the lower bound cannot be larger than the 
  // upper bound.

  LinearConstraints( const Matrix & TheMatrix, const Vector & UpperBound );
  LinearConstraints( const Matrix & TheMatrix, const Vector & LowerBound,
                     const Vector & UpperBound );

  // The default constructor gives a system without rows. It can be extended 
  // by appending rows.

  LinearConstraints( void )
  : Coefficients(), Bounds(), Ranges()
  {}

  LinearConstraints( const LinearConstraints & Other ) = default;
  LinearConstraints( LinearConstraints && Other ) = default;

  LinearConstraints & operator= ( const LinearConstraints & Other ) = default;
  LinearConstraints & operator= ( LinearConstraints && Other ) = default;
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_LINEAR_CONSTRAINTS
