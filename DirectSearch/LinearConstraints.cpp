/*==============================================================================
Linear constraints

Implementation of the constraint system construction and evaluation. 

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions

#include "LinearConstraints.hpp"

namespace DirectSearch
{
/*==============================================================================

 Construction

==============================================================================*/

LinearConstraints::LinearConstraints( const Matrix & TheMatrix, 
                                      const Vector & UpperBound )
: Coefficients( TheMatrix ), Bounds( UpperBound ), 
  Ranges( TheMatrix.n_rows, arma::fill::ones )
{
  if ( TheMatrix.n_rows != UpperBound.n_elem )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The constraint matrix has " << TheMatrix.n_rows 
                 << " rows but " << UpperBound.n_elem << " bounds are given";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

// The two-sided system is stacked as [A; -A] x <= [up; -low] and the range 
// of each original row is recorded for both copies.

LinearConstraints::LinearConstraints( const Matrix & TheMatrix, 
                                      const Vector & LowerBound,
                                      const Vector & UpperBound )
: Coefficients(), Bounds(), Ranges()
{
  if ( ( TheMatrix.n_rows != LowerBound.n_elem ) || 
       ( TheMatrix.n_rows != UpperBound.n_elem ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The constraint matrix has " << TheMatrix.n_rows 
                 << " rows but there are " << LowerBound.n_elem 
                 << " lower bounds and " << UpperBound.n_elem 
                 << " upper bounds";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  if ( arma::any( LowerBound > UpperBound ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "A lower bound is larger than the corresponding upper "
                 << "bound and the constraint system has no solution";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  Matrix Negated = -TheMatrix;
  Vector RowRange = UpperBound - LowerBound;

  Coefficients = arma::join_cols( TheMatrix, Negated );
  Bounds       = arma::join_cols( UpperBound, Vector( -LowerBound ) );
  Ranges       = arma::join_cols( RowRange, RowRange );
}

/*==============================================================================

 Row access

==============================================================================*/
//
// The three access functions share the range check. 

namespace 
{
  void CheckRow( Dimension i, Dimension Rows, const char * File, int Line )
  {
    if ( i >= Rows )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << File << " at line " << Line << ": "
                   << "Constraint row " << i << " requested which is outside "
                   << "of the legal range [0," << Rows << ")";

      throw std::out_of_range( ErrorMessage.str() );
    }
  }
}

RowVector LinearConstraints::Row( Dimension i ) const
{
  CheckRow( i, Rows(), __FILE__, __LINE__ );
  return Coefficients.row( i );
}

VariableType LinearConstraints::Bound( Dimension i ) const
{
  CheckRow( i, Rows(), __FILE__, __LINE__ );
  return Bounds( i );
}

VariableType LinearConstraints::Range( Dimension i ) const
{
  CheckRow( i, Rows(), __FILE__, __LINE__ );
  return Ranges( i );
}

/*==============================================================================

 Appending rows

==============================================================================*/

void LinearConstraints::Append( const Variables & Row, VariableType Bound, 
                                VariableType Range )
{
  if ( Empty() )
    Coefficients.set_size( 0, Row.size() );
  else if ( Row.size() != Columns() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "A row with " << Row.size() << " elements cannot be "
                 << "appended to a system with " << Columns() << " columns";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  Coefficients.insert_rows( Coefficients.n_rows, RowVector( Row ) );
  Bounds.resize( Bounds.n_elem + 1 );
  Bounds( Bounds.n_elem - 1 ) = Bound;
  Ranges.resize( Ranges.n_elem + 1 );
  Ranges( Ranges.n_elem - 1 ) = Range;
}

/*==============================================================================

 Evaluation

==============================================================================*/

void LinearConstraints::CheckDimension( const Variables & VariableValues ) const
{
  if ( VariableValues.size() != Columns() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The constraint system has " << Columns() 
                 << " columns and cannot be evaluated for "
                 << VariableValues.size() << " variables";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

Vector LinearConstraints::Values( const Variables & VariableValues ) const
{
  CheckDimension( VariableValues );
  return Coefficients * Vector( VariableValues );
}

Vector LinearConstraints::Violation( const Variables & VariableValues ) const
{
  return Values( VariableValues ) - Bounds;
}

bool LinearConstraints::Feasible( const Variables & VariableValues, 
                                  VariableType Tolerance ) const
{
  if ( Empty() ) return true;

  return arma::all( Violation( VariableValues ) <= Tolerance );
}

}      // End name space DirectSearch
