
//    --------------------------------------------------------------------
//
//    This file is part of latrace.
//
//    LATRACE is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    latrace is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with latrace. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/exception.h"

#include <cmath>

bool eigen_ops::scale( Eigen::Ref<Eigen::MatrixXd> M , const bool center , const bool normalize ,
		       const bool ignore_invariants , std::vector<int> * zeros )
{
  if ( ! ( center || normalize ) ) return true;

  const int N = M.rows();
  if ( N < 2 ) return false;

  const Eigen::RowVectorXd means = M.colwise().mean();

  Eigen::RowVectorXd sds = Eigen::RowVectorXd::Ones( M.cols() );

  if ( normalize )
    {
      sds = ( M.rowwise() - means ).colwise().norm() / sqrt( (double)( N - 1 ) );

      // constant columns are left unscaled, if allowed
      for (int j=0; j<sds.size(); j++)
	if ( sds[j] == 0 )
	  {
	    if ( ! ignore_invariants ) return false;
	    if ( zeros ) zeros->push_back( j );
	    sds[j] = 1.0;
	  }
    }

  if ( center ) M.rowwise() -= means;
  if ( normalize ) M.array().rowwise() /= sds.array();

  return true;
}


double eigen_ops::sdev( const Eigen::VectorXd & x )
{
  const int n = x.size();
  if ( n < 2 ) return 0;
  const double m = x.mean();
  return sqrt( ( x.array() - m ).square().sum() / (double)( n - 1 ) );
}


Eigen::MatrixXd eigen_ops::sq_distances( const Eigen::MatrixXd & X )
{
  const int n = X.rows();
  Eigen::MatrixXd D( n , n );
  for (int i=0; i<n; i++)
    {
      D(i,i) = 0;
      for (int j=i+1; j<n; j++)
	D(i,j) = D(j,i) = ( X.row(i) - X.row(j) ).squaredNorm();
    }
  return D;
}


std::vector<double> eigen_ops::copy_vector( const Eigen::VectorXd & e )
{
  std::vector<double> v( e.size() );
  for (int i=0;i<e.size();i++) v[i] = e[i];
  return v;
}


Eigen::VectorXd eigen_ops::copy_vector( const std::vector<double> & e )
{
  Eigen::VectorXd v( e.size() );
  for (int i=0;i<e.size();i++) v[i] = e[i];
  return v;
}


Eigen::MatrixXd eigen_ops::make_matrix( const std::vector<std::vector<double> > & cols , const std::vector<bool> & mask )
{

  const int n = mask.size();

  int nr = 0;
  for (int i=0; i<n; i++) if ( mask[i] ) ++nr;

  Eigen::MatrixXd X( nr , cols.size() );

  for (int c=0; c<cols.size(); c++)
    {
      if ( cols[c].size() != n )
	throw data_shape_error_t( "column " + Helper::int2str( c ) + " does not match the mask length" );
      int r = 0;
      for (int i=0; i<n; i++)
	if ( mask[i] ) X(r++,c) = cols[c][i];
    }

  return X;
}
