
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

#include "stats/fit.h"
#include "helper/helper.h"

#include <Eigen/Dense>
#include <unsupported/Eigen/NonLinearOptimization>

#include <cmath>

//
// functors for Eigen's LevenbergMarquardt: residuals f(x) - y and
// the analytic jacobian
//

struct lm_functor_t
{

  typedef double Scalar;

  enum {
    InputsAtCompileTime = Eigen::Dynamic,
    ValuesAtCompileTime = Eigen::Dynamic
  };

  typedef Eigen::VectorXd InputType;
  typedef Eigen::VectorXd ValueType;
  typedef Eigen::MatrixXd JacobianType;

  lm_functor_t( const std::vector<double> & x , const std::vector<double> & y , int np )
    : x(x) , y(y) , np(np) { }

  int inputs() const { return np; }

  int values() const { return x.size(); }

  const std::vector<double> & x;
  const std::vector<double> & y;
  const int np;

};


struct gaussian_functor_t : public lm_functor_t
{

  gaussian_functor_t( const std::vector<double> & x , const std::vector<double> & y )
    : lm_functor_t( x , y , 3 ) { }

  int operator()( const Eigen::VectorXd & p , Eigen::VectorXd & fvec ) const
  {
    for (int i=0; i<values(); i++)
      fvec[i] = lmfit::gaussian( x[i] , p[0] , p[1] , p[2] ) - y[i];
    return 0;
  }

  int df( const Eigen::VectorXd & p , Eigen::MatrixXd & fjac ) const
  {
    const double A = p[0] , mu = p[1] , s = p[2];
    const double s2 = s * s;
    for (int i=0; i<values(); i++)
      {
	const double d = x[i] - mu;
	const double e = exp( -0.5 * d * d / s2 );
	fjac(i,0) = e;
	fjac(i,1) = A * e * d / s2;
	fjac(i,2) = A * e * d * d / ( s2 * s );
      }
    return 0;
  }

};


struct exponential_functor_t : public lm_functor_t
{

  exponential_functor_t( const std::vector<double> & x , const std::vector<double> & y )
    : lm_functor_t( x , y , 1 ) { }

  int operator()( const Eigen::VectorXd & p , Eigen::VectorXd & fvec ) const
  {
    for (int i=0; i<values(); i++)
      fvec[i] = exp( p[0] * x[i] ) - y[i];
    return 0;
  }

  int df( const Eigen::VectorXd & p , Eigen::MatrixXd & fjac ) const
  {
    for (int i=0; i<values(); i++)
      fjac(i,0) = x[i] * exp( p[0] * x[i] );
    return 0;
  }

};


//
// run the minimizer and fill in SSR and standard errors
//

template<typename F>
static fit_result_t lm_minimize( F & functor , const std::vector<double> & p0 )
{

  fit_result_t res;

  const int np = p0.size();
  const int n = functor.values();

  res.n = n;

  // need more points than parameters for a variance estimate
  if ( n <= np ) return res;

  Eigen::VectorXd p( np );
  for (int j=0; j<np; j++) p[j] = p0[j];

  Eigen::LevenbergMarquardt<F> lm( functor );
  lm.parameters.maxfev = 200 * ( np + 1 );

  Eigen::LevenbergMarquardtSpace::Status status = lm.minimize( p );

  // statuses 1..4 are the converged ones; also accept hitting the tolerance limits
  // (6,7,8) when the parameters are usable
  const bool ok = status == Eigen::LevenbergMarquardtSpace::RelativeReductionTooSmall
    || status == Eigen::LevenbergMarquardtSpace::RelativeErrorTooSmall
    || status == Eigen::LevenbergMarquardtSpace::RelativeErrorAndReductionTooSmall
    || status == Eigen::LevenbergMarquardtSpace::CosinusTooSmall
    || status == Eigen::LevenbergMarquardtSpace::FtolTooSmall
    || status == Eigen::LevenbergMarquardtSpace::XtolTooSmall
    || status == Eigen::LevenbergMarquardtSpace::GtolTooSmall;

  res.par.resize( np );
  for (int j=0; j<np; j++)
    {
      res.par[j] = p[j];
      if ( ! Helper::realnum( p[j] ) ) return res;
    }

  if ( ! ok ) return res;

  Eigen::VectorXd fvec( n );
  functor( p , fvec );
  res.ssr = fvec.squaredNorm();

  Eigen::MatrixXd J( n , np );
  functor.df( p , J );

  const double s2 = res.ssr / (double)( n - np );
  Eigen::MatrixXd JtJ = J.transpose() * J;

  Eigen::FullPivLU<Eigen::MatrixXd> lu( JtJ );
  if ( ! lu.isInvertible() ) return res;

  Eigen::MatrixXd cov = s2 * lu.inverse();

  res.se.resize( np );
  for (int j=0; j<np; j++)
    res.se[j] = cov(j,j) >= 0 ? sqrt( cov(j,j) ) : 0 ;

  res.converged = true;
  return res;

}


double lmfit::gaussian( double x , double A , double mu , double sigma )
{
  const double d = x - mu;
  return A * exp( -0.5 * d * d / ( sigma * sigma ) );
}


fit_result_t lmfit::gaussian( const std::vector<double> & x ,
			      const std::vector<double> & y ,
			      const std::vector<double> & p0 )
{
  if ( x.size() != y.size() ) Helper::halt( "internal error: lmfit::gaussian() x/y size mismatch" );
  if ( p0.size() != 3 ) Helper::halt( "internal error: lmfit::gaussian() expects 3 starting values" );

  fit_result_t res;

  // a zero width is not a usable starting point
  if ( ! ( p0[2] != 0 ) ) return res;

  gaussian_functor_t functor( x , y );
  return lm_minimize( functor , p0 );
}


fit_result_t lmfit::exponential( const std::vector<double> & x ,
				 const std::vector<double> & y ,
				 const double k0 )
{
  if ( x.size() != y.size() ) Helper::halt( "internal error: lmfit::exponential() x/y size mismatch" );
  std::vector<double> p0( 1 , k0 );
  exponential_functor_t functor( x , y );
  return lm_minimize( functor , p0 );
}
