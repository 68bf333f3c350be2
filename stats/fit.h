
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

#ifndef __LATRACE_FIT_H__
#define __LATRACE_FIT_H__

#include <vector>

//
// non-linear least-squares fits (Levenberg-Marquardt, Eigen)
//

struct fit_result_t
{
  fit_result_t() : converged(false) , ssr(0) , n(0) { }

  bool converged;

  // fitted parameters, and their standard errors (from s^2 (J'J)^-1)
  std::vector<double> par;
  std::vector<double> se;

  // residual sum of squares, number of points
  double ssr;
  int n;
};

namespace lmfit
{

  // y = A exp( -0.5 (x-mu)^2 / sigma^2 ), par = { A , mu , sigma }
  fit_result_t gaussian( const std::vector<double> & x ,
			 const std::vector<double> & y ,
			 const std::vector<double> & p0 );

  double gaussian( double x , double A , double mu , double sigma );

  // y = exp( k x ), par = { k }
  fit_result_t exponential( const std::vector<double> & x ,
			    const std::vector<double> & y ,
			    const double k0 = -1.0 );

}

#endif
