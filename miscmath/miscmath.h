
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

#ifndef __LATRACE_MISCMATH_H__
#define __LATRACE_MISCMATH_H__

#include <vector>
#include <cstddef>

namespace MiscMath
{

  // n evenly spaced points, a and b inclusive
  std::vector<double> linspace( double a , double b , int n );

  double mean( const std::vector<double> & x );

  // sample (n-1) SD
  double sdev( const std::vector<double> & x );

  // skipping NaN (NaN if nothing left)
  double nanmean( const std::vector<double> & x );
  int    n_finite( const std::vector<double> & x );
  std::vector<double> finite( const std::vector<double> & x );

  // mid-point of the two central values if n is even
  double median( const std::vector<double> & x );

  // p in [0,100], linear interpolation between order statistics
  double percentile( const std::vector<double> & x , double p );

  // extreme finite value, and its index (-1 if none)
  double min( const std::vector<double> & x , int * idx = NULL );
  double max( const std::vector<double> & x , int * idx = NULL );

  // strict local extrema, interior points only
  std::vector<int> local_minima( const std::vector<double> & x );
  std::vector<int> local_maxima( const std::vector<double> & x );

  // regularized incomplete beta function I_x(a,b)
  double betai( double a , double b , double x );

}

#endif
