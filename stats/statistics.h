
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

#ifndef __LATRACE_STATISTICS_H__
#define __LATRACE_STATISTICS_H__

#include <vector>

namespace Statistics
{

  double gammln(double);

  // Pearson correlation of two equal-length vectors; returns false if either is invariant
  bool pearson( const double * x , const double * y , const int n , double * r );

  // two-sided p-value for a Pearson r from n pairs (t-test, n-2 df)
  double pearson_pvalue( const double r , const int n );

  // two-sided tail probability of Student's t
  double t_prob( double t , double df );

}

#endif
