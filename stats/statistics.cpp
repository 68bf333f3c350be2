
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

#include "stats/statistics.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

double Statistics::gammln(double xx)
{

  //  Returns the value ln[Γ(xx)] for xx > 0.

  static double cof[6]={76.18009172947146,-86.50532032941677,
			24.01409824083091,-1.231739572450155,
			0.1208650973866179e-2,-0.5395239384953e-5};

  int j;
  double y=xx, x=xx;
  double tmp=x+5.5;
  tmp -= (x+0.5)*log(tmp);
  double ser=1.000000000190015;
  for (j=0;j<=5;j++) ser += cof[j]/++y;
  return -tmp+log(2.5066282746310005*ser/x);
}


bool Statistics::pearson( const double * x , const double * y , const int n , double * r )
{

  if ( n < 2 ) return false;

  double mx = 0 , my = 0;
  for (int i=0;i<n;i++) { mx += x[i]; my += y[i]; }
  mx /= (double)n;
  my /= (double)n;

  double sxx = 0 , syy = 0 , sxy = 0;
  for (int i=0;i<n;i++)
    {
      const double dx = x[i] - mx;
      const double dy = y[i] - my;
      sxx += dx * dx;
      syy += dy * dy;
      sxy += dx * dy;
    }

  if ( sxx <= 0 || syy <= 0 ) return false;

  *r = sxy / sqrt( sxx * syy );

  // guard rounding
  if ( *r > 1 ) *r = 1;
  if ( *r < -1 ) *r = -1;

  return true;
}


double Statistics::t_prob( double t , double df )
{
  if ( ! Helper::realnum( t ) ) return 0;
  const double x = df / ( df + t * t );
  return MiscMath::betai( 0.5 * df , 0.5 , x );
}


double Statistics::pearson_pvalue( const double r , const int n )
{
  const double df = n - 2;
  if ( df <= 0 ) return 1.0;

  // perfect correlation
  if ( fabs( r ) >= 1.0 ) return 0.0;

  const double t = r * sqrt( df / ( 1.0 - r * r ) );
  return t_prob( t , df );
}
