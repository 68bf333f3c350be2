
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

#include "miscmath/miscmath.h"
#include "stats/statistics.h"
#include "helper/helper.h"

#include <cmath>
#include <limits>
#include <algorithm>

static const double NaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> MiscMath::linspace( double a , double b , int n )
{
  if ( n < 2 ) Helper::halt( "linspace() needs at least two points" );
  std::vector<double> r( n );
  const double step = ( b - a ) / (double)( n - 1 );
  for (int i=0; i<n-1; i++) r[i] = a + i * step;
  r[n-1] = b;
  return r;
}

double MiscMath::mean( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return NaN;
  double s = 0;
  for (int i=0; i<x.size(); i++) s += x[i];
  return s / (double)x.size();
}

double MiscMath::sdev( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n < 2 ) return 0;
  const double m = mean( x );
  double ss = 0;
  for (int i=0; i<n; i++) ss += ( x[i] - m ) * ( x[i] - m );
  return sqrt( ss / (double)( n - 1 ) );
}

double MiscMath::nanmean( const std::vector<double> & x )
{
  return mean( finite( x ) );
}

int MiscMath::n_finite( const std::vector<double> & x )
{
  return std::count_if( x.begin() , x.end() , Helper::realnum );
}

std::vector<double> MiscMath::finite( const std::vector<double> & x )
{
  std::vector<double> r;
  r.reserve( x.size() );
  for (int i=0; i<x.size(); i++)
    if ( Helper::realnum( x[i] ) ) r.push_back( x[i] );
  return r;
}

double MiscMath::median( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) Helper::halt( "median of an empty set" );

  std::vector<double> y = x;
  const int h = n / 2;
  std::nth_element( y.begin() , y.begin() + h , y.end() );
  if ( n % 2 ) return y[h];

  // y[0..h-1] now all <= y[h]
  const double lwr = *std::max_element( y.begin() , y.begin() + h );
  return 0.5 * ( lwr + y[h] );
}

double MiscMath::percentile( const std::vector<double> & x , double p )
{
  const int n = x.size();
  if ( n == 0 ) Helper::halt( "percentile of an empty set" );
  if ( p < 0 || p > 100 ) Helper::halt( "percentile must be between 0 and 100" );

  std::vector<double> y = x;
  std::sort( y.begin() , y.end() );

  const double pos = ( p / 100.0 ) * ( n - 1 );
  const int lwr = (int)floor( pos );
  if ( lwr >= n - 1 ) return y[n-1];
  return y[lwr] + ( pos - lwr ) * ( y[lwr+1] - y[lwr] );
}

static double extreme( const std::vector<double> & x , int * idx , bool lowest )
{
  double m = NaN;
  int mi = -1;
  for (int i=0; i<x.size(); i++)
    {
      if ( ! Helper::realnum( x[i] ) ) continue;
      if ( mi == -1 || ( lowest ? x[i] < m : x[i] > m ) )
	{
	  m = x[i];
	  mi = i;
	}
    }
  if ( idx ) *idx = mi;
  return m;
}

double MiscMath::min( const std::vector<double> & x , int * idx )
{
  return extreme( x , idx , true );
}

double MiscMath::max( const std::vector<double> & x , int * idx )
{
  return extreme( x , idx , false );
}

std::vector<int> MiscMath::local_minima( const std::vector<double> & x )
{
  std::vector<int> r;
  for (int i=1; i+1<(int)x.size(); i++)
    if ( x[i] < x[i-1] && x[i] < x[i+1] ) r.push_back( i );
  return r;
}

std::vector<int> MiscMath::local_maxima( const std::vector<double> & x )
{
  std::vector<int> r;
  for (int i=1; i+1<(int)x.size(); i++)
    if ( x[i] > x[i-1] && x[i] > x[i+1] ) r.push_back( i );
  return r;
}


//
// continued fraction for the incomplete beta function, by the modified
// Lentz method
//

static double betacf( double a , double b , double x )
{
  const int maxit = 200;
  const double eps = 1e-12;
  const double tiny = 1e-300;

  double c = 1.0;
  double d = 1.0 - ( a + b ) * x / ( a + 1.0 );
  if ( fabs( d ) < tiny ) d = tiny;
  d = 1.0 / d;
  double h = d;

  for (int m=1; m<=maxit; m++)
    {
      const int m2 = 2 * m;

      // even step
      double aa = m * ( b - m ) * x / ( ( a - 1.0 + m2 ) * ( a + m2 ) );
      d = 1.0 + aa * d;
      if ( fabs( d ) < tiny ) d = tiny;
      c = 1.0 + aa / c;
      if ( fabs( c ) < tiny ) c = tiny;
      d = 1.0 / d;
      h *= d * c;

      // odd step
      aa = -( a + m ) * ( a + b + m ) * x / ( ( a + m2 ) * ( a + 1.0 + m2 ) );
      d = 1.0 + aa * d;
      if ( fabs( d ) < tiny ) d = tiny;
      c = 1.0 + aa / c;
      if ( fabs( c ) < tiny ) c = tiny;
      d = 1.0 / d;
      const double del = d * c;
      h *= del;
      if ( fabs( del - 1.0 ) < eps ) break;
    }

  return h;
}

double MiscMath::betai( double a , double b , double x )
{
  if ( x < 0.0 || x > 1.0 ) Helper::halt( "betai() requires 0 <= x <= 1" );
  if ( x == 0.0 || x == 1.0 ) return x;

  const double bt = exp( Statistics::gammln( a + b ) - Statistics::gammln( a ) - Statistics::gammln( b )
			 + a * log( x ) + b * log( 1.0 - x ) );

  // the continued fraction converges quickly below this point; use symmetry above it
  if ( x < ( a + 1.0 ) / ( a + b + 2.0 ) )
    return bt * betacf( a , b , x ) / a;
  return 1.0 - bt * betacf( b , a , 1.0 - x ) / b;
}
