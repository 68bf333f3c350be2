
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

#include "stats/kde.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

kde_t::kde_t( const std::vector<double> & x , bandwidth_t rule , double factor )
{

  data = MiscMath::finite( x );

  bw = 0;

  const int n = data.size();

  if ( n < 2 ) return;

  const double sd = MiscMath::sdev( data );

  if ( ! ( sd > 0 ) ) return;

  double f = factor;

  if ( rule == BW_SCOTT )
    f = pow( (double)n , -0.2 );
  else if ( rule == BW_SILVERMAN )
    f = pow( n * 3.0 / 4.0 , -0.2 );
  else if ( ! ( factor > 0 ) )
    Helper::halt( "KDE bandwidth factor must be positive" );

  bw = f * sd;

}

double kde_t::evaluate( double x ) const
{
  if ( ! valid() ) return 0;

  const int n = data.size();
  const double norm = 1.0 / ( n * bw * sqrt( 2.0 * M_PI ) );
  double s = 0;
  for (int i=0;i<n;i++)
    {
      const double z = ( x - data[i] ) / bw;
      s += exp( -0.5 * z * z );
    }
  return s * norm;
}

std::vector<double> kde_t::evaluate( const std::vector<double> & grid ) const
{
  std::vector<double> d( grid.size() );
  for (int i=0;i<grid.size();i++)
    d[i] = evaluate( grid[i] );
  return d;
}

bandwidth_t kde_t::rule( const std::string & s , double * factor )
{
  *factor = 0;
  if ( s == "" || Helper::iequals( s , "scott" ) ) return BW_SCOTT;
  if ( Helper::iequals( s , "silverman" ) ) return BW_SILVERMAN;
  if ( ! Helper::str2dbl( s , factor ) || ! ( *factor > 0 ) )
    Helper::halt( "bandwidth should be scott, silverman or a positive number: " + s );
  return BW_FIXED;
}
