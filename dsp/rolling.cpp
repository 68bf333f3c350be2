
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

#include "dsp/rolling.h"
#include "helper/helper.h"
#include "helper/exception.h"

#include <cmath>
#include <limits>

static void check_window( const int n , const int w , const std::string & fn )
{
  if ( n == 0 ) throw data_shape_error_t( fn + "(): empty sequence" );
  if ( w < 1 ) throw data_shape_error_t( fn + "(): window must be at least 1, not " + Helper::int2str( w ) );
  if ( w > n ) throw data_shape_error_t( fn + "(): window (" + Helper::int2str( w )
					 + ") larger than sequence (" + Helper::int2str( n ) + ")" );
}

int dsptools::odd_window( int w )
{
  return w % 2 == 0 ? w - 1 : w ;
}

std::vector<double> dsptools::rolling_mean( const std::vector<double> & x , int w ,
					    double pad )
{
  const int n = x.size();
  check_window( n , w , "rolling_mean" );
  w = odd_window( w );
  if ( w < 1 ) throw data_shape_error_t( "rolling_mean(): window too small" );

  const int h = w / 2;

  std::vector<double> r( n , pad );

  for (int i=h; i<n-h; i++)
    {
      double s = 0;
      int c = 0;
      for (int j=i-h; j<=i+h; j++)
	if ( x[j] == x[j] ) { s += x[j]; ++c; }
      r[i] = c ? s / (double)c : std::numeric_limits<double>::quiet_NaN();
    }

  return r;
}


std::vector<double> dsptools::rolling_sd( const std::vector<double> & x , int w , double pad )
{
  const int n = x.size();
  check_window( n , w , "rolling_sd" );
  w = odd_window( w );
  if ( w < 1 ) throw data_shape_error_t( "rolling_sd(): window too small" );

  const int h = w / 2;

  std::vector<double> r( n , pad );

  for (int i=h; i<n-h; i++)
    {
      double s = 0;
      int c = 0;
      for (int j=i-h; j<=i+h; j++)
	if ( x[j] == x[j] ) { s += x[j]; ++c; }

      if ( c == 0 )
	{
	  r[i] = std::numeric_limits<double>::quiet_NaN();
	  continue;
	}

      const double m = s / (double)c;
      double ss = 0;
      for (int j=i-h; j<=i+h; j++)
	if ( x[j] == x[j] ) ss += ( x[j] - m ) * ( x[j] - m );
      r[i] = sqrt( ss / (double)c );
    }

  return r;
}


std::vector<double> dsptools::fastsmooth( const std::vector<double> & x , int w )
{
  return rolling_mean( x , w , 0 );
}


std::vector<double> dsptools::fastgrad( const std::vector<double> & x , int w )
{
  const int n = x.size();
  check_window( n , w , "fastgrad" );
  w = odd_window( w );
  if ( w < 1 ) throw data_shape_error_t( "fastgrad(): window too small" );

  const int h = w / 2;

  std::vector<double> r( n , 0 );

  for (int i=h; i<n-h; i++)
    {
      // x-axis: 0..w-1 within the window
      double sx = 0 , sy = 0 , sxx = 0 , sxy = 0;
      int c = 0;
      for (int j=0; j<w; j++)
	{
	  const double v = x[ i - h + j ];
	  if ( v != v ) continue;
	  sx += j; sy += v; sxx += j * j; sxy += j * v;
	  ++c;
	}

      if ( c < 2 )
	{
	  r[i] = std::numeric_limits<double>::quiet_NaN();
	  continue;
	}

      const double den = c * sxx - sx * sx;
      r[i] = den != 0 ? ( c * sxy - sx * sy ) / den : std::numeric_limits<double>::quiet_NaN();
    }

  return r;
}


void dsptools::window_mean_sd( const std::vector<double> & x , int w ,
			       std::vector<double> * mean ,
			       std::vector<double> * sd )
{
  const int n = x.size();
  if ( w < 1 ) throw data_shape_error_t( "window_mean_sd(): window must be at least 1" );

  const double nan = std::numeric_limits<double>::quiet_NaN();

  mean->assign( n , nan );
  sd->assign( n , nan );

  if ( w > n ) return;

  for (int c=0; c<n; c++)
    {
      const int start = c - w / 2;
      if ( start < 0 || start + w > n ) continue;

      double s = 0;
      int cnt = 0;
      for (int j=start; j<start+w; j++)
	if ( x[j] == x[j] ) { s += x[j]; ++cnt; }
      if ( cnt == 0 ) continue;

      const double m = s / (double)cnt;
      double ss = 0;
      for (int j=start; j<start+w; j++)
	if ( x[j] == x[j] ) ss += ( x[j] - m ) * ( x[j] - m );

      (*mean)[c] = m;
      (*sd)[c] = sqrt( ss / (double)cnt );
    }
}
