
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

#ifndef __LATRACE_ROLLING_H__
#define __LATRACE_ROLLING_H__

#include <vector>

namespace dsptools
{

  // even widths are reduced to the next odd width
  int odd_window( int w );

  // centred rolling mean over w samples, NaNs skipped; 'pad' at the
  // w/2 positions at either edge
  std::vector<double> rolling_mean( const std::vector<double> & x , int w ,
				    double pad = 0 );

  // centred rolling (population) SD, as above
  std::vector<double> rolling_sd( const std::vector<double> & x , int w ,
				  double pad = 0 );

  // zero-padded rolling mean
  std::vector<double> fastsmooth( const std::vector<double> & x , int w );

  // slope of a least-squares line through each centred window (x = sample index), zero-padded
  std::vector<double> fastgrad( const std::vector<double> & x , int w );

  // mean and (population) SD of the window [ c - w/2 , c - w/2 + w ) for each c;
  // any width allowed; NaN where the window does not fit
  void window_mean_sd( const std::vector<double> & x , int w ,
		       std::vector<double> * mean ,
		       std::vector<double> * sd );

}

#endif
