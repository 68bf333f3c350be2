
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

#ifndef __LATRACE_KDE_H__
#define __LATRACE_KDE_H__

#include <vector>
#include "defs/defs.h"

//
// 1-D gaussian kernel density estimate; kernel SD = factor x sample SD,
// where the factor follows Scott's (n^-1/5) or Silverman's ((3n/4)^-1/5) rule
// or is given directly
//

struct kde_t
{

  kde_t( const std::vector<double> & x , bandwidth_t rule = BW_SCOTT , double factor = 0 );

  // false if fewer than 2 points, or no spread
  bool valid() const { return bw > 0; }

  double bandwidth() const { return bw; }

  double evaluate( double x ) const;

  std::vector<double> evaluate( const std::vector<double> & grid ) const;

  static bandwidth_t rule( const std::string & s , double * factor );

 private:

  std::vector<double> data;

  double bw;

};

#endif
