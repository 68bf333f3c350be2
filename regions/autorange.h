
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

#ifndef __LATRACE_AUTORANGE_H__
#define __LATRACE_AUTORANGE_H__

#include <vector>
#include <string>

#include "param.h"

struct trace_t;

// time interval removed around one background/signal edge
struct transition_t
{
  transition_t() : edge(0) , centre(0) , sigma(0) , lwr(0) , upr(0) , fitted(false) { }
  int edge;
  double centre;
  double sigma;
  double lwr;
  double upr;
  bool fitted;
};

struct autorange_t
{

  autorange_t( const param_t & param );

  // split the trace into bkg/sig/trn on the target analyte of the focus stage
  void apply( trace_t & trace );

  // intensity threshold from the KDE of log10 values (NaN if none found)
  double threshold( const std::vector<double> & v ) const;

  std::string analyte;

  int gwin;
  int win;
  int smwin;
  double conf;
  double trans_mult[2];
  double safety;

  // results of the last apply()
  double thr;
  std::vector<transition_t> transitions;

 private:

  bool fit_transition( const std::vector<double> & t ,
		       const std::vector<double> & g ,
		       const int lwr , const int upr ,
		       transition_t * tr ) const;

  void safety_pass( trace_t & trace ) const;

};

namespace regions
{
  // AUTORANGE analyte=Ca43 gwin=11 win=40 smwin=5 conf=0.01 trans_mult=0,0 safety=0.3
  void autorange( trace_t & trace , const param_t & param );
}

#endif
