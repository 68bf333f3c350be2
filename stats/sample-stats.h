
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

#ifndef __LATRACE_SAMPLE_STATS_H__
#define __LATRACE_SAMPLE_STATS_H__

#include <string>
#include <vector>
#include <map>
#include <ostream>

#include "param.h"
#include "filters/filt.h"

struct trace_t;

struct seg_stats_t
{
  seg_stats_t() : n(0) , mean(0) , sd(0) , se(0) { }
  int n;
  double mean;
  double sd;
  double se;
};

// analyte -> segment -> stats; segment 0 = all segments together
typedef std::map<std::string,std::map<int,seg_stats_t> > sample_stats_t;

namespace Statistics
{

  // per analyte and signal segment, over samples passing the selector
  sample_stats_t sample_stats( trace_t & trace ,
			       const filt_selector_t & sel = filt_selector_t() ,
			       const std::vector<std::string> & analytes = std::vector<std::string>() );

  // STATS analytes=A,B filt=
  void sample_stats( trace_t & trace , const param_t & param , std::ostream & out );

}

#endif
