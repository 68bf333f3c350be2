
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

#ifndef __LATRACE_DESPIKE_H__
#define __LATRACE_DESPIKE_H__

#include <vector>
#include <string>

#include "param.h"

struct trace_t;

// result of a decay-exponent estimate from washout tails
struct expcoef_t
{
  expcoef_t() : coef(0) , k(0) , sigma_k(0) , r2(0) , ntails(0) , npoints(0) { }

  // working exponent: k - nsd_below * sigma_k
  double coef;

  // fitted exponent and its standard error
  double k;
  double sigma_k;

  // fit to all pooled points
  double r2;

  int ntails;
  int npoints;
};

namespace dsptools
{

  // replace x[i] > mean + nlim * sqrt(mean) (mean over the win-sample window
  // around i, not counting i) by the mean of its two neighbours
  std::vector<double> spike_filter( const std::vector<double> & x ,
				    const int win = 3 ,
				    const double nlim = 12.0 ,
				    int * nreplaced = NULL );

  // replace x[i] where the next sample falls faster than exp(k dt) allows
  std::vector<double> expdecay_filter( const std::vector<double> & x ,
				       const double k ,
				       const double dt ,
				       int * nreplaced = NULL );

  // DESPIKE: spike then decay filter over every analyte of the focus stage -> DESPIKED
  //  spike=T|F  win=3  nlim=12  exponent=<k>  tstep=<dt>
  void despike( trace_t & trace , const param_t & param );

  // estimate the decay exponent from the washouts (signal -> background
  // transitions) of autoranged standards
  expcoef_t estimate_decay( const std::vector<trace_t*> & standards ,
			    const std::vector<std::string> & analytes ,
			    const double nsd_below = 12.0 ,
			    const double trimlim = -1 );

}

#endif
