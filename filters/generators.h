
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

#ifndef __LATRACE_GENERATORS_H__
#define __LATRACE_GENERATORS_H__

#include <string>
#include <vector>

#include "defs/defs.h"
#include "param.h"
#include "filters/filt.h"

struct trace_t;
struct clusterer_t;

// KDE and split points behind a distribution filter
struct distribution_t
{
  std::vector<double> grid;
  std::vector<double> density;
  // bin limits (on the original scale)
  std::vector<double> limits;
  std::vector<std::string> names;
};

//
// filter generators: each adds named masks to the trace's registry,
// computed over the samples passing the selector for which every analyte
// of the focus stage is present
//

namespace filters
{

  std::vector<bool> selection( trace_t & trace ,
			       const filt_selector_t & sel ,
			       const std::vector<std::string> & analytes );

  // ANALYTE_thresh_above (v >= t) or ANALYTE_thresh_below (v <= t)
  std::string threshold( trace_t & trace ,
			 const std::string & analyte ,
			 const double t ,
			 const bool above ,
			 const filt_selector_t & sel = filt_selector_t() ,
			 const param_t & params = param_t() );

  // ANALYTE_distribution_1..k from the minima of a KDE, or ANALYTE_distribution_failed
  distribution_t distribution( trace_t & trace ,
			       const std::string & analyte ,
			       const bandwidth_t rule = BW_SCOTT ,
			       const double factor = 0 ,
			       const bool log_transform = false ,
			       const filt_selector_t & sel = filt_selector_t() ,
			       const param_t & params = param_t() );

  // A-B_cluster-METHOD_k (and _noise, _core)
  std::vector<std::string> clustering( trace_t & trace ,
				       const std::vector<std::string> & analytes ,
				       clusterer_t & method ,
				       const bool normalise = true ,
				       const bool include_time = false ,
				       const filt_selector_t & sel = filt_selector_t() ,
				       const param_t & params = param_t() );

  // X-Y_corr, on for Y only
  std::string correlation( trace_t & trace ,
			   const std::string & x ,
			   const std::string & y ,
			   int window ,
			   const double r_threshold = 0.9 ,
			   const double p_threshold = 0.05 ,
			   const filt_selector_t & sel = filt_selector_t() ,
			   const param_t & params = param_t() );

  // 'optimise': best window of each signal segment
  std::string optimise( trace_t & trace ,
			const std::vector<std::string> & analytes ,
			const int min_points = 5 ,
			const threshold_mode_t mode = THRESH_KDE_FIRST_MAX ,
			const std::vector<double> & weights = std::vector<double>() ,
			const double mean_threshold = 0 ,
			const double sd_threshold = 0 ,
			const filt_selector_t & sel = filt_selector_t() ,
			const param_t & params = param_t() );

  //
  // command forms
  //

  // analyte=X threshold=T mode=above|below filt=
  void threshold( trace_t & trace , const param_t & param );

  // analyte=X bw=scott|silverman|<f> transform=log filt=
  void distribution( trace_t & trace , const param_t & param );

  // analytes=A,B method=meanshift|kmeans|DBSCAN normalise=T include_time=F filt=
  //   bandwidth, bin_seeding | n_clusters, n_init, seed | eps, min_samples, n_clusters, maxiter
  void clustering( trace_t & trace , const param_t & param );

  // x=A y=B window=N r=0.9 p=0.05 filt=
  void correlation( trace_t & trace , const param_t & param );

  // analytes=A,B min_points=5 mode=kde_first_max weights= mean_threshold= sd_threshold= filt=
  void optimise( trace_t & trace , const param_t & param );

}

#endif
