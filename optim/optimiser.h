
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

#ifndef __LATRACE_OPTIMISER_H__
#define __LATRACE_OPTIMISER_H__

#include <Eigen/Dense>
#include <vector>
#include <string>

#include "defs/defs.h"
#include "trace/trace.h"

//
// longest contiguous window with low mean dispersion and low mean
// (scaled) amplitude across a set of analytes
//

struct optimise_result_t
{
  optimise_result_t()
  : found( false ) , npoints(0) , min_points(0) , mean_threshold(0) , sd_threshold(0) ,
    centre(-1) , width(0) , lwr(-1) , upr(-1) { }

  bool found;

  // selection, in the index space of the input
  std::vector<bool> mask;

  // number of usable points, smallest window considered
  int npoints;
  int min_points;

  // [ width - min_points ][ centre ] surfaces of the averaged, scaled
  // window means and SDs (NaN where the window does not fit)
  Eigen::MatrixXd means;
  Eigen::MatrixXd sds;

  double mean_threshold;
  double sd_threshold;

  // chosen centre and width (over the usable points)
  int centre;
  int width;

  // first and last selected sample of the input (inclusive)
  int lwr;
  int upr;

  std::string note;
};


namespace optim
{

  // NaN in the inputs marks samples outside the region to optimise;
  // the same samples must be NaN for every analyte
  optimise_result_t signal_optimiser( const analyte_map_t & d ,
				      const std::vector<std::string> & analytes ,
				      const int min_points = 5 ,
				      const threshold_mode_t mode = THRESH_KDE_FIRST_MAX ,
				      const std::vector<double> & weights = std::vector<double>() ,
				      const double explicit_mean = 0 ,
				      const double explicit_sd = 0 );

  // threshold from pooled (finite) values
  double threshold( const std::vector<double> & x , threshold_mode_t mode );

  // z-scale the finite cells (zero if there is no spread)
  void scale_surface( Eigen::MatrixXd & m );

}

#endif
