
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

#include "optim/optimiser.h"
#include "dsp/rolling.h"
#include "stats/kde.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;

void optim::scale_surface( Eigen::MatrixXd & m )
{
  double s = 0 , ss = 0;
  int n = 0;
  for (int i=0; i<m.rows(); i++)
    for (int j=0; j<m.cols(); j++)
      if ( Helper::realnum( m(i,j) ) ) { s += m(i,j); ++n; }

  if ( n == 0 ) return;

  const double mean = s / (double)n;
  for (int i=0; i<m.rows(); i++)
    for (int j=0; j<m.cols(); j++)
      if ( Helper::realnum( m(i,j) ) ) ss += ( m(i,j) - mean ) * ( m(i,j) - mean );

  const double sd = n > 1 ? sqrt( ss / (double)( n - 1 ) ) : 0 ;

  for (int i=0; i<m.rows(); i++)
    for (int j=0; j<m.cols(); j++)
      if ( Helper::realnum( m(i,j) ) )
	m(i,j) = sd > 0 ? ( m(i,j) - mean ) / sd : 0 ;
}


double optim::threshold( const std::vector<double> & x , threshold_mode_t mode )
{

  if ( x.size() == 0 ) return globals::nan;

  if ( mode == THRESH_MEDIAN ) return MiscMath::median( x );

  if ( mode == THRESH_MEAN ) return MiscMath::mean( x );

  if ( mode != THRESH_KDE_MAX && mode != THRESH_KDE_FIRST_MAX )
    Helper::halt( "internal error: no rule for threshold mode " + globals::threshold_mode( mode ) );

  // grid over the 1st to 99th percentile of the pooled values
  const double mn = MiscMath::percentile( x , 1 );
  const double mx = MiscMath::percentile( x , 99 );

  kde_t kde( x );

  // no spread: every value is the threshold
  if ( ! kde.valid() || ! ( mx > mn ) ) return mn;

  std::vector<double> grid = MiscMath::linspace( mn , mx , globals::kde_grid_optimise );
  std::vector<double> dens = kde.evaluate( grid );

  int imax = 0;
  const double dmax = MiscMath::max( dens , &imax );

  if ( mode == THRESH_KDE_MAX ) return grid[ imax ];

  // first strict interior maximum above a quarter of the peak density
  const int ng = grid.size();
  for (int i=1; i<ng-1; i++)
    if ( dens[i] > 0.25 * dmax && dens[i] > dens[i-1] && dens[i] > dens[i+1] )
      return grid[i];

  // monotone density over the grid
  return grid[ imax ];
}


optimise_result_t optim::signal_optimiser( const analyte_map_t & d ,
					   const std::vector<std::string> & analytes ,
					   const int min_points ,
					   const threshold_mode_t mode ,
					   const std::vector<double> & weights ,
					   const double explicit_mean ,
					   const double explicit_sd )
{

  optimise_result_t res;

  res.min_points = min_points;

  if ( analytes.size() == 0 )
    Helper::halt( "no analytes given to the optimiser" );

  if ( min_points < 1 )
    Helper::halt( "min_points must be at least 1" );

  if ( weights.size() != 0 && weights.size() != analytes.size() )
    throw data_shape_error_t( "expecting " + Helper::int2str( (int)analytes.size() ) + " weights" );

  //
  // usable points: those not NaN (same for all analytes)
  //

  std::vector<std::vector<double> > vals;
  for (int a=0; a<analytes.size(); a++)
    {
      analyte_map_t::const_iterator dd = d.find( analytes[a] );
      if ( dd == d.end() )
	throw data_shape_error_t( "analyte not found: " + analytes[a] );
      vals.push_back( dd->second );
    }

  const int n = vals[0].size();

  res.mask.resize( n , false );

  std::vector<int> idx;
  for (int i=0; i<n; i++)
    if ( Helper::realnum( vals[0][i] ) ) idx.push_back( i );

  for (int a=1; a<vals.size(); a++)
    {
      if ( vals[a].size() != n )
	throw data_shape_error_t( "analytes passed to the optimiser differ in length" );
      for (int i=0; i<n; i++)
	if ( Helper::realnum( vals[a][i] ) != Helper::realnum( vals[0][i] ) )
	  throw data_shape_error_t( "analytes passed to the optimiser have different missing samples" );
    }

  const int L = idx.size();
  res.npoints = L;

  if ( L < min_points )
    {
      res.note = "only " + Helper::int2str( L ) + " points, fewer than min_points="
	+ Helper::int2str( min_points );
      return res;
    }

  //
  // window mean/SD surfaces, scaled per analyte, then averaged
  //

  const int nw = L - min_points + 1;

  res.means = Eigen::MatrixXd::Zero( nw , L );
  res.sds = Eigen::MatrixXd::Zero( nw , L );

  double wsum = 0;
  for (int a=0; a<analytes.size(); a++)
    wsum += weights.size() ? weights[a] : 1.0 ;

  if ( ! ( wsum > 0 ) )
    Helper::halt( "optimiser weights must sum to a positive value" );

  for (int a=0; a<analytes.size(); a++)
    {
      std::vector<double> x( L );
      for (int i=0; i<L; i++) x[i] = vals[a][ idx[i] ];

      Eigen::MatrixXd am( nw , L ) , as( nw , L );

      for (int w=min_points; w<=L; w++)
	{
	  std::vector<double> wm , ws;
	  dsptools::window_mean_sd( x , w , &wm , &ws );
	  for (int c=0; c<L; c++)
	    {
	      am( w - min_points , c ) = wm[c];
	      as( w - min_points , c ) = ws[c];
	    }
	}

      scale_surface( am );
      scale_surface( as );

      const double wt = ( weights.size() ? weights[a] : 1.0 ) / wsum;
      res.means += wt * am;
      res.sds += wt * as;
    }

  //
  // thresholds from the pooled cells
  //

  std::vector<double> pm , ps;
  for (int i=0; i<nw; i++)
    for (int c=0; c<L; c++)
      if ( Helper::realnum( res.means(i,c) ) && Helper::realnum( res.sds(i,c) ) )
	{
	  pm.push_back( res.means(i,c) );
	  ps.push_back( res.sds(i,c) );
	}

  if ( mode == THRESH_EXPLICIT )
    {
      res.mean_threshold = explicit_mean;
      res.sd_threshold = explicit_sd;
    }
  else
    {
      res.mean_threshold = threshold( pm , mode );
      res.sd_threshold = threshold( ps , mode );
    }

  //
  // widest qualifying window; then the earliest within one point of that width
  //

  int wmax = -1;
  for (int i=0; i<nw; i++)
    for (int c=0; c<L; c++)
      if ( res.means(i,c) <= res.mean_threshold && res.sds(i,c) <= res.sd_threshold )
	if ( i > wmax ) wmax = i;

  if ( wmax < 0 )
    {
      res.note = "no window below both thresholds";
      return res;
    }

  int best_c = -1 , best_i = -1;
  for (int c=0; c<L && best_c < 0; c++)
    for (int i=nw-1; i>=0 && i>=wmax-1; i--)
      if ( res.means(i,c) <= res.mean_threshold && res.sds(i,c) <= res.sd_threshold )
	{
	  best_c = c;
	  best_i = i;
	  break;
	}

  res.found = true;
  res.centre = best_c;
  res.width = best_i + min_points;

  const int start = best_c - res.width / 2;
  for (int j=start; j<start+res.width; j++)
    res.mask[ idx[j] ] = true;

  res.lwr = idx[ start ];
  res.upr = idx[ start + res.width - 1 ];

  return res;
}
