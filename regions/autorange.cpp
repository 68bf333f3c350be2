
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

#include "regions/autorange.h"
#include "trace/trace.h"
#include "dsp/rolling.h"
#include "stats/kde.h"
#include "stats/fit.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;

autorange_t::autorange_t( const param_t & param )
{

  analyte = param.has( "analyte" ) ? param.value( "analyte" ) : "" ;

  gwin  = param.get_int( "gwin" , globals::autorange_gwin );
  win   = param.get_int( "win" , globals::autorange_win );
  smwin = param.get_int( "smwin" , globals::autorange_smwin );
  conf  = param.get_dbl( "conf" , globals::autorange_conf );
  safety = param.get_dbl( "safety" , globals::autorange_safety );

  trans_mult[0] = trans_mult[1] = 0;
  if ( param.has( "trans_mult" ) )
    {
      std::vector<double> tm = param.dblvector( "trans_mult" );
      if ( tm.size() != 2 ) Helper::halt( "trans_mult requires two values, e.g. trans_mult=0,0.5" );
      trans_mult[0] = tm[0];
      trans_mult[1] = tm[1];
    }

  if ( ! ( conf > 0 && conf < 1 ) )
    Helper::halt( "conf must be between 0 and 1" );

  if ( gwin < 1 || smwin < 1 || win < 1 )
    Helper::halt( "gwin, win and smwin must be positive" );

  if ( safety < 0 )
    Helper::halt( "safety must not be negative" );

  thr = 0;
}


double autorange_t::threshold( const std::vector<double> & v ) const
{

  std::vector<double> vl;
  for (int i=0; i<v.size(); i++)
    if ( v[i] > 0 ) vl.push_back( log10( v[i] ) );

  if ( vl.size() < 2 ) return globals::nan;

  kde_t kde( vl );
  if ( ! kde.valid() ) return globals::nan;

  std::vector<double> grid = MiscMath::linspace( MiscMath::min( vl ) ,
						 MiscMath::max( vl ) ,
						 globals::kde_grid_autorange );

  std::vector<int> mins = MiscMath::local_minima( kde.evaluate( grid ) );

  if ( mins.size() == 0 ) return globals::nan;

  // lowest minimum, raised a little so that ambiguous points go to background
  return 1.2 * pow( 10.0 , grid[ mins[0] ] );
}


bool autorange_t::fit_transition( const std::vector<double> & t ,
				  const std::vector<double> & g ,
				  const int lwr , const int upr ,
				  transition_t * tr ) const
{

  std::vector<double> x , y;
  for (int i=lwr; i<=upr; i++)
    if ( Helper::realnum( g[i] ) )
      {
	x.push_back( t[i] );
	y.push_back( g[i] );
      }

  if ( x.size() < 4 ) return false;

  int mx = 0;
  const double ymax = MiscMath::max( y , &mx );

  std::vector<double> p0( 3 );
  p0[0] = ymax;
  p0[1] = x[ mx ];
  p0[2] = ( x.back() - x[0] ) / 2.0;

  if ( ! ( p0[0] > 0 && p0[2] > 0 ) ) return false;

  fit_result_t fit = lmfit::gaussian( x , y , p0 );

  if ( ! fit.converged ) return false;

  const double A = fit.par[0];
  const double mu = fit.par[1];
  const double s = fabs( fit.par[2] );

  if ( ! ( Helper::realnum( A ) && Helper::realnum( mu ) && Helper::realnum( s ) ) ) return false;
  if ( A <= 0 || s == 0 ) return false;

  // centre must fall within the data window
  if ( mu < t[0] || mu > t.back() ) return false;

  // half-width where the gaussian falls to 'conf' of its peak
  const double hw = sqrt( 2.0 * s * s * log( 1.0 / conf ) );

  tr->centre = mu;
  tr->sigma = s;
  tr->lwr = mu - hw - trans_mult[0] * s;
  tr->upr = mu + hw + trans_mult[1] * s;
  tr->fitted = true;

  return true;
}


void autorange_t::safety_pass( trace_t & trace ) const
{

  if ( trace.trnrng.size() == 0 ) return;

  double trw = 0;
  for (int i=0; i<trace.trnrng.size(); i++)
    trw += trace.trnrng[i].width();
  trw /= (double)trace.trnrng.size();

  if ( ! ( trw > 0 ) ) return;

  std::vector<double> sb;
  for (int i=0; i<trace.sigrng.size(); i++)
    {
      sb.push_back( trace.sigrng[i].start );
      sb.push_back( trace.sigrng[i].stop );
    }

  std::vector<double> bb;
  for (int i=0; i<trace.bkgrng.size(); i++)
    {
      bb.push_back( trace.bkgrng[i].start );
      bb.push_back( trace.bkgrng[i].stop );
    }

  std::vector<bool> bkg = trace.bkg;
  std::vector<bool> sig = trace.sig;

  int ncorr = 0;

  for (int j=0; j<bb.size(); j++)
    {
      bool close = false;
      for (int k=0; k<sb.size(); k++)
	if ( fabs( sb[k] - bb[j] ) < safety * trw ) { close = true; break; }

      if ( ! close ) continue;

      for (int i=0; i<trace.time.size(); i++)
	if ( trace.time[i] >= bb[j] - trw / 2.0 && trace.time[i] <= bb[j] + trw / 2.0 )
	  bkg[i] = sig[i] = false;

      ++ncorr;
    }

  if ( ncorr )
    {
      logger << "   safety pass excluded " << ncorr << " background edge(s) next to signal\n";
      trace.set_regions( bkg , sig );
    }
}


void autorange_t::apply( trace_t & trace )
{

  if ( analyte == "" ) analyte = trace.analytes[0];

  if ( ! trace.has_analyte( analyte ) )
    throw data_shape_error_t( "autorange analyte not found in " + trace.id + ": " + analyte );

  const std::vector<double> & v = trace.values( analyte );
  const std::vector<double> & time = trace.time;
  const int n = v.size();

  transitions.clear();

  thr = threshold( v );

  //
  // degenerate: a single distribution
  //

  if ( ! Helper::realnum( thr ) )
    {
      trace.set_regions( std::vector<bool>( n , true ) , std::vector<bool>( n , false ) );
      trace.warn( "autorange found no background/signal split in " + analyte + "; all samples set to background" );
      return;
    }

  // NaN goes to background
  std::vector<bool> bkg( n ) , sig( n );
  for (int i=0; i<n; i++)
    {
      sig[i] = v[i] >= thr;
      bkg[i] = ! sig[i];
    }

  //
  // transitions: gaussian fitted to the slope peak at each edge
  //

  std::vector<double> g = dsptools::fastgrad( v , gwin );
  for (int i=0; i<n; i++) g[i] = fabs( g[i] );

  int last_width = -1;

  for (int i=1; i<n; i++)
    {

      if ( bkg[i] == bkg[i-1] ) continue;

      const int z = i - 1;
      const int a = z - win > 0 ? z - win : 0 ;
      const int b = z + win < n ? z + win : n ;
      const int m = b - a;

      std::vector<double> tw( time.begin() + a , time.begin() + b );
      std::vector<double> gw( g.begin() + a , g.begin() + b );

      transition_t tr;
      tr.edge = z;

      int c = 0;
      const double gmax = MiscMath::max( gw , &c );

      if ( m < 4 || ! Helper::realnum( gmax ) )
	{
	  trace.warn( "could not isolate the transition at t=" + Helper::dbl2str( time[z] ) );
	  transitions.push_back( tr );
	  continue;
	}

      // bound the peak where the slope stops falling away on either side
      int lwr = c , upr = c;
      if ( m >= smwin )
	{
	  std::vector<double> d = dsptools::fastgrad( gw , smwin );
	  lwr = c - 1;
	  while ( lwr > 0 && d[lwr] > 0 ) --lwr;
	  upr = c + 1;
	  while ( upr < m - 1 && d[upr] < 0 ) ++upr;
	  if ( lwr < 0 ) lwr = 0;
	  if ( upr > m - 1 ) upr = m - 1;
	}

      bool okay = fit_transition( tw , gw , lwr , upr , &tr );

      if ( okay )
	last_width = upr - lwr;
      else if ( last_width > 0 )
	{
	  // once more, with the bounds of the previous transition
	  int lwr2 = c - last_width / 2;
	  if ( lwr2 < 0 ) lwr2 = 0;
	  int upr2 = lwr2 + last_width;
	  if ( upr2 > m - 1 ) upr2 = m - 1;
	  okay = fit_transition( tw , gw , lwr2 , upr2 , &tr );
	}

      if ( ! okay )
	trace.warn( "gaussian fit failed for the transition at t="
		    + Helper::dbl2str( time[z] ) + "; transition not removed" );

      transitions.push_back( tr );
    }

  int nfit = 0;

  for (int j=0; j<transitions.size(); j++)
    {
      const transition_t & tr = transitions[j];
      if ( ! tr.fitted ) continue;
      ++nfit;
      for (int i=0; i<n; i++)
	if ( time[i] > tr.lwr && time[i] < tr.upr )
	  bkg[i] = sig[i] = false;
    }

  trace.set_regions( bkg , sig );

  //
  // catch transitions the derivative method missed
  //

  safety_pass( trace );

  logger << "   threshold " << thr << ", "
	 << nfit << " of " << transitions.size() << " transition(s) fitted, "
	 << trace.n << " signal segment(s)\n";

}


void regions::autorange( trace_t & trace , const param_t & param )
{

  autorange_t ar( param );

  logger << "  autorange " << trace.id
	 << " (" << ( ar.analyte == "" ? trace.analytes[0] : ar.analyte )
	 << ", " << globals::stage( trace.focus_stage() ) << ")\n";

  ar.apply( trace );

  trace.params[ "autorange" ] = param;

}
