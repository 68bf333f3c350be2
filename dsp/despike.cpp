
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

#include "dsp/despike.h"
#include "dsp/rolling.h"
#include "trace/trace.h"
#include "stats/fit.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <cmath>
#include <limits>

extern logger_t logger;

//
// spike filter (count statistics)
//

std::vector<double> dsptools::spike_filter( const std::vector<double> & x ,
					    const int win ,
					    const double nlim ,
					    int * nreplaced )
{

  const int n = x.size();

  if ( nreplaced != NULL ) *nreplaced = 0;

  std::vector<double> r = x;

  if ( n < 3 ) return r;

  const double nan = std::numeric_limits<double>::quiet_NaN();

  // local mean over the whole window, the point itself included; NaN at the edges
  std::vector<double> rmean = rolling_mean( x , win , nan );

  int cnt = 0;

  for (int i=1; i<n-1; i++)
    {
      const double m = rmean[i];
      if ( ! Helper::realnum( m ) || m < 0 ) continue;

      const double lim = m + nlim * sqrt( m );

      if ( x[i] > lim )
	{
	  // mean of the two original neighbours
	  const double a = x[i-1] , b = x[i+1];
	  if ( a == a && b == b ) r[i] = 0.5 * ( a + b );
	  else if ( a == a ) r[i] = a;
	  else if ( b == b ) r[i] = b;
	  else continue;
	  ++cnt;
	}
    }

  if ( nreplaced != NULL ) *nreplaced = cnt;

  return r;
}


//
// exponential decay filter
//

std::vector<double> dsptools::expdecay_filter( const std::vector<double> & x ,
					       const double k ,
					       const double dt ,
					       int * nreplaced )
{

  if ( ! ( k < 0 ) )
    Helper::halt( "decay exponent must be negative, not " + Helper::dbl2str( k ) );

  if ( ! ( dt > 0 ) )
    Helper::halt( "time step must be positive, not " + Helper::dbl2str( dt ) );

  const int n = x.size();

  if ( nreplaced != NULL ) *nreplaced = 0;

  std::vector<double> r = x;

  const double f = exp( k * dt );

  int cnt = 0;

  // the following sample can fall no lower than x[i] * exp( k dt )
  for (int i=1; i<n-1; i++)
    {
      if ( x[i+1] < x[i] * f )
	{
	  const double a = x[i-1] , b = x[i+1];
	  if ( a != a && b != b ) continue;
	  r[i] = a != a ? b : ( b != b ? a : 0.5 * ( a + b ) );
	  ++cnt;
	}
    }

  if ( nreplaced != NULL ) *nreplaced = cnt;

  return r;
}


//
// DESPIKE command
//

void dsptools::despike( trace_t & trace , const param_t & param )
{

  const bool do_spike = param.has( "spike" ) ? param.yesno( "spike" ) : true ;

  const int win = param.get_int( "win" , globals::despike_win );

  const double nlim = param.get_dbl( "nlim" , globals::despike_nlim );

  const bool do_decay = param.has( "exponent" );

  const double k = do_decay ? param.requires_dbl( "exponent" ) : 0 ;

  const double dt = param.has( "tstep" ) ? param.requires_dbl( "tstep" ) : trace.dt() ;

  if ( do_decay && ! ( k < 0 ) )
    Helper::halt( "exponent must be negative" );

  if ( do_decay && ! ( dt > 0 ) )
    Helper::halt( "tstep must be positive" );

  logger << "  despiking " << trace.id << " (" << globals::stage( trace.focus_stage() ) << ")";
  if ( do_spike ) logger << ", spike filter win=" << win << " nlim=" << nlim;
  if ( do_decay ) logger << ", decay filter exponent=" << k << " tstep=" << dt;
  logger << "\n";

  analyte_map_t out;

  for (int a=0; a<trace.analytes.size(); a++)
    {
      const std::string & analyte = trace.analytes[a];

      std::vector<double> v = trace.values( analyte );

      int nspike = 0 , ndecay = 0;

      if ( do_spike )
	v = spike_filter( v , win , nlim , &nspike );

      if ( do_decay )
	v = expdecay_filter( v , k , dt , &ndecay );

      if ( nspike || ndecay )
	logger << "   " << analyte << ": replaced " << nspike << " spike(s), "
	       << ndecay << " decay point(s)\n";

      out[ analyte ] = v;
    }

  trace.set_stage( DESPIKED , out );

  trace.params[ "despike" ] = param;

}



//
// decay exponent from washout tails
//

static std::vector<double> normalise( const std::vector<double> & x , bool * ok )
{
  const double mn = MiscMath::min( x );
  std::vector<double> r( x.size() );
  for (int i=0; i<x.size(); i++) r[i] = x[i] - mn;
  const double mx = MiscMath::max( r );
  *ok = Helper::realnum( mx ) && mx > 0;
  if ( *ok )
    for (int i=0; i<r.size(); i++) r[i] /= mx;
  return r;
}

// index where the first run of large drops begins/ends
static int findtrim( const std::vector<double> & tr , double lim )
{
  const int n = tr.size();
  std::vector<double> d( n );
  for (int i=0; i<n-1; i++) d[i] = tr[i] - tr[i+1];
  d[n-1] = tr[n-1];

  if ( lim < 0 ) lim = 0.5 * MiscMath::max( d );

  std::vector<bool> ind( n );
  for (int i=0; i<n; i++) ind[i] = d[i] >= lim;

  for (int i=0; i<n; i++)
    if ( ind[i] != ind[ ( i + 1 ) % n ] ) return i;

  return 0;
}


expcoef_t dsptools::estimate_decay( const std::vector<trace_t*> & standards ,
				    const std::vector<std::string> & analytes ,
				    const double nsd_below ,
				    const double trimlim )
{

  if ( analytes.size() == 0 )
    Helper::halt( "no analytes given for the decay estimate" );

  expcoef_t res;

  std::vector<double> times , trans;

  for (int a=0; a<analytes.size(); a++)
    for (int s=0; s<standards.size(); s++)
      {
	const trace_t & tr = *standards[s];

	if ( ! tr.autoranged() )
	  Helper::halt( "standard " + tr.id + " has not been autoranged" );

	const std::vector<double> & v = tr.values( analytes[a] );
	const double dt = tr.dt();
	const int n = tr.size();

	// washouts: transition runs entered from signal and left into background

	int i = 1;
	while ( i < n - 1 )
	  {
	    if ( ! tr.trn[i] ) { ++i; continue; }
	    int j = i;
	    while ( j + 1 < n && tr.trn[j+1] ) ++j;

	    const bool washout = i > 0 && j < n - 1 && tr.sig[i-1] && tr.bkg[j+1];

	    const int a0 = i;
	    const int a1 = j;
	    i = j + 1;

	    if ( ! washout ) continue;
	    if ( a1 - a0 + 1 < 4 ) continue;

	    bool ok = false;
	    std::vector<double> seg( v.begin() + a0 , v.begin() + a1 + 1 );
	    seg = normalise( seg , &ok );
	    if ( ! ok ) continue;

	    std::vector<double> sm = fastsmooth( seg , 3 );
	    sm[0] = sm[1];

	    const int trim = findtrim( sm , trimlim ) + 2;
	    if ( trim >= (int)seg.size() - 1 ) continue;

	    std::vector<double> tail( seg.begin() + trim , seg.end() );
	    tail = normalise( tail , &ok );
	    if ( ! ok ) continue;

	    for (int t=0; t<tail.size(); t++)
	      {
		if ( ! Helper::realnum( tail[t] ) ) continue;
		times.push_back( t * dt );
		trans.push_back( tail[t] );
	      }

	    ++res.ntails;
	  }
      }

  if ( res.ntails == 0 )
    Helper::halt( "no usable washout transitions in the standards; supply the exponent directly" );

  res.npoints = times.size();

  // minimum envelope per time step
  const double dt = standards[0]->dt();
  std::map<long,double> envelope;
  for (int i=0; i<times.size(); i++)
    {
      const long bin = lround( times[i] / dt );
      std::map<long,double>::iterator ee = envelope.find( bin );
      if ( ee == envelope.end() ) envelope[ bin ] = trans[i];
      else if ( trans[i] < ee->second ) ee->second = trans[i];
    }

  std::vector<double> ti , tr;
  std::map<long,double>::const_iterator ee = envelope.begin();
  while ( ee != envelope.end() )
    {
      ti.push_back( ee->first * dt );
      tr.push_back( ee->second );
      ++ee;
    }

  fit_result_t fit = lmfit::exponential( ti , tr , -1.0 );

  if ( ! fit.converged )
    Helper::halt( "could not fit a decay exponent to the washout transitions; supply the exponent directly" );

  res.k = fit.par[0];
  res.sigma_k = fit.se[0];
  res.coef = res.k - nsd_below * res.sigma_k;

  // goodness of fit over every pooled point
  const double m = MiscMath::mean( trans );
  double sstot = 0 , ssfit = 0;
  for (int i=0; i<trans.size(); i++)
    {
      sstot += ( trans[i] - m ) * ( trans[i] - m );
      const double p = exp( res.k * times[i] );
      ssfit += ( trans[i] - p ) * ( trans[i] - p );
    }
  res.r2 = sstot > 0 ? 1 - ssfit / sstot : 0 ;

  logger << "  decay exponent: " << res.k << " (SE " << res.sigma_k << ", R2 "
	 << res.r2 << ") from " << res.ntails << " washout(s); using " << res.coef << "\n";

  return res;
}
