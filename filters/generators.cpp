
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

#include "filters/generators.h"
#include "trace/trace.h"
#include "stats/kde.h"
#include "stats/cluster.h"
#include "stats/eigen_ops.h"
#include "stats/statistics.h"
#include "optim/optimiser.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <memory>
#include <sstream>
#include <iomanip>
#include <cmath>

extern logger_t logger;

static std::string sci( double x )
{
  std::stringstream ss;
  ss << std::scientific << std::setprecision(3) << x;
  return ss.str();
}

static std::string join( const std::vector<std::string> & s , const std::string & d )
{
  std::string r;
  for (int i=0; i<s.size(); i++)
    r += ( i ? d : "" ) + s[i];
  return r;
}


std::vector<bool> filters::selection( trace_t & trace ,
				      const filt_selector_t & sel ,
				      const std::vector<std::string> & analytes )
{

  trace.check_analytes( analytes );

  std::vector<bool> ind = trace.filt.grab( sel , analytes );

  const analyte_map_t & d = trace.focus_data();
  analyte_map_t::const_iterator aa = d.begin();
  while ( aa != d.end() )
    {
      for (int i=0; i<ind.size(); i++)
	if ( ! Helper::realnum( aa->second[i] ) ) ind[i] = false;
      ++aa;
    }

  return ind;
}


//
// threshold
//

std::string filters::threshold( trace_t & trace ,
				const std::string & analyte ,
				const double t ,
				const bool above ,
				const filt_selector_t & sel ,
				const param_t & params )
{

  std::vector<bool> ind = selection( trace , sel , std::vector<std::string>( 1 , analyte ) );

  const std::vector<double> & v = trace.values( analyte );

  std::vector<bool> m( v.size() , false );
  for (int i=0; i<v.size(); i++)
    if ( ind[i] ) m[i] = above ? v[i] >= t : v[i] <= t ;

  const std::string mode = above ? "above" : "below" ;
  const std::string name = analyte + "_thresh_" + mode;

  trace.filt.add( name , m , "Keep " + mode + " " + sci( t ) + " " + analyte , params );

  return name;
}


void filters::threshold( trace_t & trace , const param_t & param )
{

  const std::string analyte = param.requires( "analyte" );
  const double t = param.requires_dbl( "threshold" );

  const std::string mode = param.has( "mode" ) ? param.value( "mode" ) : "above" ;
  if ( ! ( Helper::iequals( mode , "above" ) || Helper::iequals( mode , "below" ) ) )
    Helper::halt( "mode should be above or below" );

  const std::string name = threshold( trace , analyte , t , Helper::iequals( mode , "above" ) ,
				      filt_selector_t::from_param( param ) , param );

  logger << "  added " << name << " (" << Ranges::count( trace.filt.filter( name ).mask )
	 << " of " << trace.size() << " samples kept)\n";
}


//
// distribution
//

distribution_t filters::distribution( trace_t & trace ,
				      const std::string & analyte ,
				      const bandwidth_t rule ,
				      const double factor ,
				      const bool log_transform ,
				      const filt_selector_t & sel ,
				      const param_t & params )
{

  distribution_t res;

  std::vector<bool> ind = selection( trace , sel , std::vector<std::string>( 1 , analyte ) );

  const std::vector<double> & v = trace.values( analyte );

  if ( log_transform )
    for (int i=0; i<v.size(); i++)
      if ( ! ( v[i] > 0 ) ) ind[i] = false;

  std::vector<double> d;
  for (int i=0; i<v.size(); i++)
    if ( ind[i] ) d.push_back( log_transform ? log10( v[i] ) : v[i] );

  std::vector<int> mins;

  kde_t kde( d , rule , factor );

  const int ng = d.size() / 3;

  if ( kde.valid() && ng >= 3 )
    {
      res.grid = MiscMath::linspace( MiscMath::min( d ) , MiscMath::max( d ) , ng );
      res.density = kde.evaluate( res.grid );
      mins = MiscMath::local_minima( res.density );
    }

  if ( mins.size() == 0 )
    {
      const std::string name = analyte + "_distribution_failed";
      trace.filt.add( name , ind , analyte + " is within a single distribution. No data removed." , params );
      res.names.push_back( name );
      trace.warn( "distribution filter found a single distribution for " + analyte );
      return res;
    }

  for (int j=0; j<mins.size(); j++)
    res.limits.push_back( log_transform ? pow( 10.0 , res.grid[ mins[j] ] ) : res.grid[ mins[j] ] );

  // k limits -> k+1 bins
  const int nb = res.limits.size() + 1;
  for (int b=0; b<nb; b++)
    {
      std::vector<bool> m( v.size() , false );
      for (int i=0; i<v.size(); i++)
	{
	  if ( ! ind[i] ) continue;
	  const bool lo = b == 0 || v[i] >= res.limits[b-1];
	  const bool hi = b == nb - 1 || v[i] < res.limits[b];
	  m[i] = lo && hi;
	}

      std::string info = analyte + " distribution filter, ";
      info += b == 0 ? std::string( "-inf" ) : sci( res.limits[b-1] );
      info += " <= x < ";
      info += b == nb - 1 ? std::string( "inf" ) : sci( res.limits[b] );

      const std::string name = analyte + "_distribution_" + Helper::int2str( b + 1 );
      trace.filt.add( name , m , info , params );
      res.names.push_back( name );
    }

  return res;
}


void filters::distribution( trace_t & trace , const param_t & param )
{

  const std::string analyte = param.requires( "analyte" );

  double factor = 0;
  bandwidth_t rule = param.has( "bw" ) ? kde_t::rule( param.value( "bw" ) , &factor ) : BW_SCOTT ;

  bool log_transform = false;
  if ( param.has( "transform" ) )
    {
      if ( ! Helper::iequals( param.value( "transform" ) , "log" ) )
	Helper::halt( "transform should be 'log'" );
      log_transform = true;
    }

  distribution_t res = distribution( trace , analyte , rule , factor , log_transform ,
				     filt_selector_t::from_param( param ) , param );

  logger << "  added " << res.names.size() << " distribution filter(s) for " << analyte;
  for (int i=0; i<res.limits.size(); i++)
    logger << ( i ? ", " : "; limits " ) << res.limits[i];
  logger << "\n";
}


//
// clustering
//

std::vector<std::string> filters::clustering( trace_t & trace ,
					      const std::vector<std::string> & analytes ,
					      clusterer_t & method ,
					      const bool normalise ,
					      const bool include_time ,
					      const filt_selector_t & sel ,
					      const param_t & params )
{

  if ( analytes.size() == 0 )
    Helper::halt( "no analytes given for clustering" );

  std::vector<bool> ind = selection( trace , sel , analytes );

  if ( Ranges::count( ind ) == 0 )
    Helper::halt( "no samples left to cluster in " + trace.id );

  std::vector<std::vector<double> > cols;
  for (int a=0; a<analytes.size(); a++)
    cols.push_back( trace.values( analytes[a] ) );
  if ( include_time )
    cols.push_back( trace.time );

  Eigen::MatrixXd X = eigen_ops::make_matrix( cols , ind );

  if ( normalise || cols.size() > 1 )
    eigen_ops::scale( X , true , true , true );

  cluster_result_t res = method.fit( X );

  if ( res.note != "" )
    trace.warn( res.note );

  // rows of X -> samples
  std::vector<int> sampled;
  for (int i=0; i<ind.size(); i++)
    if ( ind[i] ) sampled.push_back( i );

  const std::string namebase = join( analytes , "-" ) + "_cluster-" + method.name();
  const std::string info = join( analytes , "-" ) + " cluster filter.";

  std::vector<std::string> names;

  std::map<int,std::vector<bool> >::const_iterator ll = res.labels.begin();
  while ( ll != res.labels.end() )
    {
      std::vector<bool> m( trace.size() , false );
      for (int r=0; r<sampled.size(); r++)
	m[ sampled[r] ] = ll->second[r];

      const std::string name = namebase + "_" + ( ll->first < 0 ? std::string( "noise" ) : Helper::int2str( ll->first ) );
      trace.filt.add( name , m , info , params );
      names.push_back( name );
      ++ll;
    }

  if ( res.core.size() )
    {
      std::vector<bool> m( trace.size() , false );
      for (int r=0; r<sampled.size(); r++)
	m[ sampled[r] ] = res.core[r];
      const std::string name = namebase + "_core";
      trace.filt.add( name , m , info , params );
      names.push_back( name );
    }

  return names;
}


void filters::clustering( trace_t & trace , const param_t & param )
{

  std::vector<std::string> analytes = param.strvector( "analytes" );
  if ( analytes.size() == 0 ) Helper::halt( "analytes required" );

  const std::string m = param.has( "method" ) ? param.value( "method" ) : "meanshift" ;

  std::unique_ptr<clusterer_t> method( clusterer_t::create( m , param , trace.size() ) );

  const bool normalise = param.has( "normalise" ) ? param.yesno( "normalise" ) : true ;
  const bool include_time = param.has( "include_time" ) && param.yesno( "include_time" );

  std::vector<std::string> names = clustering( trace , analytes , *method , normalise , include_time ,
					       filt_selector_t::from_param( param ) , param );

  logger << "  added " << names.size() << " " << method->name() << " cluster filter(s)\n";
}


//
// correlation
//

std::string filters::correlation( trace_t & trace ,
				  const std::string & x ,
				  const std::string & y ,
				  int window ,
				  const double r_threshold ,
				  const double p_threshold ,
				  const filt_selector_t & sel ,
				  const param_t & params )
{

  std::vector<std::string> xy;
  xy.push_back( x );
  xy.push_back( y );

  // windows need a centre
  if ( window % 2 == 0 ) ++window;

  if ( window < 3 )
    Helper::halt( "correlation window must be at least 3" );

  std::vector<bool> ind = selection( trace , sel , xy );

  std::vector<double> xv = trace.values( x );
  std::vector<double> yv = trace.values( y );

  const int n = xv.size();

  for (int i=0; i<n; i++)
    if ( ! ind[i] ) xv[i] = yv[i] = globals::nan;

  const int h = window / 2;

  std::vector<bool> m( n , false );

  int nflag = 0;

  for (int i=0; i<n; i++)
    {
      if ( ! ind[i] ) continue;

      m[i] = true;

      // windows that do not fit, or have gaps, are kept
      if ( i - h < 0 || i + h >= n ) continue;

      bool gap = false;
      for (int j=i-h; j<=i+h; j++)
	if ( ! ( Helper::realnum( xv[j] ) && Helper::realnum( yv[j] ) ) ) { gap = true; break; }
      if ( gap ) continue;

      double r = 0;
      if ( ! Statistics::pearson( &xv[i-h] , &yv[i-h] , window , &r ) ) continue;

      const double p = Statistics::pearson_pvalue( r , window );

      if ( fabs( r ) > r_threshold && p < p_threshold )
	{
	  m[i] = false;
	  ++nflag;
	}
    }

  const std::string name = x + "-" + y + "_corr";

  trace.filt.add( name , m , x + " vs. " + y + " correlation filter." , params );

  trace.filt.off( name );
  trace.filt.on( name , std::vector<std::string>( 1 , y ) );

  return name;
}


void filters::correlation( trace_t & trace , const param_t & param )
{

  const std::string x = param.requires( "x" );
  const std::string y = param.requires( "y" );
  const int window = param.requires_int( "window" );

  const std::string name = correlation( trace , x , y , window ,
					param.get_dbl( "r" , 0.9 ) ,
					param.get_dbl( "p" , 0.05 ) ,
					filt_selector_t::from_param( param ) , param );

  logger << "  added " << name << " (" << trace.size() - Ranges::count( trace.filt.filter( name ).mask )
	 << " samples flagged), on for " << y << " only\n";
}


//
// optimiser
//

std::string filters::optimise( trace_t & trace ,
			       const std::vector<std::string> & analytes ,
			       const int min_points ,
			       const threshold_mode_t mode ,
			       const std::vector<double> & weights ,
			       const double mean_threshold ,
			       const double sd_threshold ,
			       const filt_selector_t & sel ,
			       const param_t & params )
{

  if ( ! trace.autoranged() )
    Helper::halt( "trace " + trace.id + " has no signal segments; run autorange first" );

  std::vector<bool> ind = selection( trace , sel , analytes );

  std::vector<bool> m( trace.size() , false );

  for (int s=1; s<=trace.n; s++)
    {
      analyte_map_t d;
      for (int a=0; a<analytes.size(); a++)
	{
	  std::vector<double> v = trace.values( analytes[a] );
	  for (int i=0; i<v.size(); i++)
	    if ( trace.ns[i] != s || ! ind[i] ) v[i] = globals::nan;
	  d[ analytes[a] ] = v;
	}

      optimise_result_t res = optim::signal_optimiser( d , analytes , min_points , mode , weights ,
						       mean_threshold , sd_threshold );

      if ( ! res.found )
	{
	  trace.warn( "optimiser found no window in segment " + Helper::int2str( s ) + ": " + res.note );
	  continue;
	}

      logger << "   segment " << s << ": " << res.width << " points from t="
	     << trace.time[ res.lwr ] << " to " << trace.time[ res.upr ] << "\n";

      for (int i=0; i<m.size(); i++)
	if ( res.mask[i] ) m[i] = true;
    }

  const std::string name = "optimise";

  trace.filt.add( name , m , "Optimised selection on " + join( analytes , ", " ) , params );

  return name;
}


void filters::optimise( trace_t & trace , const param_t & param )
{

  std::vector<std::string> analytes = param.strvector( "analytes" );
  if ( analytes.size() == 0 ) Helper::halt( "analytes required" );

  threshold_mode_t mode = THRESH_KDE_FIRST_MAX;
  double mt = 0 , st = 0;

  if ( param.has( "mean_threshold" ) || param.has( "sd_threshold" ) )
    {
      mode = THRESH_EXPLICIT;
      mt = param.requires_dbl( "mean_threshold" );
      st = param.requires_dbl( "sd_threshold" );
    }
  else if ( param.has( "mode" ) )
    mode = globals::threshold_mode( param.value( "mode" ) );

  std::vector<double> weights;
  if ( param.has( "weights" ) ) weights = param.dblvector( "weights" );

  logger << "  optimising " << trace.id << " on " << join( analytes , ", " )
	 << " (" << globals::threshold_mode( mode ) << ")\n";

  optimise( trace , analytes ,
	    param.get_int( "min_points" , globals::optimise_min_points ) ,
	    mode , weights , mt , st ,
	    filt_selector_t::from_param( param ) , param );

}
