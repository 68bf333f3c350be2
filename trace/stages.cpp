
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

#include "trace/stages.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <Eigen/Dense>

#include <limits>

extern logger_t logger;

analyte_map_t Stages::select( const analyte_map_t & in , const std::vector<bool> & mask )
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  analyte_map_t out;
  analyte_map_t::const_iterator aa = in.begin();
  while ( aa != in.end() )
    {
      if ( aa->second.size() != mask.size() )
	throw data_shape_error_t( "mask does not match analyte " + aa->first );
      std::vector<double> v = aa->second;
      for (int i=0; i<v.size(); i++)
	if ( ! mask[i] ) v[i] = nan;
      out[ aa->first ] = v;
      ++aa;
    }
  return out;
}


// least-squares polynomial of the finite (t,y) pairs, evaluated at every t
static std::vector<double> polyfit_eval( const std::vector<double> & t ,
					 const std::vector<double> & y ,
					 const int degree )
{
  const int n = t.size();

  std::vector<int> use;
  for (int i=0; i<n; i++)
    if ( Helper::realnum( y[i] ) ) use.push_back( i );

  if ( use.size() <= degree )
    Helper::halt( "too few background points for a degree " + Helper::int2str( degree ) + " polynomial" );

  Eigen::MatrixXd X( use.size() , degree + 1 );
  Eigen::VectorXd Y( use.size() );
  for (int r=0; r<use.size(); r++)
    {
      double p = 1;
      for (int d=0; d<=degree; d++) { X(r,d) = p; p *= t[ use[r] ]; }
      Y[r] = y[ use[r] ];
    }

  Eigen::VectorXd b = X.colPivHouseholderQr().solve( Y );

  std::vector<double> fit( n );
  for (int i=0; i<n; i++)
    {
      double p = 1 , s = 0;
      for (int d=0; d<=degree; d++) { s += b[d] * p; p *= t[i]; }
      fit[i] = s;
    }
  return fit;
}


analyte_map_t Stages::bkg_subtract( const analyte_map_t & signal ,
				    const analyte_map_t & background ,
				    const std::vector<double> & time ,
				    const int degree )
{
  analyte_map_t out;
  analyte_map_t::const_iterator aa = signal.begin();
  while ( aa != signal.end() )
    {
      analyte_map_t::const_iterator bb = background.find( aa->first );
      if ( bb == background.end() )
	throw data_shape_error_t( "no background for analyte " + aa->first );

      std::vector<double> v = aa->second;

      if ( degree < 0 )
	{
	  const double m = MiscMath::nanmean( bb->second );
	  for (int i=0; i<v.size(); i++) v[i] -= m;
	}
      else
	{
	  std::vector<double> fit = polyfit_eval( time , bb->second , degree );
	  for (int i=0; i<v.size(); i++) v[i] -= fit[i];
	}

      out[ aa->first ] = v;
      ++aa;
    }
  return out;
}


analyte_map_t Stages::ratio( const analyte_map_t & in , const std::string & denominator )
{
  analyte_map_t::const_iterator dd = in.find( denominator );
  if ( dd == in.end() )
    throw data_shape_error_t( "denominator analyte not found: " + denominator );

  const std::vector<double> den = dd->second;

  analyte_map_t out;
  analyte_map_t::const_iterator aa = in.begin();
  while ( aa != in.end() )
    {
      std::vector<double> v = aa->second;
      for (int i=0; i<v.size(); i++) v[i] /= den[i];
      out[ aa->first ] = v;
      ++aa;
    }
  return out;
}


void Stages::separate( trace_t & trace , const std::vector<std::string> & analytes )
{

  trace.check_analytes( analytes );

  const stage_t focus = trace.focus_stage();

  analyte_map_t sig = select( trace.focus_data() , trace.sig );
  analyte_map_t bkg = select( trace.focus_data() , trace.bkg );

  // analytes not asked for are carried over unchanged
  if ( analytes.size() )
    {
      std::set<std::string> keep = Helper::vec2set( analytes );
      for (int a=0; a<trace.analytes.size(); a++)
	if ( keep.find( trace.analytes[a] ) == keep.end() )
	  {
	    sig[ trace.analytes[a] ] = trace.values( trace.analytes[a] );
	    bkg[ trace.analytes[a] ] = trace.values( trace.analytes[a] );
	  }
    }

  trace.set_stage( SIGNAL , sig , false );
  trace.set_stage( BACKGROUND , bkg , false );

  // focus is left where it was
  trace.set_focus( focus );

}


void Stages::bkg_correct( trace_t & trace , const param_t & param )
{

  int degree = -1;
  if ( param.has( "mode" ) && ! Helper::iequals( param.value( "mode" ) , "constant" ) )
    {
      degree = param.requires_int( "mode" );
      if ( degree < 0 ) Helper::halt( "mode should be 'constant' or a polynomial degree >= 0" );
    }

  separate( trace );

  analyte_map_t sub = bkg_subtract( trace.stage( SIGNAL ) , trace.stage( BACKGROUND ) ,
				    trace.time , degree );

  trace.set_stage( BKGSUB , sub );

  trace.params[ "bkg_correct" ] = param;

  logger << "  " << trace.id << ": background corrected ("
	 << ( degree < 0 ? std::string( "constant" ) : "degree " + Helper::int2str( degree ) )
	 << ")\n";
}


void Stages::ratio( trace_t & trace , const param_t & param )
{

  const std::string denominator = param.requires( "denom" );

  if ( ! trace.has_analyte( denominator ) )
    throw data_shape_error_t( "denominator analyte not found: " + denominator );

  stage_t from = param.has( "stage" ) ? globals::stage( param.value( "stage" ) ) : BKGSUB ;

  trace.set_stage( RATIOS , ratio( trace.stage( from ) , denominator ) );

  trace.params[ "ratio" ] = param;

  logger << "  " << trace.id << ": ratios to " << denominator
	 << " from " << globals::stage( from ) << "\n";
}
