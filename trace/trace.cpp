
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

#include "trace/trace.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

extern logger_t logger;

trace_t::trace_t( const std::string & id ,
		  const std::vector<double> & time ,
		  const std::vector<std::string> & analytes )
  : id( id ) , time( time ) , analytes( analytes ) ,
    filt( time.size() , analytes ) ,
    focus( RAWDATA ) , has_ranges( false )
{

  if ( time.size() == 0 )
    throw data_shape_error_t( "trace " + id + " has an empty time axis" );

  if ( analytes.size() == 0 )
    throw data_shape_error_t( "trace " + id + " has no analytes" );

  n = 0;

  // until autorange is run, everything is background
  std::vector<bool> none( time.size() , false );
  bkg = std::vector<bool>( time.size() , true );
  sig = none;
  trn = none;
  ns = std::vector<int>( time.size() , 0 );

}


void trace_t::set_stage( stage_t s , const analyte_map_t & d , bool make_focus )
{

  const int sz = time.size();

  for (int a=0; a<analytes.size(); a++)
    {
      analyte_map_t::const_iterator dd = d.find( analytes[a] );
      if ( dd == d.end() )
	throw data_shape_error_t( "stage " + globals::stage( s ) + " of " + id + " is missing analyte " + analytes[a] );
      if ( dd->second.size() != sz )
	throw data_shape_error_t( "analyte " + analytes[a] + " in " + id + " has "
				  + Helper::int2str( (int)dd->second.size() ) + " values, expecting "
				  + Helper::int2str( sz ) );
    }

  if ( d.size() != analytes.size() )
    {
      analyte_map_t::const_iterator dd = d.begin();
      while ( dd != d.end() )
	{
	  if ( ! has_analyte( dd->first ) )
	    throw data_shape_error_t( "unknown analyte " + dd->first + " in stage " + globals::stage( s ) );
	  ++dd;
	}
    }

  data[ s ] = d;

  if ( make_focus ) focus = s;

}


void trace_t::set_focus( stage_t s )
{
  if ( ! has_stage( s ) )
    throw data_shape_error_t( "stage " + globals::stage( s ) + " not available for " + id );
  focus = s;
}


const analyte_map_t & trace_t::stage( stage_t s ) const
{
  std::map<stage_t,analyte_map_t>::const_iterator ss = data.find( s );
  if ( ss == data.end() )
    throw data_shape_error_t( "stage " + globals::stage( s ) + " not available for " + id );
  return ss->second;
}


const std::vector<double> & trace_t::values( const std::string & analyte ) const
{
  return values( focus , analyte );
}


const std::vector<double> & trace_t::values( stage_t s , const std::string & analyte ) const
{
  const analyte_map_t & d = stage( s );
  analyte_map_t::const_iterator aa = d.find( analyte );
  if ( aa == d.end() )
    throw data_shape_error_t( "analyte not found in " + id + ": " + analyte );
  return aa->second;
}


std::vector<stage_t> trace_t::stages() const
{
  std::vector<stage_t> r;
  std::map<stage_t,analyte_map_t>::const_iterator ss = data.begin();
  while ( ss != data.end() )
    {
      r.push_back( ss->first );
      ++ss;
    }
  return r;
}


bool trace_t::has_analyte( const std::string & a ) const
{
  for (int i=0; i<analytes.size(); i++)
    if ( analytes[i] == a ) return true;
  return false;
}


void trace_t::check_analytes( const std::vector<std::string> & a ) const
{
  for (int i=0; i<a.size(); i++)
    if ( ! has_analyte( a[i] ) )
      throw data_shape_error_t( "analyte not found in " + id + ": " + a[i] );
}


double trace_t::dt() const
{
  if ( time.size() < 2 ) throw data_shape_error_t( "trace " + id + " has fewer than two samples" );
  return time[1] - time[0];
}


void trace_t::set_regions( const std::vector<bool> & b , const std::vector<bool> & s , bool clear_edges )
{

  const int sz = time.size();

  if ( b.size() != sz || s.size() != sz )
    throw data_shape_error_t( "region masks do not match the length of " + id );

  bkg = b;
  sig = s;

  // a sample flagged as both becomes transition
  for (int i=0; i<sz; i++)
    if ( bkg[i] && sig[i] ) bkg[i] = sig[i] = false;

  if ( clear_edges )
    {
      bkg[0] = bkg[sz-1] = false;
      sig[0] = sig[sz-1] = false;
    }

  trn.resize( sz );
  for (int i=0; i<sz; i++)
    trn[i] = ! ( bkg[i] || sig[i] );

  bkgrng = Ranges::mask_to_ranges( bkg , time );
  sigrng = Ranges::mask_to_ranges( sig , time );
  trnrng = Ranges::mask_to_ranges( trn , time );

  ns = Ranges::enumerate( sig , &n );

  has_ranges = true;

}


void trace_t::load_ranges( const range_list_t & b , const range_list_t & s )
{
  set_regions( Ranges::ranges_to_mask( b , time ) ,
	       Ranges::ranges_to_mask( s , time ) );
}


void trace_t::warn( const std::string & msg )
{
  diagnostics.push_back( msg );
  logger.warning( id + ": " + msg );
}
