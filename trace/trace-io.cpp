
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

#include "trace/trace-io.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <fstream>

extern logger_t logger;

trace_t trace_io::load_csv( const std::string & f , const std::string & id0 )
{

  const std::string filename = Helper::expand( f );

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );

  std::string id = id0;
  if ( id == "" )
    {
      id = filename;
      size_t p = id.find_last_of( "/\\" );
      if ( p != std::string::npos ) id = id.substr( p + 1 );
      p = id.find_last_of( "." );
      if ( p != std::string::npos && p > 0 ) id = id.substr( 0 , p );
    }

  std::ifstream IN1( filename.c_str() , std::ios::in );

  trace_t trace = read_csv( IN1 , id );

  IN1.close();

  logger << "  read " << trace.id << " from " << filename << ": "
	 << trace.size() << " samples, "
	 << trace.analytes.size() << " analytes\n";

  return trace;
}


trace_t trace_io::read_csv( std::istream & IN1 , const std::string & id )
{

  std::vector<std::string> header;
  std::vector<double> time;
  std::vector<std::vector<double> > cols;

  int line = 0;

  while ( ! IN1.eof() )
    {
      std::string s;
      Helper::safe_getline( IN1 , s );
      ++line;

      if ( IN1.eof() && s == "" ) break;

      s = Helper::lrtrim( s );
      if ( s == "" || s[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::char_split( s , "," );

      if ( header.size() == 0 )
	{
	  if ( ! Helper::iequals( Helper::lrtrim( Helper::unquote( tok[0] ) ) , "Time" ) )
	    Helper::halt( "expecting a header line starting with Time, line " + Helper::int2str( line ) );
	  for (int j=1; j<tok.size(); j++)
	    header.push_back( Helper::lrtrim( Helper::unquote( tok[j] ) ) );
	  if ( header.size() == 0 )
	    throw data_shape_error_t( "no analyte columns in " + id );
	  cols.resize( header.size() );
	  continue;
	}

      if ( tok.size() != header.size() + 1 )
	throw data_shape_error_t( "expecting " + Helper::int2str( (int)header.size() + 1 )
				  + " columns, found " + Helper::int2str( (int)tok.size() )
				  + " on line " + Helper::int2str( line ) );

      double t;
      if ( ! Helper::str2dbl( Helper::lrtrim( tok[0] ) , &t ) )
	Helper::halt( "bad time value on line " + Helper::int2str( line ) + ": " + tok[0] );
      time.push_back( t );

      for (int j=1; j<tok.size(); j++)
	{
	  double x;
	  if ( ! Helper::str2dbl( Helper::lrtrim( tok[j] ) , &x ) )
	    Helper::halt( "bad value on line " + Helper::int2str( line ) + ": " + tok[j] );
	  cols[j-1].push_back( x );
	}
    }

  if ( header.size() == 0 )
    throw data_shape_error_t( "no header found for " + id );

  trace_t trace( id , time , header );

  analyte_map_t d;
  for (int j=0; j<header.size(); j++)
    d[ header[j] ] = cols[j];

  trace.set_stage( RAWDATA , d );

  return trace;
}


void trace_io::write_csv( const trace_t & trace , std::ostream & out )
{
  out << "Time";
  for (int a=0; a<trace.analytes.size(); a++)
    out << "," << trace.analytes[a];
  out << "\n";

  for (int i=0; i<trace.size(); i++)
    {
      out << trace.time[i];
      for (int a=0; a<trace.analytes.size(); a++)
	{
	  const double x = trace.values( trace.analytes[a] )[i];
	  out << ",";
	  if ( Helper::realnum( x ) ) out << x;
	  else out << "nan";
	}
      out << "\n";
    }
}
