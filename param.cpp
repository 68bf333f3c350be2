
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

#include "param.h"
#include "helper/helper.h"
#include "defs/defs.h"

#include <sstream>

void param_t::add( const std::string & option , const std::string & value )
{
  if ( option == "" ) return;

  // key+=value
  if ( option[ option.size() - 1 ] == '+' )
    {
      const std::string key = option.substr( 0 , option.size() - 1 );
      if ( key == "" ) return;
      std::map<std::string,std::string>::iterator ii = opt.find( key );
      if ( ii == opt.end() ) opt[ key ] = value;
      else ii->second += "," + value;
      return;
    }

  if ( has( option ) && ! globals::api_mode )
    Helper::halt( "option " + option + " given more than once" );

  opt[ option ] = value;
}

void param_t::parse( const std::string & s )
{
  // split on the first '=' only
  const std::vector<std::string> tok = Helper::quoted_parse( s , "=" );
  if ( tok.size() == 0 ) return;
  if ( tok.size() == 1 ) { add( tok[0] , "__null__" ); return; }
  std::string v = tok[1];
  for (int i=2; i<tok.size(); i++) v += "=" + tok[i];
  add( tok[0] , v );
}

void param_t::parse_lines( const std::string & s )
{
  const std::vector<std::string> lines = Helper::char_split( s , "\n" , false );
  for (int i=0; i<lines.size(); i++)
    {
      const std::string::size_type e = lines[i].find( '=' );
      if ( e == std::string::npos ) add( lines[i] , "__null__" );
      else add( lines[i].substr( 0 , e ) , lines[i].substr( e + 1 ) );
    }
}

bool param_t::yesno( const std::string & s ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.find( s );
  if ( ii == opt.end() ) return false;
  return ii->second == "__null__" || Helper::yesno( ii->second );
}

std::string param_t::value( const std::string & s , const bool uppercase ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.find( s );
  if ( ii == opt.end() ) return "";
  return Helper::remove_all_quotes( uppercase ? Helper::toupper( ii->second ) : ii->second );
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( ! has( s ) ) Helper::halt( "command requires option " + s );
  return value( s , uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  int r = 0;
  if ( ! Helper::str2int( requires( s ) , &r ) )
    Helper::halt( "option " + s + " requires an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  double r = 0;
  if ( ! Helper::str2dbl( requires( s ) , &r ) )
    Helper::halt( "option " + s + " requires a numeric value" );
  return r;
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::stringstream ss;
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  while ( ii != opt.end() )
    {
      if ( ii != opt.begin() ) ss << delim;
      ss << indent << ii->first;
      if ( ii->second != "__null__" ) ss << "=" << ii->second;
      ++ii;
    }
  return ss.str();
}

std::vector<std::string> param_t::strvector( const std::string & k , const std::string & delim , const bool uppercase ) const
{
  std::vector<std::string> r;
  if ( ! has( k ) ) return r;
  const std::vector<std::string> tok = Helper::quoted_parse( value( k , uppercase ) , delim );
  for (int i=0; i<tok.size(); i++) r.push_back( Helper::unquote( tok[i] ) );
  return r;
}

std::vector<double> param_t::dblvector( const std::string & k , const std::string & delim ) const
{
  std::vector<double> r;
  const std::vector<std::string> tok = strvector( k , delim );
  for (int i=0; i<tok.size(); i++)
    {
      double d = 0;
      if ( ! Helper::str2dbl( tok[i] , &d ) )
	Helper::halt( "option " + k + " requires numeric value(s)" );
      r.push_back( d );
    }
  return r;
}
