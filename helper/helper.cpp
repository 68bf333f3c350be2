
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

#include "helper/helper.h"
#include "helper/exception.h"
#include "defs/defs.h"

#include <cstdio>
#include <cstdlib>
#include <limits>
#include <cerrno>
#include <climits>

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes( const std::string & s , const char q2 )
{
  std::string r;
  r.reserve( s.size() );
  for (int i=0; i<s.size(); i++)
    if ( s[i] != '"' && s[i] != q2 ) r += s[i];
  return r;
}

bool Helper::yesno( const std::string & s )
{
  // 0, n(o), f(alse), in any case, or empty: no
  if ( s.size() == 0 ) return false;
  const char c = std::tolower( s[0] );
  return ! ( c == '0' || c == 'n' || c == 'f' );
}

bool Helper::iequals( const std::string & a , const std::string & b )
{
  if ( a.size() != b.size() ) return false;
  for (int i=0; i<a.size(); i++)
    if ( std::tolower( a[i] ) != std::tolower( b[i] ) ) return false;
  return true;
}

bool Helper::contains( const std::string & s , const std::string & sub )
{
  if ( sub == "" ) return true;
  return s.find( sub ) != std::string::npos;
}


void Helper::halt( const std::string & msg )
{

  // a wrapper may want to clean up, or report, before the throw
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  // main() (or the library user) decides whether this is fatal
  throw latrace_error_t( msg );

}


std::string Helper::expand( const std::string & f )
{
  // ~ only as the first character: home folder
  if ( f.size() == 0 || f[0] != '~' ) return f;
  const char * home = getenv( "HOME" );
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}

bool Helper::fileExists( const std::string & f )
{
  FILE * file = fopen( f.c_str() , "r" );
  if ( file == NULL ) return false;
  fclose( file );
  return true;
}

std::istream & Helper::safe_getline( std::istream & is , std::string & t )
{
  t.clear();

  // \n, \r or \r\n line endings (instrument exports use all three)

  std::istream::sentry se( is , true );
  std::streambuf * sb = is.rdbuf();

  while ( 1 )
    {
      const int c = sb->sbumpc();

      if ( c == '\n' ) return is;

      if ( c == '\r' )
	{
	  if ( sb->sgetc() == '\n' ) sb->sbumpc();
	  return is;
	}

      if ( c == std::streambuf::traits_type::eof() )
	{
	  // a last line without a line ending is still a line
	  if ( t.empty() ) is.setstate( std::ios::eofbit );
	  return is;
	}

      t += (char)c;
    }
}


bool Helper::realnum( double d )
{
  return std::isfinite( d );
}

std::string Helper::int2str( int n )
{
  std::ostringstream s2;
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str( double n )
{
  std::ostringstream s2;
  s2 << n;
  return s2.str();
}

bool Helper::str2dbl( const std::string & s , double * d )
{
  // missing values
  if ( s == "nan" || s == "NaN" || s == "NA" )
    {
      *d = std::numeric_limits<double>::quiet_NaN();
      return true;
    }
  if ( s.size() == 0 ) return false;
  char * end = NULL;
  const double x = strtod( s.c_str() , &end );
  if ( *end != '\0' ) return false;
  *d = x;
  return true;
}

bool Helper::str2int( const std::string & s , int * i )
{
  if ( s.size() == 0 ) return false;
  char * end = NULL;
  errno = 0;
  const long x = strtol( s.c_str() , &end , 10 );
  if ( *end != '\0' || errno == ERANGE || x < INT_MIN || x > INT_MAX ) return false;
  *i = (int)x;
  return true;
}


//
// tokenizers
//

static std::vector<std::string> split( const std::string & s ,
				       const std::string & delims ,
				       const bool quoted ,
				       const bool empty )
{

  std::vector<std::string> strs;

  if ( s.size() == 0 ) return strs;

  int p = 0;

  bool in_quote = false;

  for (int j=0; j<s.size(); j++)
    {

      if ( quoted && ( s[j] == '"' || s[j] == '#' ) ) in_quote = ! in_quote;

      if ( in_quote || delims.find( s[j] ) == std::string::npos ) continue;

      if ( j == p )
	{
	  if ( empty ) strs.push_back( "." );
	  ++p;
	}
      else
	{
	  strs.push_back( s.substr( p , j - p ) );
	  p = j + 1;
	}
    }

  if ( p < s.size() )
    strs.push_back( s.substr( p ) );
  else if ( empty )
    strs.push_back( "." );

  return strs;
}

std::vector<std::string> Helper::parse( const std::string & item , const std::string & delims , bool empty )
{
  return split( item , delims , false , empty );
}

std::vector<std::string> Helper::quoted_parse( const std::string & item , const std::string & delims , bool empty )
{
  return split( item , delims , true , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const std::string & delims , bool empty )
{
  return split( s , delims , false , empty );
}
