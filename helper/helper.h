
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

#ifndef __LATRACE_HELPER_H__
#define __LATRACE_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <functional>
#include <cctype>
#include <locale>
#include <map>
#include <cmath>

namespace Helper
{

  //
  // strings
  //

  std::string toupper( const std::string & );

  // strip leading and trailing whitespace
  inline std::string lrtrim( const std::string & s )
  {
    const std::string ws = " \t\n\r\f\v";
    const size_t a = s.find_first_not_of( ws );
    if ( a == std::string::npos ) return "";
    return s.substr( a , s.find_last_not_of( ws ) - a + 1 );
  }

  // drop one enclosing quote (" or q2) at either end
  inline std::string unquote( const std::string & s , const char q2 = '"' )
  {
    if ( s.size() == 0 ) return s;
    const size_t a = s[0] == '"' || s[0] == q2;
    const size_t b = s.size() > a && ( s[ s.size() - 1 ] == '"' || s[ s.size() - 1 ] == q2 );
    return s.substr( a , s.size() - a - b );
  }

  std::string remove_all_quotes( const std::string & s , const char q2 = '"' );

  // 0, n(o), f(alse) or empty: F
  bool yesno( const std::string & );

  bool iequals( const std::string & a , const std::string & b );

  // is 'sub' found anywhere in 's' (an empty 'sub' matches everything)
  bool contains( const std::string & s , const std::string & sub );

  // elements joined by 'delim'
  template<typename T>
  std::string stringize( const T & t , const std::string & delim = "," )
  {
    std::stringstream ss;
    for (typename T::const_iterator tt = t.begin(); tt != t.end(); ++tt)
      ss << ( tt == t.begin() ? "" : delim ) << *tt;
    return ss.str();
  }


  //
  // errors, files
  //

  // calls globals::bail_function if set, then throws latrace_error_t
  void halt( const std::string & msg );

  bool fileExists( const std::string & );

  // leading ~ to $HOME
  std::string expand( const std::string & f );

  // as std::getline(), for any line ending
  std::istream & safe_getline( std::istream & is , std::string & t );


  //
  // numbers
  //

  bool realnum( double d );

  std::string int2str( int n );
  std::string dbl2str( double n );

  // F unless the whole string converts; nan, NaN and NA give NaN
  bool str2dbl( const std::string & , double * );
  bool str2int( const std::string & , int * );


  // tokenizers: split on any of 'delims'; with 'empty', an empty field
  // comes back as '.'; quoted_parse() does not split inside "..." or #...#

  std::vector<std::string> parse( const std::string & item , const std::string & delims = " \t\n" , bool empty = false );

  std::vector<std::string> quoted_parse( const std::string & item , const std::string & delims = " \t\n" , bool empty = false );

  std::vector<std::string> char_split( const std::string & s , const std::string & delims , bool empty = true );

  template <class T> std::set<T> vec2set( const std::vector<T> & x )
  {
    return std::set<T>( x.begin() , x.end() );
  }

}

#endif
