
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

#ifndef __LATRACE_PARAM_H__
#define __LATRACE_PARAM_H__

#include <string>
#include <map>
#include <vector>

//
// key=value options attached to a command
//  'flag' on its own is stored as flag=__null__
//  'key+=value' appends to a comma-delimited list
//

struct param_t
{

  void add( const std::string & option , const std::string & value = "" );

  int size() const { return opt.size(); }

  // a single 'key=value' or 'flag' token
  void parse( const std::string & s );

  // one 'key=value' per line, split on the first '=' only, i.e. the
  // output of dump( "" , "\n" ); values may hold spaces or quotes
  void parse_lines( const std::string & s );

  bool has( const std::string & s ) const { return opt.find( s ) != opt.end(); }

  // F if absent, T if a bare flag, else Helper::yesno()
  bool yesno( const std::string & s ) const;

  // unquoted value, or "" if absent
  std::string value( const std::string & s , const bool uppercase = false ) const;

  // as value(), but halt() if absent or not numeric
  std::string requires( const std::string & s , const bool uppercase = false ) const;
  int requires_int( const std::string & s ) const;
  double requires_dbl( const std::string & s ) const;

  int get_int( const std::string & s , int d ) const { return has( s ) ? requires_int( s ) : d; }
  double get_dbl( const std::string & s , double d ) const { return has( s ) ? requires_dbl( s ) : d; }

  std::string dump( const std::string & indent = "  " , const std::string & delim = "\n" ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string & delim = "," , const bool uppercase = false ) const;

  std::vector<double> dblvector( const std::string & k , const std::string & delim = "," ) const;

private:

  std::map<std::string,std::string> opt;

};

#endif
