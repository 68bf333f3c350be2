
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

#ifndef __LATRACE_EXCEPTION_H__
#define __LATRACE_EXCEPTION_H__

#include <stdexcept>
#include <string>

//
// all fatal conditions raised by Helper::halt() or by the
// processing code are thrown as a latrace_error_t (or a subclass, where
// the caller needs to tell them apart)
//

struct latrace_error_t : public std::runtime_error
{
  explicit latrace_error_t( const std::string & msg ) : std::runtime_error( msg ) { }
};

// mismatched lengths, empty traces, bad windows, unknown analytes or stages
struct data_shape_error_t : public latrace_error_t
{
  explicit data_shape_error_t( const std::string & msg ) : latrace_error_t( msg ) { }
};

// adding a filter under an existing name
struct duplicate_name_error_t : public latrace_error_t
{
  explicit duplicate_name_error_t( const std::string & msg ) : latrace_error_t( msg ) { }
};

// removing/toggling an unknown filter or analyte
struct not_found_error_t : public latrace_error_t
{
  explicit not_found_error_t( const std::string & msg ) : latrace_error_t( msg ) { }
};

// malformed filter key: reports the offending token and its (0-based) position
struct invalid_expression_error_t : public latrace_error_t
{
  invalid_expression_error_t( const std::string & msg , const std::string & token , int pos )
    : latrace_error_t( msg + " at position " + std::to_string( pos ) + " ('" + token + "')" ) ,
      token( token ) , pos( pos ) { }

  std::string token;
  int pos;
};

#endif
