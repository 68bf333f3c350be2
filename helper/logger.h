
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

#ifndef __LATRACE_LOGGER_H__
#define __LATRACE_LOGGER_H__

#include <iostream>
#include <fstream>
#include <string>
#include <ctime>

#include "defs/defs.h"

//
// console log, optionally mirrored to a file; a single global instance
// 'logger' is defined in globals.cpp
//

class logger_t
{

 public:

  logger_t( const std::string & header , std::ostream & out = std::cerr )
    : header( header ) , out( out ) , is_off( false ) , nwarn( 0 )
  { }

  ~logger_t() { stop_writing_log(); }

  // not in silent or API mode
  void write_log( const std::string & filename )
  {
    if ( is_off || globals::silent || globals::api_mode ) return;
    stop_writing_log();
    file.open( filename.c_str() );
  }

  void stop_writing_log()
  {
    if ( file.is_open() ) file.close();
  }

  void off() { out.flush(); stop_writing_log(); is_off = true; }

  void banner( const std::string & version , const std::string & date )
  {
    if ( is_off || globals::silent ) return;
    emit( rule( '=' )
	  + header + " | " + version + ", " + date + " | starting " + now() + " +++\n"
	  + rule( '=' ) );
  }

  void closeout()
  {
    if ( is_off || globals::silent || globals::api_mode ) return;
    emit( rule( '-' ) + "+++ latrace | finishing " + now() + "                    +++\n" + rule( '=' ) );
    stop_writing_log();
  }

  // counted even when output is off
  void warning( const std::string & msg )
  {
    ++nwarn;
    if ( is_off || globals::silent ) return;
    emit( " ** warning: " + msg + " **\n" );
  }

  int n_warnings() const { return nwarn; }

  template<typename T>
  logger_t & operator<< ( const T & data )
  {
    if ( is_off || globals::silent ) return *this;
    out << data;
    if ( file.is_open() ) file << data;
    return *this;
  }

 private:

  void emit( const std::string & s )
  {
    out << s;
    out.flush();
    if ( file.is_open() ) file << s;
  }

  static std::string rule( const char c )
  {
    return std::string( 67 , c ) + "\n";
  }

  static std::string now()
  {
    time_t rawtime;
    time( &rawtime );
    char buf[50];
    strftime( buf , sizeof(buf) , "%d-%b-%Y %H:%M:%S" , localtime( &rawtime ) );
    return buf;
  }

  const std::string header;

  std::ostream & out;

  std::ofstream file;

  bool is_off;

  int nwarn;

};

#endif
