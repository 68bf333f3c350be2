
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

#ifndef __LATRACE_SQLWRAP_H__
#define __LATRACE_SQLWRAP_H__

#include <string>
#include <set>

#include <sqlite3.h>

// raw bytes for a BLOB column; owns its copy
struct blob
{
  blob() { }
  explicit blob( const std::string & t ) : s( t ) { }

  const char * data() const { return s.data(); }
  int size() const { return s.size(); }
  const std::string & get_string() const { return s; }

  std::string s;
};


//
// thin wrapper around a sqlite3 handle; all failures halt()
//

class SQL {

 public:

  SQL() : db( NULL ) { }

  ~SQL() { close(); }

  bool open( const std::string & filename );
  void close();
  bool is_open() const { return db != NULL; }

  // PRAGMA synchronous: OFF or FULL
  void synchronous( bool );

  bool query( const std::string & q );

  void begin() { query( "BEGIN;" ); }
  void commit() { query( "COMMIT;" ); }
  void rollback() { query( "ROLLBACK;" ); }

  // statements are tracked, and finalised on close() if not before
  sqlite3_stmt * prepare( const std::string & q );
  void finalise( sqlite3_stmt * );

  // T while rows remain
  bool step( sqlite3_stmt * );
  void reset( sqlite3_stmt * stmt ) { sqlite3_reset( stmt ); }

  // named parameters, e.g. ":id"
  void bind_int( sqlite3_stmt * , const std::string & , int );
  void bind_double( sqlite3_stmt * , const std::string & , double );
  void bind_text( sqlite3_stmt * , const std::string & , const std::string & );
  void bind_blob( sqlite3_stmt * , const std::string & , const blob & );

  double get_double( sqlite3_stmt * stmt , int col ) { return sqlite3_column_double( stmt , col ); }
  std::string get_text( sqlite3_stmt * , int col );
  blob get_blob( sqlite3_stmt * , int col );

 private:

  void check( const std::string & what );

  std::set<sqlite3_stmt*> stmts;

  sqlite3 * db;

  int rc;

  std::string name;

};

#endif
