
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

#include "db/sqlwrap.h"
#include "helper/helper.h"

bool SQL::open( const std::string & filename )
{
  close();
  name = Helper::expand( filename );
  rc = sqlite3_open( name.c_str() , &db );
  if ( rc != SQLITE_OK )
    {
      const std::string msg = db ? sqlite3_errmsg( db ) : "out of memory";
      sqlite3_close( db );
      db = NULL;
      Helper::halt( "could not open database " + name + ": " + msg );
    }
  return true;
}

void SQL::close()
{
  if ( db == NULL ) return;
  for (std::set<sqlite3_stmt*>::iterator ss = stmts.begin(); ss != stmts.end(); ++ss)
    sqlite3_finalize( *ss );
  stmts.clear();
  sqlite3_close( db );
  db = NULL;
}

void SQL::synchronous( bool b )
{
  query( b ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=OFF;" );
}

void SQL::check( const std::string & what )
{
  if ( rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE ) return;
  Helper::halt( "database " + name + ": " + what + " failed (" + Helper::int2str( rc ) + ") " + sqlite3_errmsg( db ) );
}

bool SQL::query( const std::string & q )
{
  char * err = NULL;
  rc = sqlite3_exec( db , q.c_str() , NULL , NULL , &err );
  if ( rc != SQLITE_OK )
    {
      const std::string msg = err ? err : sqlite3_errmsg( db );
      sqlite3_free( err );
      Helper::halt( "database " + name + ": " + msg );
    }
  return true;
}

sqlite3_stmt * SQL::prepare( const std::string & q )
{
  sqlite3_stmt * stmt = NULL;
  rc = sqlite3_prepare_v2( db , q.c_str() , q.size() , &stmt , NULL );
  check( "prepare" );
  stmts.insert( stmt );
  return stmt;
}

void SQL::finalise( sqlite3_stmt * stmt )
{
  if ( stmts.erase( stmt ) ) sqlite3_finalize( stmt );
}

bool SQL::step( sqlite3_stmt * stmt )
{
  rc = sqlite3_step( stmt );
  if ( rc != SQLITE_ROW && rc != SQLITE_DONE )
    {
      const int err = rc;
      sqlite3_reset( stmt );
      rc = err;
      check( "step" );
    }
  return rc == SQLITE_ROW;
}

void SQL::bind_int( sqlite3_stmt * stmt , const std::string & key , int value )
{
  rc = sqlite3_bind_int( stmt , sqlite3_bind_parameter_index( stmt , key.c_str() ) , value );
  check( "bind " + key );
}

void SQL::bind_double( sqlite3_stmt * stmt , const std::string & key , double value )
{
  rc = sqlite3_bind_double( stmt , sqlite3_bind_parameter_index( stmt , key.c_str() ) , value );
  check( "bind " + key );
}

void SQL::bind_text( sqlite3_stmt * stmt , const std::string & key , const std::string & value )
{
  rc = sqlite3_bind_text( stmt , sqlite3_bind_parameter_index( stmt , key.c_str() ) ,
			  value.c_str() , value.size() , SQLITE_TRANSIENT );
  check( "bind " + key );
}

void SQL::bind_blob( sqlite3_stmt * stmt , const std::string & key , const blob & value )
{
  rc = sqlite3_bind_blob( stmt , sqlite3_bind_parameter_index( stmt , key.c_str() ) ,
			  value.data() , value.size() , SQLITE_TRANSIENT );
  check( "bind " + key );
}

std::string SQL::get_text( sqlite3_stmt * stmt , int col )
{
  const unsigned char * s = sqlite3_column_text( stmt , col );
  return s == NULL ? "" : (const char*)s;
}

// the column pointer is only valid until the next step(), so take a copy
blob SQL::get_blob( sqlite3_stmt * stmt , int col )
{
  const char * p = (const char*)sqlite3_column_blob( stmt , col );
  const int l = sqlite3_column_bytes( stmt , col );
  return p == NULL ? blob() : blob( std::string( p , l ) );
}
