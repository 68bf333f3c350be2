
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

#ifndef __LATRACE_RSTORE_H__
#define __LATRACE_RSTORE_H__

#include "db/sqlwrap.h"
#include <string>
#include <set>

struct trace_t;

//
// SQLite store of what was derived for each sample: background/signal
// ranges, filter definitions with their per-analyte switches, and the
// parameters of each processing step
//

struct rstore_t {

  rstore_t( const std::string & );

  ~rstore_t();

  bool attached() { return sql.is_open(); }

  bool init();

  bool release();

  // replaces anything stored for this sample
  void save( const trace_t & trace );

  void save_ranges( const trace_t & trace );
  void save_filters( const trace_t & trace );
  void save_params( const trace_t & trace );

  // returns F if nothing was stored for this sample
  bool load( trace_t & trace );

  bool load_ranges( trace_t & trace );
  int load_filters( trace_t & trace );
  int load_params( trace_t & trace );

  // sample IDs in the store
  std::set<std::string> samples();

private:

  SQL sql;

  std::string filename;

  //
  // Prepared queries
  //

  // sets

  sqlite3_stmt * stmt_insert_range;
  sqlite3_stmt * stmt_insert_filter;
  sqlite3_stmt * stmt_insert_param;

  sqlite3_stmt * stmt_delete_ranges;
  sqlite3_stmt * stmt_delete_filters;
  sqlite3_stmt * stmt_delete_params;

  // gets

  sqlite3_stmt * stmt_fetch_ranges;
  sqlite3_stmt * stmt_fetch_filters;
  sqlite3_stmt * stmt_fetch_params;
  sqlite3_stmt * stmt_fetch_samples;

};

#endif
