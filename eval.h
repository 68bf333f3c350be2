
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

#ifndef __LATRACE_EVAL_H__
#define __LATRACE_EVAL_H__

#include <string>
#include <vector>
#include <set>

#include "param.h"

struct trace_t;

//
// a command script: CMD key=value ... & CMD2 ...
//

class cmd_t
{

 public:

  // from std::cin, or the -s command-line commands if any were given
  cmd_t();

  // from a string
  cmd_t( const std::string & str );

  // run every command over one trace; F if a command could not be run
  bool eval( trace_t & );

  // no commands were found
  bool empty() const { return cmds.size() == 0; }

  // parsed, and every command name is known
  bool valid() const;

  bool badline() const { return error; }

  std::string offending() const { return error ? line : ""; }

  int num_cmds() const { return cmds.size(); }

  std::string cmd( const int i ) const { return cmds[i]; }

  param_t & param( const int i ) { return params[i]; }

  // case-insensitive match of the n'th command name
  bool is( const int n , const std::string & s ) const;

  // commands given on the command line (-s)
  static std::string cmdline_cmds;

  static void add_cmdline_cmd( const std::string & c ) { cmdline_cmds += c + " "; }

  // the results database attached by db=, used by SAVE/LOAD when they
  // do not name their own
  static std::string db;

  // all known command names
  static std::set<std::string> commands;

  static void register_commands();

 private:

  // split 'script' on unquoted '&' into commands and their options
  bool parse( const std::string & script , bool silent );

  std::vector<std::string> cmds;

  std::vector<param_t> params;

  std::string line;

  bool error;

};


//
// command handlers
//

// processing
void proc_despike( trace_t & , param_t & );
void proc_autorange( trace_t & , param_t & );
void proc_separate( trace_t & , param_t & );
void proc_bkgsub( trace_t & , param_t & );
void proc_ratio( trace_t & , param_t & );
void proc_focus( trace_t & , param_t & );
void proc_estimate_decay( trace_t & , param_t & );

// filter generators
void proc_filter_threshold( trace_t & , param_t & );
void proc_filter_distribution( trace_t & , param_t & );
void proc_filter_cluster( trace_t & , param_t & );
void proc_filter_correlation( trace_t & , param_t & );
void proc_filter_optimise( trace_t & , param_t & );

// filter registry
void proc_filter_on( trace_t & , param_t & );
void proc_filter_off( trace_t & , param_t & );
void proc_filter_remove( trace_t & , param_t & );
void proc_filter_clear( trace_t & , param_t & );
void proc_filter_clean( trace_t & , param_t & );
void proc_filter_status( trace_t & , param_t & );

// outputs
void proc_stats( trace_t & , param_t & );
void proc_ranges( trace_t & , param_t & );
void proc_write( trace_t & , param_t & );
void proc_save( trace_t & , param_t & );
void proc_load( trace_t & , param_t & );

#endif
