
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

#include "main.h"
#include "latrace.h"

#include <new>
#include <cstring>
#include <unistd.h>

#include <Eigen/Dense>
#include <sqlite3.h>

extern logger_t logger;

int main(int argc , char ** argv )
{

  std::set_new_handler( NoMem );

  globals::init_defs();

  //
  // -v / --version
  //

  if ( argc >= 2 && ( strcmp( argv[1] , "-v" ) == 0 || strcmp( argv[1] , "--version" ) == 0 ) )
    {
      globals::api();
      std::cerr << latrace_version()
		<< "Eigen v" << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "." << EIGEN_MINOR_VERSION << "\n"
		<< "SQLite v" << sqlite3_libversion() << "\n";
      std::exit(0);
    }


  //
  // primary usage
  //

  std::string usage_msg = latrace_version() +
    "primary usage: latrace trace.csv [id=ID] [db=results.db] [log=file]\n"
    "                       [-s COMMANDS] [< command-file]\n";

  if ( argc == 1 )
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }


  //
  // command line: input file, key=value options, then -s COMMANDS
  //

  std::string infile = argv[1];

  int param_end = argc;
  for (int i=2; i<argc; i++)
    if ( strcmp( argv[i] , "-s" ) == 0 )
      {
	param_end = i;
	for (int j=i+1; j<argc; j++)
	  cmd_t::add_cmdline_cmd( argv[j] );
	break;
      }

  param_t param;
  build_param( &param , param_end , argv , 2 );

  if ( param.has( "silent" ) && param.yesno( "silent" ) )
    globals::silent = true;

  if ( param.has( "log" ) )
    logger.write_log( Helper::expand( param.value( "log" ) ) );

  if ( param.has( "db" ) )
    cmd_t::db = param.value( "db" );

  if ( cmd_t::cmdline_cmds == "" && isatty(STDIN_FILENO) )
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }


  //
  // banner
  //

  logger.banner( globals::version , globals::date );


  //
  // load the trace, then run the commands over it
  //

  try
    {

      trace_t trace = trace_io::load_csv( infile , param.has( "id" ) ? param.value( "id" ) : "" );

      cmd_t cmd;

      if ( cmd.empty() || cmd.num_cmds() == 0 )
	Helper::halt( "no commands given" );

      if ( ! cmd.valid() )
	{
	  for (int c=0; c<cmd.num_cmds(); c++)
	    if ( cmd_t::commands.find( Helper::toupper( cmd.cmd(c) ) ) == cmd_t::commands.end() )
	      Helper::halt( "did not recognize command: " + cmd.cmd(c) );
	  Helper::halt( "could not parse commands: " + cmd.offending() );
	}

      cmd.eval( trace );

      logger << " ..................................................................\n"
	     << "...processed " << cmd.num_cmds() << " command(s) for " << trace.id;

      if ( logger.n_warnings() == 0 ) logger << ", with no warnings\n";
      else logger << ", with " << logger.n_warnings() << " warning(s)\n";

    }
  catch ( latrace_error_t & e )
    {
      std::cerr << "error : " << e.what() << "\n";
      logger.off();
      std::exit(1);
    }

  logger.closeout();

  std::exit(0);

}


void build_param( param_t * param , int argc , char** argv , int start )
{
  for (int i=start; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;
      if ( x.find( "=" ) == std::string::npos )
	Helper::halt( "expecting key=value options after the input file: " + x );
      param->parse( x );
    }
}


//
// report latrace version
//

std::string latrace_version()
{
  std::stringstream ss;
  ss << "latrace version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "latrace build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


// out of memory: report and exit
void NoMem()
{
  std::cerr << "latrace: fatal error, out of memory\n";
  std::exit(1);
}
