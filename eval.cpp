
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

#include "eval.h"
#include "latrace.h"

#include <fstream>
#include <memory>

extern logger_t logger;


//
// cmd_t
//

// a script from std::cin: one command per line; lines starting with
// whitespace continue the previous command; '%' starts a comment unless quoted
static std::string read_script( std::istream & in )
{
  std::string script;
  std::string s;
  while ( ! Helper::safe_getline( in , s ).eof() )
    {
      bool inquote = false;
      for (int i=0; i<s.size(); i++)
	{
	  if ( s[i] == '"' ) inquote = ! inquote;
	  else if ( s[i] == '%' && ! inquote ) { s.resize( i ); break; }
	}

      const bool continuation = s.size() && ( s[0] == ' ' || s[0] == '\t' );

      s = Helper::lrtrim( s );
      if ( s == "" ) continue;

      if ( script != "" ) script += continuation ? " " : " & ";
      script += s;
    }
  return script;
}


cmd_t::cmd_t() : error( false )
{
  register_commands();
  const std::string script = cmdline_cmds != "" ? cmdline_cmds : read_script( std::cin );
  error = ! parse( script , false );
}

cmd_t::cmd_t( const std::string & str ) : error( false )
{
  register_commands();
  error = ! parse( str , true );
}

bool cmd_t::valid() const
{
  if ( error ) return false;
  for (int c=0; c<cmds.size(); c++)
    if ( commands.find( Helper::toupper( cmds[c] ) ) == commands.end() ) return false;
  return true;
}

bool cmd_t::is( const int n , const std::string & s ) const
{
  if ( n < 0 || n >= cmds.size() ) Helper::halt( "no command #" + Helper::int2str( n + 1 ) );
  return Helper::iequals( cmds[n] , s );
}


void cmd_t::register_commands()
{
  if ( commands.size() ) return;

  const char * names[] = {
    "DESPIKE" , "AUTORANGE" , "SEPARATE" , "BKGSUB" , "RATIO" , "FOCUS" , "ESTIMATE-DECAY" ,
    "FILTER-THRESHOLD" , "FILTER-DISTRIBUTION" , "FILTER-CLUSTER" , "FILTER-CORRELATION" , "FILTER-OPTIMISE" ,
    "FILTER-ON" , "FILTER-OFF" , "FILTER-REMOVE" , "FILTER-CLEAR" , "FILTER-CLEAN" , "FILTER-STATUS" ,
    "STATS" , "RANGES" , "WRITE" , "SAVE" , "LOAD" };

  for (int i=0; i<sizeof(names)/sizeof(names[0]); i++)
    commands.insert( names[i] );
}


bool cmd_t::parse( const std::string & script , bool silent )
{
  cmds.clear();
  params.clear();

  line = script;

  // unquoted '&' separates commands
  std::string split = script;
  bool inquote = false;
  for (int i=0; i<split.size(); i++)
    {
      if ( split[i] == '"' ) inquote = ! inquote;
      else if ( split[i] == '&' && ! inquote ) split[i] = '\n';
    }

  const std::vector<std::string> tok = Helper::quoted_parse( split , "\n" );

  for (int c=0; c<tok.size(); c++)
    {
      const std::vector<std::string> ctok = Helper::quoted_parse( tok[c] , "\t " );
      if ( ctok.size() == 0 ) continue;
      cmds.push_back( ctok[0] );
      params.push_back( param_t() );
      for (int j=1; j<ctok.size(); j++) params.back().parse( ctok[j] );
    }

  if ( cmds.size() == 0 ) return false;

  if ( ! silent )
    for (int i=0; i<cmds.size(); i++)
      logger << ( i == 0 ? "commands: " : "        : " )
	     << "c" << i+1 << "\t" << cmds[i] << "\t" << params[i].dump( "" , "|" ) << "\n";

  return true;
}


bool cmd_t::eval( trace_t & trace )
{

  //
  // Loop over each command
  //

  for ( int c = 0 ; c < num_cmds() ; c++ )
    {

      logger << " ..................................................................\n"
	     << " CMD #" << c+1 << ": " << cmd(c) << "\n";

      logger << "   options: " << param(c).dump( "" , " " ) << "\n";

      if      ( is( c, "DESPIKE" ) )             proc_despike( trace , param(c) );
      else if ( is( c, "AUTORANGE" ) )           proc_autorange( trace , param(c) );
      else if ( is( c, "SEPARATE" ) )            proc_separate( trace , param(c) );
      else if ( is( c, "BKGSUB" ) )              proc_bkgsub( trace , param(c) );
      else if ( is( c, "RATIO" ) )               proc_ratio( trace , param(c) );
      else if ( is( c, "FOCUS" ) )               proc_focus( trace , param(c) );
      else if ( is( c, "ESTIMATE-DECAY" ) )      proc_estimate_decay( trace , param(c) );

      else if ( is( c, "FILTER-THRESHOLD" ) )    proc_filter_threshold( trace , param(c) );
      else if ( is( c, "FILTER-DISTRIBUTION" ) ) proc_filter_distribution( trace , param(c) );
      else if ( is( c, "FILTER-CLUSTER" ) )      proc_filter_cluster( trace , param(c) );
      else if ( is( c, "FILTER-CORRELATION" ) )  proc_filter_correlation( trace , param(c) );
      else if ( is( c, "FILTER-OPTIMISE" ) )     proc_filter_optimise( trace , param(c) );

      else if ( is( c, "FILTER-ON" ) )           proc_filter_on( trace , param(c) );
      else if ( is( c, "FILTER-OFF" ) )          proc_filter_off( trace , param(c) );
      else if ( is( c, "FILTER-REMOVE" ) )       proc_filter_remove( trace , param(c) );
      else if ( is( c, "FILTER-CLEAR" ) )        proc_filter_clear( trace , param(c) );
      else if ( is( c, "FILTER-CLEAN" ) )        proc_filter_clean( trace , param(c) );
      else if ( is( c, "FILTER-STATUS" ) )       proc_filter_status( trace , param(c) );

      else if ( is( c, "STATS" ) )               proc_stats( trace , param(c) );
      else if ( is( c, "RANGES" ) )              proc_ranges( trace , param(c) );
      else if ( is( c, "WRITE" ) )               proc_write( trace , param(c) );
      else if ( is( c, "SAVE" ) )                proc_save( trace , param(c) );
      else if ( is( c, "LOAD" ) )                proc_load( trace , param(c) );

      else
	{
	  Helper::halt( "did not recognize command: " + cmd(c) );
	  return false;
	}

    } // next command

  return true;
}



//
// processing
//

// DESPIKE : spike and exponential-decay filters -> DESPIKED

void proc_despike( trace_t & trace , param_t & param )
{
  dsptools::despike( trace , param );
}

// AUTORANGE : background / signal / transition regions

void proc_autorange( trace_t & trace , param_t & param )
{
  regions::autorange( trace , param );
}

// SEPARATE : SIGNAL and BACKGROUND stages

void proc_separate( trace_t & trace , param_t & param )
{
  if ( param.has( "analytes" ) )
    Stages::separate( trace , param.strvector( "analytes" ) );
  else
    Stages::separate( trace );
}

// BKGSUB : background correction -> BKGSUB

void proc_bkgsub( trace_t & trace , param_t & param )
{
  if ( ! trace.has_stage( SIGNAL ) )
    Stages::separate( trace );
  Stages::bkg_correct( trace , param );
}

// RATIO : divide by an internal standard -> RATIOS

void proc_ratio( trace_t & trace , param_t & param )
{
  Stages::ratio( trace , param );
}

// FOCUS : change the stage that downstream steps read

void proc_focus( trace_t & trace , param_t & param )
{
  const stage_t s = globals::stage( param.requires( "stage" ) );
  trace.set_focus( s );
  logger << "  focus set to " << globals::stage( s ) << "\n";
}

// ESTIMATE-DECAY : decay exponent from this trace's washouts; the
// result is kept as the 'decay' parameter set

void proc_estimate_decay( trace_t & trace , param_t & param )
{

  std::vector<std::string> analytes = param.has( "analytes" ) ? param.strvector( "analytes" ) : trace.analytes ;

  std::vector<trace_t*> standards( 1 , &trace );

  expcoef_t e = dsptools::estimate_decay( standards ,
					  analytes ,
					  param.get_dbl( "nsd" , 12.0 ) ,
					  param.get_dbl( "trim" , -1 ) );

  std::cout << "ID\tEXPONENT\tK\tSE\tR2\tTAILS\tN\n"
	    << trace.id << "\t"
	    << e.coef << "\t"
	    << e.k << "\t"
	    << e.sigma_k << "\t"
	    << e.r2 << "\t"
	    << e.ntails << "\t"
	    << e.npoints << "\n";

  param_t p;
  p.add( "exponent" , Helper::dbl2str( e.coef ) );
  p.add( "k" , Helper::dbl2str( e.k ) );
  p.add( "se" , Helper::dbl2str( e.sigma_k ) );
  trace.params[ "decay" ] = p;

}



//
// filter generators
//

void proc_filter_threshold( trace_t & trace , param_t & param )
{
  filters::threshold( trace , param );
}

void proc_filter_distribution( trace_t & trace , param_t & param )
{
  filters::distribution( trace , param );
}

void proc_filter_cluster( trace_t & trace , param_t & param )
{
  filters::clustering( trace , param );
}

void proc_filter_correlation( trace_t & trace , param_t & param )
{
  filters::correlation( trace , param );
}

void proc_filter_optimise( trace_t & trace , param_t & param )
{
  filters::optimise( trace , param );
}



//
// filter registry
//

// FILTER-ON filt=<part of a name> analytes=A,B (both optional: all)

void proc_filter_on( trace_t & trace , param_t & param )
{
  trace.filt.on( param.has( "filt" ) ? param.value( "filt" ) : "" ,
		 param.has( "analytes" ) ? param.strvector( "analytes" ) : std::vector<std::string>() );
}

void proc_filter_off( trace_t & trace , param_t & param )
{
  trace.filt.off( param.has( "filt" ) ? param.value( "filt" ) : "" ,
		  param.has( "analytes" ) ? param.strvector( "analytes" ) : std::vector<std::string>() );
}

// FILTER-REMOVE filt=name1,name2

void proc_filter_remove( trace_t & trace , param_t & param )
{
  std::vector<std::string> names = param.strvector( "filt" );
  if ( names.size() == 0 ) Helper::halt( "FILTER-REMOVE requires filt" );
  for (int i=0; i<names.size(); i++)
    {
      trace.filt.remove( names[i] );
      logger << "  removed filter " << names[i] << "\n";
    }
}

void proc_filter_clear( trace_t & trace , param_t & param )
{
  trace.filt.clear();
  logger << "  cleared all filters\n";
}

// drop filters not switched on for any analyte

void proc_filter_clean( trace_t & trace , param_t & param )
{
  trace.filt.clean();
}

void proc_filter_status( trace_t & trace , param_t & param )
{
  std::cout << trace.filt;
  if ( param.has( "info" ) && param.yesno( "info" ) )
    std::cout << "\n" << trace.filt.info();
}



//
// outputs
//

void proc_stats( trace_t & trace , param_t & param )
{
  Statistics::sample_stats( trace , param , std::cout );
}

// RANGES : background and signal range lists

void proc_ranges( trace_t & trace , param_t & param )
{
  if ( ! trace.autoranged() )
    Helper::halt( "no ranges for " + trace.id + ": run AUTORANGE or LOAD first" );

  std::cout << "ID\tREGION\tN\tSTART\tSTOP\n";

  for (int r=0; r<2; r++)
    {
      const range_list_t & rl = r == 0 ? trace.bkgrng : trace.sigrng ;
      for (int i=0; i<rl.size(); i++)
	std::cout << trace.id << "\t"
		  << ( r == 0 ? "bkg" : "sig" ) << "\t"
		  << i+1 << "\t"
		  << rl[i].start << "\t"
		  << rl[i].stop << "\n";
    }
}

// WRITE file=out.csv : focus stage as CSV (default: standard output)

void proc_write( trace_t & trace , param_t & param )
{
  if ( param.has( "file" ) )
    {
      const std::string f = Helper::expand( param.value( "file" ) );
      std::ofstream O1( f.c_str() , std::ios::out );
      if ( ! O1.good() ) Helper::halt( "could not open " + f );
      trace_io::write_csv( trace , O1 );
      O1.close();
      logger << "  wrote " << globals::stage( trace.focus_stage() ) << " values to " << f << "\n";
    }
  else
    trace_io::write_csv( trace , std::cout );
}

static std::string db_name( const param_t & param )
{
  if ( param.has( "db" ) ) return param.value( "db" );
  if ( cmd_t::db != "" ) return cmd_t::db;
  Helper::halt( "no database: use db=" );
  return "";
}

// SAVE db=results.db

void proc_save( trace_t & trace , param_t & param )
{
  rstore_t store( db_name( param ) );
  store.save( trace );
}

// LOAD db=results.db

void proc_load( trace_t & trace , param_t & param )
{
  rstore_t store( db_name( param ) );
  if ( ! store.load( trace ) )
    trace.warn( "nothing stored for " + trace.id );
}
