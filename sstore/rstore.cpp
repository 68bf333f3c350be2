
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

#include "sstore/rstore.h"
#include "trace/trace.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

extern logger_t logger;

rstore_t::rstore_t( const std::string & f1 )
{

  std::string f = Helper::expand( f1 );

  sql.open(f);

  sql.synchronous(false);

  filename = f;

  sql.query(" CREATE TABLE IF NOT EXISTS ranges ("
            "   sample  VARCHAR(20) NOT NULL , "
            "   region  VARCHAR(3) NOT NULL , "
	    "   start   REAL , "
	    "   stop    REAL );" );

  sql.query(" CREATE TABLE IF NOT EXISTS filters ("
            "   sample   VARCHAR(20) NOT NULL , "
	    "   pos      INTEGER NOT NULL , "
            "   name     VARCHAR(20) NOT NULL , "
	    "   info     TEXT , "
	    "   params   TEXT , "
	    "   mask     BLOB , "
	    "   switches TEXT );" );

  sql.query(" CREATE TABLE IF NOT EXISTS params ("
            "   sample  VARCHAR(20) NOT NULL , "
            "   step    VARCHAR(20) NOT NULL , "
	    "   params  TEXT );" );

  init();

}

rstore_t::~rstore_t()
{
  release();
  sql.close();
}

bool rstore_t::init()
{

  // sets
  stmt_insert_range  = sql.prepare( " INSERT INTO ranges ( sample , region , start , stop ) values( :sample , :region , :start , :stop ); " );
  stmt_insert_filter = sql.prepare( " INSERT INTO filters ( sample , pos , name , info , params , mask , switches ) "
				    " values( :sample , :pos , :name , :info , :params , :mask , :switches ); " );
  stmt_insert_param  = sql.prepare( " INSERT INTO params ( sample , step , params ) values( :sample , :step , :params ); " );

  stmt_delete_ranges  = sql.prepare( " DELETE FROM ranges WHERE sample == :sample ; " );
  stmt_delete_filters = sql.prepare( " DELETE FROM filters WHERE sample == :sample ; " );
  stmt_delete_params  = sql.prepare( " DELETE FROM params WHERE sample == :sample ; " );

  // gets
  stmt_fetch_ranges  = sql.prepare( " SELECT region , start , stop FROM ranges WHERE sample == :sample ORDER BY region , start ; " );
  stmt_fetch_filters = sql.prepare( " SELECT pos , name , info , params , mask , switches FROM filters WHERE sample == :sample ORDER BY pos ; " );
  stmt_fetch_params  = sql.prepare( " SELECT step , params FROM params WHERE sample == :sample ; " );
  stmt_fetch_samples = sql.prepare( " SELECT DISTINCT sample FROM ranges UNION SELECT DISTINCT sample FROM filters UNION SELECT DISTINCT sample FROM params ; " );

  return true;
}


bool rstore_t::release()
{

  sql.finalise( stmt_insert_range );
  sql.finalise( stmt_insert_filter );
  sql.finalise( stmt_insert_param );

  sql.finalise( stmt_delete_ranges );
  sql.finalise( stmt_delete_filters );
  sql.finalise( stmt_delete_params );

  sql.finalise( stmt_fetch_ranges );
  sql.finalise( stmt_fetch_filters );
  sql.finalise( stmt_fetch_params );
  sql.finalise( stmt_fetch_samples );

  return true;
}


void rstore_t::save( const trace_t & trace )
{
  sql.begin();
  try
    {
      save_ranges( trace );
      save_filters( trace );
      save_params( trace );
    }
  catch ( const std::exception & )
    {
      sql.rollback();
      throw;
    }
  sql.commit();

  logger << "  saved " << trace.id << " to " << filename << "\n";
}


void rstore_t::save_ranges( const trace_t & trace )
{

  sql.bind_text( stmt_delete_ranges , ":sample" , trace.id );
  sql.step( stmt_delete_ranges );
  sql.reset( stmt_delete_ranges );

  if ( ! trace.autoranged() ) return;

  for (int r=0; r<2; r++)
    {
      const range_list_t & rl = r == 0 ? trace.bkgrng : trace.sigrng ;
      const std::string region = r == 0 ? "bkg" : "sig" ;
      for (int i=0; i<rl.size(); i++)
	{
	  sql.bind_text( stmt_insert_range , ":sample" , trace.id );
	  sql.bind_text( stmt_insert_range , ":region" , region );
	  sql.bind_double( stmt_insert_range , ":start" , rl[i].start );
	  sql.bind_double( stmt_insert_range , ":stop" , rl[i].stop );
	  sql.step( stmt_insert_range );
	  sql.reset( stmt_insert_range );
	}
    }
}


void rstore_t::save_filters( const trace_t & trace )
{

  sql.bind_text( stmt_delete_filters , ":sample" , trace.id );
  sql.step( stmt_delete_filters );
  sql.reset( stmt_delete_filters );

  const std::vector<filter_t> & filts = trace.filt.filters();

  for (int f=0; f<filts.size(); f++)
    {
      const filter_t & filter = filts[f];

      std::string m( filter.mask.size() , '\0' );
      for (int i=0; i<filter.mask.size(); i++)
	if ( filter.mask[i] ) m[i] = 1;
      blob b( m );

      std::vector<std::string> on;
      for (int a=0; a<trace.analytes.size(); a++)
	if ( trace.filt.is_on( filter.name , trace.analytes[a] ) )
	  on.push_back( trace.analytes[a] );

      sql.bind_text( stmt_insert_filter , ":sample" , trace.id );
      sql.bind_int( stmt_insert_filter , ":pos" , f );
      sql.bind_text( stmt_insert_filter , ":name" , filter.name );
      sql.bind_text( stmt_insert_filter , ":info" , filter.info );
      sql.bind_text( stmt_insert_filter , ":params" , filter.params.dump( "" , "\n" ) );
      sql.bind_blob( stmt_insert_filter , ":mask" , b );
      sql.bind_text( stmt_insert_filter , ":switches" , Helper::stringize( on , "," ) );
      sql.step( stmt_insert_filter );
      sql.reset( stmt_insert_filter );
    }
}


void rstore_t::save_params( const trace_t & trace )
{

  sql.bind_text( stmt_delete_params , ":sample" , trace.id );
  sql.step( stmt_delete_params );
  sql.reset( stmt_delete_params );

  std::map<std::string,param_t>::const_iterator pp = trace.params.begin();
  while ( pp != trace.params.end() )
    {
      sql.bind_text( stmt_insert_param , ":sample" , trace.id );
      sql.bind_text( stmt_insert_param , ":step" , pp->first );
      sql.bind_text( stmt_insert_param , ":params" , pp->second.dump( "" , "\n" ) );
      sql.step( stmt_insert_param );
      sql.reset( stmt_insert_param );
      ++pp;
    }
}


bool rstore_t::load( trace_t & trace )
{
  const bool has_ranges = load_ranges( trace );
  const int nf = load_filters( trace );
  const int np = load_params( trace );

  logger << "  loaded " << trace.id << " from " << filename << ": "
	 << ( has_ranges ? "ranges, " : "no ranges, " )
	 << nf << " filter(s), " << np << " parameter set(s)\n";

  return has_ranges || nf || np;
}


bool rstore_t::load_ranges( trace_t & trace )
{

  range_list_t bkg , sig;
  int cnt = 0;

  sql.bind_text( stmt_fetch_ranges , ":sample" , trace.id );
  while ( sql.step( stmt_fetch_ranges ) )
    {
      const std::string region = sql.get_text( stmt_fetch_ranges , 0 );
      range_t r( sql.get_double( stmt_fetch_ranges , 1 ) ,
		 sql.get_double( stmt_fetch_ranges , 2 ) );
      if ( region == "bkg" ) bkg.push_back( r );
      else if ( region == "sig" ) sig.push_back( r );
      ++cnt;
    }
  sql.reset( stmt_fetch_ranges );

  if ( cnt == 0 ) return false;

  trace.load_ranges( bkg , sig );

  return true;
}


int rstore_t::load_filters( trace_t & trace )
{

  struct row_t {
    std::string name , info , params , switches;
    std::vector<bool> mask;
  };

  std::vector<row_t> rows;

  sql.bind_text( stmt_fetch_filters , ":sample" , trace.id );
  while ( sql.step( stmt_fetch_filters ) )
    {
      row_t row;
      row.name = sql.get_text( stmt_fetch_filters , 1 );
      row.info = sql.get_text( stmt_fetch_filters , 2 );
      row.params = sql.get_text( stmt_fetch_filters , 3 );
      std::string m = sql.get_blob( stmt_fetch_filters , 4 ).get_string();
      row.mask.resize( m.size() );
      for (int i=0; i<m.size(); i++) row.mask[i] = m[i] != 0;
      row.switches = sql.get_text( stmt_fetch_filters , 5 );
      rows.push_back( row );
    }
  sql.reset( stmt_fetch_filters );

  // check everything before the registry is touched
  for (int r=0; r<rows.size(); r++)
    if ( rows[r].mask.size() != trace.size() )
      throw data_shape_error_t( "stored filter " + rows[r].name + " does not match the length of " + trace.id );

  if ( rows.size() == 0 ) return 0;

  trace.filt.clear();

  for (int r=0; r<rows.size(); r++)
    {
      param_t p;
      p.parse_lines( rows[r].params );
      trace.filt.add( rows[r].name , rows[r].mask , rows[r].info , p );

      std::set<std::string> on = Helper::vec2set( Helper::parse( rows[r].switches , "," ) );
      for (int a=0; a<trace.analytes.size(); a++)
	trace.filt.set_switch( rows[r].name , trace.analytes[a] ,
			       on.find( trace.analytes[a] ) != on.end() );
    }

  return rows.size();
}


int rstore_t::load_params( trace_t & trace )
{
  int cnt = 0;
  sql.bind_text( stmt_fetch_params , ":sample" , trace.id );
  while ( sql.step( stmt_fetch_params ) )
    {
      param_t p;
      p.parse_lines( sql.get_text( stmt_fetch_params , 1 ) );
      trace.params[ sql.get_text( stmt_fetch_params , 0 ) ] = p;
      ++cnt;
    }
  sql.reset( stmt_fetch_params );
  return cnt;
}


std::set<std::string> rstore_t::samples()
{
  std::set<std::string> s;
  while ( sql.step( stmt_fetch_samples ) )
    s.insert( sql.get_text( stmt_fetch_samples , 0 ) );
  sql.reset( stmt_fetch_samples );
  return s;
}
