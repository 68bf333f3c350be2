
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

#include "filters/filt.h"
#include "filters/filt-expr.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include <algorithm>
#include <iomanip>

extern logger_t logger;


filt_selector_t filt_selector_t::from_param( const param_t & param , const std::string & k )
{
  if ( ! param.has( k ) ) return switches();
  const std::string v = param.value( k );
  if ( v == "" || v == "__null__" || Helper::iequals( v , "T" ) ) return switches();
  if ( Helper::iequals( v , "F" ) || Helper::iequals( v , "none" ) ) return none();
  return key( v );
}


filt_t::filt_t( const int size , const std::vector<std::string> & analytes )
  : n( size ) , analyte_list( analytes )
{
  for (int a=0; a<analyte_list.size(); a++)
    {
      if ( analyte_index.find( analyte_list[a] ) != analyte_index.end() )
	throw data_shape_error_t( "analyte " + analyte_list[a] + " specified twice" );
      analyte_index[ analyte_list[a] ] = a;
    }
}


void filt_t::reindex()
{
  index.clear();
  for (int f=0; f<filts.size(); f++)
    index[ filts[f].name ] = f;
}


std::vector<int> filt_t::analyte_slots( const std::vector<std::string> & analytes ) const
{
  std::vector<int> r;
  if ( analytes.size() == 0 )
    {
      for (int a=0; a<analyte_list.size(); a++) r.push_back( a );
      return r;
    }

  for (int a=0; a<analytes.size(); a++)
    {
      std::map<std::string,int>::const_iterator aa = analyte_index.find( analytes[a] );
      if ( aa == analyte_index.end() )
	throw not_found_error_t( "analyte not found: " + analytes[a] );
      r.push_back( aa->second );
    }
  return r;
}


void filt_t::add( const std::string & name ,
		  const std::vector<bool> & mask ,
		  const std::string & info ,
		  const param_t & params )
{

  if ( name == "" )
    throw data_shape_error_t( "filter name cannot be empty" );

  // names must be usable in keys
  for (int i=0; i<name.size(); i++)
    if ( name[i] == '(' || name[i] == ')' || name[i] == '&' || name[i] == '|'
	 || name[i] == '!' || name[i] == ' ' || name[i] == '\t' )
      throw data_shape_error_t( "invalid character in filter name: " + name );

  if ( mask.size() != n )
    throw data_shape_error_t( "filter " + name + " has " + Helper::int2str( (int)mask.size() )
			      + " samples, expecting " + Helper::int2str( n ) );

  if ( has( name ) )
    throw duplicate_name_error_t( "filter already exists: " + name );

  filter_t f;
  f.name = name;
  f.info = info;
  f.params = params;
  f.mask = mask;

  filts.push_back( f );
  switches.push_back( std::vector<bool>( analyte_list.size() , true ) );

  index[ name ] = filts.size() - 1;

}


void filt_t::remove( const std::string & name )
{

  std::map<std::string,int>::iterator ii = index.find( name );
  if ( ii == index.end() )
    throw not_found_error_t( "filter not found: " + name );

  const int f = ii->second;

  filts.erase( filts.begin() + f );
  switches.erase( switches.begin() + f );

  reindex();

  // forget any cached key that mentions this filter
  std::map<std::string,std::string>::iterator kk = keys.begin();
  while ( kk != keys.end() )
    {
      std::set<std::string> used = filt_expr_t( kk->second ).names();
      if ( used.find( name ) != used.end() )
	keys.erase( kk++ );
      else
	++kk;
    }

}


void filt_t::clear()
{
  filts.clear();
  switches.clear();
  index.clear();
  keys.clear();
}


void filt_t::clean()
{
  std::vector<std::string> drop;
  for (int f=0; f<filts.size(); f++)
    {
      bool any = false;
      for (int a=0; a<analyte_list.size(); a++)
	if ( switches[f][a] ) { any = true; break; }
      if ( ! any ) drop.push_back( filts[f].name );
    }

  for (int d=0; d<drop.size(); d++)
    remove( drop[d] );

  if ( drop.size() )
    logger << "  removed " << drop.size() << " unused filter(s)\n";
}


void filt_t::set_switches( const std::string & filt , const std::vector<std::string> & analytes , bool b )
{
  // validate all analytes before touching anything
  std::vector<int> slots = analyte_slots( analytes );

  for (int f=0; f<filts.size(); f++)
    {
      if ( ! Helper::contains( filts[f].name , filt ) ) continue;
      for (int a=0; a<slots.size(); a++)
	switches[f][ slots[a] ] = b;
    }
}

void filt_t::on( const std::string & filt , const std::vector<std::string> & analytes )
{
  set_switches( filt , analytes , true );
}

void filt_t::off( const std::string & filt , const std::vector<std::string> & analytes )
{
  set_switches( filt , analytes , false );
}

void filt_t::set_switch( const std::string & name , const std::string & analyte , bool b )
{
  std::map<std::string,int>::const_iterator ii = index.find( name );
  if ( ii == index.end() ) throw not_found_error_t( "filter not found: " + name );
  std::map<std::string,int>::const_iterator aa = analyte_index.find( analyte );
  if ( aa == analyte_index.end() ) throw not_found_error_t( "analyte not found: " + analyte );
  switches[ ii->second ][ aa->second ] = b;
}

bool filt_t::is_on( const std::string & name , const std::string & analyte ) const
{
  std::map<std::string,int>::const_iterator ii = index.find( name );
  if ( ii == index.end() ) throw not_found_error_t( "filter not found: " + name );
  std::map<std::string,int>::const_iterator aa = analyte_index.find( analyte );
  if ( aa == analyte_index.end() ) throw not_found_error_t( "analyte not found: " + analyte );
  return switches[ ii->second ][ aa->second ];
}


std::string filt_t::make_key( const std::string & analyte ) const
{
  std::map<std::string,int>::const_iterator aa = analyte_index.find( analyte );
  if ( aa == analyte_index.end() ) throw not_found_error_t( "analyte not found: " + analyte );

  // 'index' iterates in sorted name order
  std::vector<std::string> on;
  std::map<std::string,int>::const_iterator ii = index.begin();
  while ( ii != index.end() )
    {
      if ( switches[ ii->second ][ aa->second ] )
	on.push_back( ii->first );
      ++ii;
    }

  return Helper::stringize( on , " & " );
}


std::vector<bool> filt_t::make( const std::string & analyte )
{
  const std::string key = make_key( analyte );
  keys[ analyte ] = key;
  return make_fromkey( key );
}


std::vector<bool> filt_t::make( const std::vector<std::string> & analytes )
{
  std::vector<bool> m( n , true );
  std::vector<std::string> alist = analytes.size() ? analytes : analyte_list;
  for (int a=0; a<alist.size(); a++)
    {
      std::vector<bool> m1 = make( alist[a] );
      for (int i=0; i<n; i++) m[i] = m[i] && m1[i];
    }
  return m;
}


std::vector<bool> filt_t::make_fromkey( const std::string & key ) const
{
  filt_expr_t expr( key );

  const std::vector<filter_t> & fs = filts;
  const std::map<std::string,int> & idx = index;

  filt_resolver_t resolver = [&fs,&idx]( const std::string & name ) -> const std::vector<bool> *
    {
      std::map<std::string,int>::const_iterator ii = idx.find( name );
      if ( ii == idx.end() ) return NULL;
      return &fs[ ii->second ].mask;
    };

  return expr.eval( resolver , n );
}


std::map<std::string,std::string> filt_t::make_keydict( const std::vector<std::string> & analytes ) const
{
  std::map<std::string,std::string> r;
  std::vector<std::string> alist = analytes.size() ? analytes : analyte_list;
  for (int a=0; a<alist.size(); a++)
    r[ alist[a] ] = make_key( alist[a] );
  return r;
}


std::vector<bool> filt_t::grab( const filt_selector_t & sel , const std::string & analyte )
{

  if ( sel.type == filt_selector_t::NONE )
    return std::vector<bool>( n , true );

  if ( sel.type == filt_selector_t::KEY )
    return make_fromkey( sel.expr );

  if ( sel.type == filt_selector_t::KEYDICT )
    {
      std::map<std::string,std::string>::const_iterator kk = sel.exprs.find( analyte );
      if ( kk == sel.exprs.end() )
	throw not_found_error_t( "no filter key given for analyte " + analyte );
      return make_fromkey( kk->second );
    }

  return make( analyte );
}


std::vector<bool> filt_t::grab( const filt_selector_t & sel , const std::vector<std::string> & analytes )
{
  std::vector<bool> m( n , true );
  if ( sel.type == filt_selector_t::NONE ) return m;

  std::vector<std::string> alist = analytes.size() ? analytes : analyte_list;

  // a single key does not depend on the analyte
  if ( sel.type == filt_selector_t::KEY ) return make_fromkey( sel.expr );

  for (int a=0; a<alist.size(); a++)
    {
      std::vector<bool> m1 = grab( sel , alist[a] );
      for (int i=0; i<n; i++) m[i] = m[i] && m1[i];
    }
  return m;
}


std::vector<std::string> filt_t::components( const std::string & filt , const std::string & analyte ) const
{
  int slot = -1;
  if ( analyte != "" )
    {
      std::map<std::string,int>::const_iterator aa = analyte_index.find( analyte );
      if ( aa == analyte_index.end() ) throw not_found_error_t( "analyte not found: " + analyte );
      slot = aa->second;
    }

  std::vector<std::string> r;
  for (int f=0; f<filts.size(); f++)
    {
      if ( ! Helper::contains( filts[f].name , filt ) ) continue;
      if ( slot != -1 && ! switches[f][slot] ) continue;
      r.push_back( filts[f].name );
    }
  return r;
}


std::string filt_t::info() const
{
  std::stringstream ss;
  for (int f=0; f<filts.size(); f++)
    ss << filts[f].name << ": " << filts[f].info << "\n";
  return ss.str();
}


const filter_t & filt_t::filter( const std::string & name ) const
{
  std::map<std::string,int>::const_iterator ii = index.find( name );
  if ( ii == index.end() ) throw not_found_error_t( "filter not found: " + name );
  return filts[ ii->second ];
}


std::string filt_t::cached_key( const std::string & analyte ) const
{
  std::map<std::string,std::string>::const_iterator kk = keys.find( analyte );
  return kk == keys.end() ? "" : kk->second ;
}


std::ostream & operator<<( std::ostream & out , const filt_t & f )
{

  // header: position, name, then one column per analyte

  int w = 6;
  for (int i=0; i<f.filts.size(); i++)
    if ( f.filts[i].name.size() + 2 > w ) w = f.filts[i].name.size() + 2;

  out << std::left << std::setw(4) << "n" << std::setw( w ) << "Filter Name";
  for (int a=0; a<f.analyte_list.size(); a++)
    out << std::setw( std::max( 7 , (int)f.analyte_list[a].size() + 2 ) ) << f.analyte_list[a];
  out << "\n";

  for (int i=0; i<f.filts.size(); i++)
    {
      out << std::left << std::setw(4) << i << std::setw( w ) << f.filts[i].name;
      for (int a=0; a<f.analyte_list.size(); a++)
	out << std::setw( std::max( 7 , (int)f.analyte_list[a].size() + 2 ) ) << ( f.switches[i][a] ? "True" : "False" );
      out << "\n";
    }

  return out;
}
