
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

#ifndef __LATRACE_FILT_H__
#define __LATRACE_FILT_H__

#include <string>
#include <vector>
#include <map>
#include <set>
#include <iostream>

#include "param.h"

//
// a single named boolean filter; True = keep
//

struct filter_t
{
  std::string name;
  std::string info;
  param_t params;
  std::vector<bool> mask;
};


//
// which samples to take, when a filter is applied:
//   NONE      all samples
//   KEY       a single key expression, for all analytes
//   KEYDICT   a key expression per analyte
//   SWITCHES  the filters currently switched on for the analyte
//

struct filt_selector_t
{

  enum selector_type_t { NONE , KEY , KEYDICT , SWITCHES };

  filt_selector_t() : type( SWITCHES ) { }

  static filt_selector_t none() { filt_selector_t s; s.type = NONE; return s; }

  static filt_selector_t switches() { filt_selector_t s; s.type = SWITCHES; return s; }

  static filt_selector_t key( const std::string & k ) { filt_selector_t s; s.type = KEY; s.expr = k; return s; }

  static filt_selector_t keydict( const std::map<std::string,std::string> & k )
  { filt_selector_t s; s.type = KEYDICT; s.exprs = k; return s; }

  // from a command: filt=F|T|<key>
  static filt_selector_t from_param( const param_t & param , const std::string & k = "filt" );

  selector_type_t type;
  std::string expr;
  std::map<std::string,std::string> exprs;

};


//
// the per-trace filter registry: owns the filter masks, a dense
// filters x analytes table of on/off switches and a cache of the key
// last made for each analyte
//

class filt_t
{

 public:

  filt_t( const int size = 0 , const std::vector<std::string> & analytes = std::vector<std::string>() );

  // registry content

  void add( const std::string & name ,
	    const std::vector<bool> & mask ,
	    const std::string & info = "" ,
	    const param_t & params = param_t() );

  void remove( const std::string & name );

  void clear();

  // drop filters that are off for every analyte
  void clean();

  // switches: every filter whose name contains 'filt' (empty = all)
  // for the given analytes (empty = all)

  void on( const std::string & filt = "" , const std::vector<std::string> & analytes = std::vector<std::string>() );

  void off( const std::string & filt = "" , const std::vector<std::string> & analytes = std::vector<std::string>() );

  bool is_on( const std::string & name , const std::string & analyte ) const;

  // one switch, by exact filter name
  void set_switch( const std::string & name , const std::string & analyte , bool b );

  // combined masks

  std::string make_key( const std::string & analyte ) const;

  std::vector<bool> make( const std::string & analyte );

  std::vector<bool> make( const std::vector<std::string> & analytes );

  std::vector<bool> make_fromkey( const std::string & key ) const;

  std::map<std::string,std::string> make_keydict( const std::vector<std::string> & analytes = std::vector<std::string>() ) const;

  std::vector<bool> grab( const filt_selector_t & sel , const std::string & analyte );

  std::vector<bool> grab( const filt_selector_t & sel , const std::vector<std::string> & analytes );

  // queries

  std::vector<std::string> components( const std::string & filt = "" , const std::string & analyte = "" ) const;

  std::string info() const;

  bool has( const std::string & name ) const { return index.find( name ) != index.end(); }

  const filter_t & filter( const std::string & name ) const;

  const std::vector<filter_t> & filters() const { return filts; }

  const std::vector<std::string> & analytes() const { return analyte_list; }

  // cached key for an analyte ("" if none made yet)
  std::string cached_key( const std::string & analyte ) const;

  int size() const { return filts.size(); }

  int length() const { return n; }

  friend std::ostream & operator<<( std::ostream & out , const filt_t & f );

 private:

  int n;

  std::vector<std::string> analyte_list;

  std::map<std::string,int> analyte_index;

  std::vector<filter_t> filts;

  std::map<std::string,int> index;

  // [filter][analyte]
  std::vector<std::vector<bool> > switches;

  std::map<std::string,std::string> keys;

  void reindex();

  std::vector<int> analyte_slots( const std::vector<std::string> & analytes ) const;

  void set_switches( const std::string & filt , const std::vector<std::string> & analytes , bool b );

};

#endif
