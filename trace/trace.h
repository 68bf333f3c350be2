
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

#ifndef __LATRACE_TRACE_H__
#define __LATRACE_TRACE_H__

#include <string>
#include <vector>
#include <map>

#include "defs/defs.h"
#include "param.h"
#include "trace/ranges.h"
#include "filters/filt.h"

// analyte -> values, for one processing stage
typedef std::map<std::string,std::vector<double> > analyte_map_t;

//
// one sample: a shared time axis and, per processing stage, one value
// vector per analyte; plus the region masks, the filter registry and a
// record of what was done to it
//

struct trace_t
{

  trace_t( const std::string & id ,
	   const std::vector<double> & time ,
	   const std::vector<std::string> & analytes );

  std::string id;

  std::vector<double> time;

  std::vector<std::string> analytes;

  // stages

  void set_stage( stage_t s , const analyte_map_t & d , bool make_focus = true );

  void set_focus( stage_t s );

  stage_t focus_stage() const { return focus; }

  bool has_stage( stage_t s ) const { return data.find( s ) != data.end(); }

  const analyte_map_t & stage( stage_t s ) const;

  const analyte_map_t & focus_data() const { return stage( focus ); }

  const std::vector<double> & values( const std::string & analyte ) const;

  const std::vector<double> & values( stage_t s , const std::string & analyte ) const;

  std::vector<stage_t> stages() const;

  // checks

  int size() const { return time.size(); }

  bool has_analyte( const std::string & a ) const;

  void check_analytes( const std::vector<std::string> & a ) const;

  // first time step
  double dt() const;

  // regions

  std::vector<bool> bkg , sig , trn;

  range_list_t bkgrng , sigrng , trnrng;

  // 1..n signal segment numbers, 0 elsewhere
  std::vector<int> ns;

  int n;

  // set bkg/sig, clear the edges, then re-derive trn, range lists and numbering
  void set_regions( const std::vector<bool> & b , const std::vector<bool> & s , bool clear_edges = true );

  // rebuild regions from (stored) range lists
  void load_ranges( const range_list_t & b , const range_list_t & s );

  bool autoranged() const { return has_ranges; }

  // filters

  filt_t filt;

  // record of processing parameters, by step
  std::map<std::string,param_t> params;

  // non-fatal problems met while processing this trace
  std::vector<std::string> diagnostics;

  void warn( const std::string & msg );

 private:

  std::map<stage_t,analyte_map_t> data;

  stage_t focus;

  bool has_ranges;

};

#endif
