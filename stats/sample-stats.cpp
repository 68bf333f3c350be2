
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

#include "stats/sample-stats.h"
#include "trace/trace.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;

static seg_stats_t summarise( const std::vector<double> & x )
{
  seg_stats_t s;
  s.n = x.size();
  if ( s.n == 0 )
    {
      s.mean = s.sd = s.se = globals::nan;
      return s;
    }
  s.mean = MiscMath::mean( x );
  double ss = 0;
  for (int i=0; i<x.size(); i++) ss += ( x[i] - s.mean ) * ( x[i] - s.mean );
  s.sd = sqrt( ss / (double)s.n );
  s.se = s.sd / sqrt( (double)s.n );
  return s;
}


sample_stats_t Statistics::sample_stats( trace_t & trace ,
					 const filt_selector_t & sel ,
					 const std::vector<std::string> & analytes )
{

  const std::vector<std::string> alist = analytes.size() ? analytes : trace.analytes;

  trace.check_analytes( alist );

  sample_stats_t res;

  for (int a=0; a<alist.size(); a++)
    {
      std::vector<bool> ind = trace.filt.grab( sel , alist[a] );
      const std::vector<double> & v = trace.values( alist[a] );

      std::vector<double> all;
      std::map<int,std::vector<double> > segs;
      for (int s=1; s<=trace.n; s++) segs[s];

      for (int i=0; i<v.size(); i++)
	{
	  if ( ! ind[i] || trace.ns[i] == 0 || ! Helper::realnum( v[i] ) ) continue;
	  segs[ trace.ns[i] ].push_back( v[i] );
	  all.push_back( v[i] );
	}

      std::map<int,seg_stats_t> & r = res[ alist[a] ];
      r[0] = summarise( all );
      std::map<int,std::vector<double> >::const_iterator ss = segs.begin();
      while ( ss != segs.end() )
	{
	  r[ ss->first ] = summarise( ss->second );
	  ++ss;
	}
    }

  return res;
}


void Statistics::sample_stats( trace_t & trace , const param_t & param , std::ostream & out )
{

  std::vector<std::string> analytes;
  if ( param.has( "analytes" ) ) analytes = param.strvector( "analytes" );

  sample_stats_t res = sample_stats( trace , filt_selector_t::from_param( param ) , analytes );

  logger << "  statistics for " << res.size() << " analyte(s) over " << trace.n << " segment(s)\n";

  out << "ID\tSTAGE\tANALYTE\tSEG\tN\tMEAN\tSD\tSE\n";

  sample_stats_t::const_iterator aa = res.begin();
  while ( aa != res.end() )
    {
      std::map<int,seg_stats_t>::const_iterator ss = aa->second.begin();
      while ( ss != aa->second.end() )
	{
	  const seg_stats_t & s = ss->second;
	  out << trace.id << "\t"
	      << globals::stage( trace.focus_stage() ) << "\t"
	      << aa->first << "\t"
	      << ( ss->first == 0 ? std::string( "ALL" ) : Helper::int2str( ss->first ) ) << "\t"
	      << s.n << "\t";
	  if ( s.n )
	    out << s.mean << "\t" << s.sd << "\t" << s.se << "\n";
	  else
	    out << globals::missing_value_symbol << "\t"
		<< globals::missing_value_symbol << "\t"
		<< globals::missing_value_symbol << "\n";
	  ++ss;
	}
      ++aa;
    }
}
