
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

#ifndef __LATRACE_TEST_COMMON_H__
#define __LATRACE_TEST_COMMON_H__

#include <string>
#include <vector>
#include <cmath>

#include "defs/defs.h"
#include "trace/trace.h"

// quiet defaults for every test
inline void test_init()
{
  globals::init_defs();
  globals::silent = true;
}

// time axis 0, dt, 2dt, ...
inline std::vector<double> test_time( int n , double dt = 0.1 )
{
  std::vector<double> t( n );
  for (int i=0; i<n; i++) t[i] = i * dt;
  return t;
}

// trace with RAWDATA set from the given analyte columns
inline trace_t test_trace( const std::vector<std::string> & analytes ,
			   const std::vector<std::vector<double> > & cols ,
			   const std::string & id = "s1" ,
			   double dt = 0.1 )
{
  trace_t trace( id , test_time( cols[0].size() , dt ) , analytes );
  analyte_map_t d;
  for (int a=0; a<analytes.size(); a++) d[ analytes[a] ] = cols[a];
  trace.set_stage( RAWDATA , d );
  return trace;
}

// n samples alternating between a and b
inline std::vector<double> alternating( int n , double a , double b )
{
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = i % 2 ? b : a;
  return x;
}

// background / signal blocks: bkg for nb samples, then (sig for ns, bkg for nb) x k,
// with a small deterministic wobble
inline std::vector<double> plateaus( int k , int nb , int ns , double bkg , double sig )
{
  std::vector<double> x;
  for (int i=0; i<nb; i++) x.push_back( bkg * ( 1 + 0.05 * ( i % 3 - 1 ) ) );
  for (int p=0; p<k; p++)
    {
      for (int i=0; i<ns; i++) x.push_back( sig * ( 1 + 0.02 * ( i % 5 - 2 ) ) );
      for (int i=0; i<nb; i++) x.push_back( bkg * ( 1 + 0.05 * ( i % 3 - 1 ) ) );
    }
  return x;
}

#endif
