
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

#ifndef __LATRACE_RANGES_H__
#define __LATRACE_RANGES_H__

#include <vector>
#include <string>

//
// a contiguous run of samples, as the times of its first and last
// sample (both inclusive)
//

struct range_t
{
  range_t() : start(0) , stop(0) { }
  range_t( double a , double b ) : start(a) , stop(b) { }

  double start;
  double stop;

  double width() const { return stop - start; }

  bool operator<( const range_t & rhs ) const
  {
    if ( start < rhs.start ) return true;
    if ( start > rhs.start ) return false;
    return stop < rhs.stop;
  }

  bool operator==( const range_t & rhs ) const
  {
    return start == rhs.start && stop == rhs.stop;
  }
};

typedef std::vector<range_t> range_list_t;

namespace Ranges
{

  // runs of True, ignoring the first and last sample
  range_list_t mask_to_ranges( const std::vector<bool> & mask , const std::vector<double> & t );

  // samples with start <= t <= stop for any range
  std::vector<bool> ranges_to_mask( const range_list_t & r , const std::vector<double> & t );

  // 1-based run numbers (0 outside any run); 'n' set to the number of runs
  std::vector<int> enumerate( const std::vector<bool> & mask , int * n = NULL );

  // element-wise helpers
  std::vector<bool> mask_and( const std::vector<bool> & a , const std::vector<bool> & b );
  std::vector<bool> mask_or( const std::vector<bool> & a , const std::vector<bool> & b );
  std::vector<bool> mask_not( const std::vector<bool> & a );
  int count( const std::vector<bool> & a );

  std::string str( const range_list_t & r );

}

#endif
