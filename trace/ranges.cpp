
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

#include "trace/ranges.h"
#include "helper/helper.h"
#include "helper/exception.h"

#include <sstream>

range_list_t Ranges::mask_to_ranges( const std::vector<bool> & mask , const std::vector<double> & t )
{
  const int n = mask.size();
  if ( t.size() != n )
    throw data_shape_error_t( "mask_to_ranges(): mask and time differ in length" );

  range_list_t r;

  // edge samples never start or end a run
  int start = -1;
  for (int i=1; i<n-1; i++)
    {
      if ( mask[i] )
	{
	  if ( start == -1 ) start = i;
	}
      else if ( start != -1 )
	{
	  r.push_back( range_t( t[start] , t[i-1] ) );
	  start = -1;
	}
    }

  if ( start != -1 )
    r.push_back( range_t( t[start] , t[n-2] ) );

  return r;
}


std::vector<bool> Ranges::ranges_to_mask( const range_list_t & r , const std::vector<double> & t )
{
  const int n = t.size();
  std::vector<bool> m( n , false );
  for (int j=0; j<r.size(); j++)
    for (int i=0; i<n; i++)
      if ( t[i] >= r[j].start && t[i] <= r[j].stop ) m[i] = true;
  return m;
}


std::vector<int> Ranges::enumerate( const std::vector<bool> & mask , int * n )
{
  const int sz = mask.size();
  std::vector<int> ns( sz , 0 );
  int cnt = 0;
  for (int i=0; i<sz; i++)
    {
      if ( ! mask[i] ) continue;
      if ( i == 0 || ! mask[i-1] ) ++cnt;
      ns[i] = cnt;
    }
  if ( n != NULL ) *n = cnt;
  return ns;
}


std::vector<bool> Ranges::mask_and( const std::vector<bool> & a , const std::vector<bool> & b )
{
  if ( a.size() != b.size() ) throw data_shape_error_t( "mask_and(): masks differ in length" );
  std::vector<bool> r( a.size() );
  for (int i=0; i<a.size(); i++) r[i] = a[i] && b[i];
  return r;
}

std::vector<bool> Ranges::mask_or( const std::vector<bool> & a , const std::vector<bool> & b )
{
  if ( a.size() != b.size() ) throw data_shape_error_t( "mask_or(): masks differ in length" );
  std::vector<bool> r( a.size() );
  for (int i=0; i<a.size(); i++) r[i] = a[i] || b[i];
  return r;
}

std::vector<bool> Ranges::mask_not( const std::vector<bool> & a )
{
  std::vector<bool> r( a.size() );
  for (int i=0; i<a.size(); i++) r[i] = ! a[i];
  return r;
}

int Ranges::count( const std::vector<bool> & a )
{
  int c = 0;
  for (int i=0; i<a.size(); i++) if ( a[i] ) ++c;
  return c;
}

std::string Ranges::str( const range_list_t & r )
{
  std::stringstream ss;
  for (int i=0; i<r.size(); i++)
    {
      if ( i ) ss << " ";
      ss << "[" << r[i].start << "," << r[i].stop << "]";
    }
  return ss.str();
}
