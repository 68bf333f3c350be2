
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

#include <gtest/gtest.h>

#include "test-common.h"
#include "trace/ranges.h"
#include "helper/exception.h"

TEST( Ranges , MaskToRangesSkipsEdgeSamples )
{
  std::vector<double> t = test_time( 10 , 1.0 );
  std::vector<bool> m( 10 , false );
  m[0] = m[1] = m[2] = true;
  m[5] = m[6] = true;
  m[9] = true;

  range_list_t r = Ranges::mask_to_ranges( m , t );

  ASSERT_EQ( r.size() , 2 );
  EXPECT_DOUBLE_EQ( r[0].start , 1 );
  EXPECT_DOUBLE_EQ( r[0].stop , 2 );
  EXPECT_DOUBLE_EQ( r[1].start , 5 );
  EXPECT_DOUBLE_EQ( r[1].stop , 6 );
}

TEST( Ranges , RunToEndStopsAtPenultimate )
{
  std::vector<double> t = test_time( 6 , 1.0 );
  std::vector<bool> m( 6 , true );
  range_list_t r = Ranges::mask_to_ranges( m , t );
  ASSERT_EQ( r.size() , 1 );
  EXPECT_DOUBLE_EQ( r[0].start , 1 );
  EXPECT_DOUBLE_EQ( r[0].stop , 4 );
}

TEST( Ranges , RoundTripInterior )
{
  std::vector<double> t = test_time( 20 , 0.5 );
  std::vector<bool> m( 20 , false );
  for (int i=3; i<8; i++) m[i] = true;
  for (int i=12; i<15; i++) m[i] = true;

  std::vector<bool> m2 = Ranges::ranges_to_mask( Ranges::mask_to_ranges( m , t ) , t );
  EXPECT_EQ( m , m2 );
}

TEST( Ranges , EnumerateNumbersRuns )
{
  std::vector<bool> m( 9 , false );
  m[1] = m[2] = true;
  m[4] = true;
  m[6] = m[7] = m[8] = true;

  int n = 0;
  std::vector<int> ns = Ranges::enumerate( m , &n );

  EXPECT_EQ( n , 3 );
  std::vector<int> expected = { 0 , 1 , 1 , 0 , 2 , 0 , 3 , 3 , 3 };
  EXPECT_EQ( ns , expected );
}

TEST( Ranges , MaskOperations )
{
  std::vector<bool> a = { true , true , false , false };
  std::vector<bool> b = { true , false , true , false };

  std::vector<bool> x = { true , false , false , false };
  std::vector<bool> o = { true , true , true , false };
  std::vector<bool> n = { false , false , true , true };

  EXPECT_EQ( Ranges::mask_and( a , b ) , x );
  EXPECT_EQ( Ranges::mask_or( a , b ) , o );
  EXPECT_EQ( Ranges::mask_not( a ) , n );
  EXPECT_EQ( Ranges::count( o ) , 3 );

  std::vector<bool> c( 3 , true );
  EXPECT_THROW( Ranges::mask_and( a , c ) , data_shape_error_t );
  EXPECT_THROW( Ranges::mask_to_ranges( a , test_time( 3 ) ) , data_shape_error_t );
}

TEST( Ranges , TraceRegionsAreExclusiveAndExhaustive )
{
  test_init();

  std::vector<double> x( 30 , 1.0 );
  trace_t trace = test_trace( { "A" } , { x } );

  std::vector<bool> b( 30 , false ) , s( 30 , false );
  for (int i=0; i<12; i++) b[i] = true;
  for (int i=10; i<25; i++) s[i] = true;

  trace.set_regions( b , s );

  EXPECT_TRUE( trace.autoranged() );

  for (int i=0; i<30; i++)
    {
      const int k = (int)trace.bkg[i] + (int)trace.sig[i] + (int)trace.trn[i];
      EXPECT_EQ( k , 1 ) << "sample " << i;
    }

  // overlap becomes transition, as do the edge samples
  EXPECT_TRUE( trace.trn[10] );
  EXPECT_TRUE( trace.trn[11] );
  EXPECT_TRUE( trace.trn[0] );
  EXPECT_TRUE( trace.trn[29] );

  EXPECT_EQ( trace.n , 1 );
  EXPECT_EQ( trace.ns[15] , 1 );
  EXPECT_EQ( trace.ns[5] , 0 );

  // reload from the range lists
  trace_t trace2 = test_trace( { "A" } , { x } );
  trace2.load_ranges( trace.bkgrng , trace.sigrng );
  EXPECT_EQ( trace2.bkg , trace.bkg );
  EXPECT_EQ( trace2.sig , trace.sig );
  EXPECT_EQ( trace2.trn , trace.trn );
}
