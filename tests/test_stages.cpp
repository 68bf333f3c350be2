
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
#include "trace/stages.h"
#include "trace/trace-io.h"
#include "stats/sample-stats.h"
#include "helper/exception.h"

#include <sstream>

// 12 samples: bkg 1..4, sig 6..9, the rest transition
static trace_t staged_trace()
{
  std::vector<double> a = { 0 , 10 , 10 , 12 , 12 , 50 , 110 , 120 , 110 , 120 , 40 , 11 };
  std::vector<double> b = { 0 , 1 , 1 , 1 , 1 , 5 , 21 , 21 , 41 , 41 , 3 , 1 };

  trace_t trace = test_trace( { "A" , "B" } , { a , b } );

  std::vector<bool> bk( 12 , false ) , sg( 12 , false );
  for (int i=1; i<=4; i++) bk[i] = true;
  for (int i=6; i<=9; i++) sg[i] = true;
  trace.set_regions( bk , sg );
  return trace;
}


TEST( Stages , SeparateKeepsFocus )
{
  test_init();

  trace_t trace = staged_trace();

  Stages::separate( trace );

  ASSERT_TRUE( trace.has_stage( SIGNAL ) );
  ASSERT_TRUE( trace.has_stage( BACKGROUND ) );
  EXPECT_EQ( trace.focus_stage() , RAWDATA );

  const std::vector<double> & s = trace.values( SIGNAL , "A" );
  const std::vector<double> & b = trace.values( BACKGROUND , "A" );

  EXPECT_DOUBLE_EQ( s[6] , 110 );
  EXPECT_TRUE( std::isnan( s[2] ) );
  EXPECT_TRUE( std::isnan( s[5] ) );
  EXPECT_DOUBLE_EQ( b[2] , 10 );
  EXPECT_TRUE( std::isnan( b[7] ) );
}

TEST( Stages , ConstantBackground )
{
  test_init();

  trace_t trace = staged_trace();

  param_t p;
  Stages::bkg_correct( trace , p );

  EXPECT_EQ( trace.focus_stage() , BKGSUB );

  // A background 10,10,12,12 -> 11; B -> 1
  const std::vector<double> & a = trace.values( "A" );
  EXPECT_DOUBLE_EQ( a[6] , 99 );
  EXPECT_DOUBLE_EQ( a[7] , 109 );
  EXPECT_TRUE( std::isnan( a[1] ) );
  EXPECT_DOUBLE_EQ( trace.values( "B" )[8] , 40 );

  EXPECT_TRUE( trace.params.count( "bkg_correct" ) );
}

TEST( Stages , PolynomialBackground )
{
  test_init();

  // background drifts linearly with time: 10 + 100 t
  std::vector<double> t = test_time( 12 );
  std::vector<double> a( 12 );
  for (int i=0; i<12; i++) a[i] = 10 + 100 * t[i];
  for (int i=6; i<=9; i++) a[i] += 500;

  analyte_map_t sig , bkg;
  sig[ "A" ] = a;
  bkg[ "A" ] = a;
  for (int i=0; i<12; i++)
    {
      if ( i < 1 || i > 4 ) bkg[ "A" ][i] = globals::nan;
      if ( i < 6 || i > 9 ) sig[ "A" ][i] = globals::nan;
    }

  analyte_map_t lin = Stages::bkg_subtract( sig , bkg , t , 1 );
  for (int i=6; i<=9; i++)
    EXPECT_NEAR( lin[ "A" ][i] , 500 , 1e-6 ) << i;

  // a constant background leaves the drift in
  analyte_map_t con = Stages::bkg_subtract( sig , bkg , t );
  EXPECT_NEAR( con[ "A" ][9] , 500 + 100 * ( 0.9 - 0.25 ) , 1e-6 );

  // a cubic needs four points
  EXPECT_NO_THROW( Stages::bkg_subtract( sig , bkg , t , 3 ) );
  EXPECT_THROW( Stages::bkg_subtract( sig , bkg , t , 4 ) , latrace_error_t );

  trace_t trace = staged_trace();
  param_t p;
  p.parse( "mode=-2" );
  EXPECT_THROW( Stages::bkg_correct( trace , p ) , latrace_error_t );
}

TEST( Stages , Ratios )
{
  test_init();

  trace_t trace = staged_trace();
  Stages::bkg_correct( trace , param_t() );

  param_t p;
  p.parse( "denom=B" );
  Stages::ratio( trace , p );

  EXPECT_EQ( trace.focus_stage() , RATIOS );

  // (110-11)/(21-1), (120-11)/(41-1)
  EXPECT_DOUBLE_EQ( trace.values( "A" )[6] , 99.0 / 20.0 );
  EXPECT_DOUBLE_EQ( trace.values( "A" )[9] , 109.0 / 40.0 );
  EXPECT_DOUBLE_EQ( trace.values( "B" )[7] , 1.0 );

  // from another stage
  param_t raw;
  raw.parse( "denom=B" );
  raw.parse( "stage=rawdata" );
  Stages::ratio( trace , raw );
  EXPECT_DOUBLE_EQ( trace.values( "A" )[1] , 10.0 );

  param_t bad;
  bad.parse( "denom=Ca43" );
  EXPECT_THROW( Stages::ratio( trace , bad ) , data_shape_error_t );
}


TEST( Stages , SampleStatsPerSegment )
{
  test_init();

  std::vector<double> a( 20 , 0 );
  for (int i=3; i<=6; i++) a[i] = 10 + ( i % 2 ) * 2;    // 10,12,10,12 at 3..6
  for (int i=11; i<=14; i++) a[i] = 20;

  trace_t trace = test_trace( { "A" } , { a } );

  std::vector<bool> bk( 20 , false ) , sg( 20 , false );
  for (int i=3; i<=6; i++) sg[i] = true;
  for (int i=11; i<=14; i++) sg[i] = true;
  for (int i=8; i<=9; i++) bk[i] = true;
  trace.set_regions( bk , sg );
  ASSERT_EQ( trace.n , 2 );

  sample_stats_t st = Statistics::sample_stats( trace );

  ASSERT_EQ( st[ "A" ].size() , 3 );

  const seg_stats_t & s1 = st[ "A" ][1];
  EXPECT_EQ( s1.n , 4 );
  EXPECT_DOUBLE_EQ( s1.mean , 11 );
  EXPECT_DOUBLE_EQ( s1.sd , 1 );
  EXPECT_DOUBLE_EQ( s1.se , 0.5 );

  EXPECT_DOUBLE_EQ( st[ "A" ][2].mean , 20 );
  EXPECT_DOUBLE_EQ( st[ "A" ][2].sd , 0 );

  EXPECT_EQ( st[ "A" ][0].n , 8 );
  EXPECT_DOUBLE_EQ( st[ "A" ][0].mean , 15.5 );

  // a filter that drops the second segment entirely
  std::vector<bool> m( 20 , true );
  for (int i=10; i<20; i++) m[i] = false;
  trace.filt.add( "first" , m );

  sample_stats_t fs = Statistics::sample_stats( trace , filt_selector_t::switches() );
  EXPECT_EQ( fs[ "A" ][2].n , 0 );
  EXPECT_TRUE( std::isnan( fs[ "A" ][2].mean ) );
  EXPECT_EQ( fs[ "A" ][0].n , 4 );

  std::stringstream out;
  param_t p;
  p.parse( "filt=F" );
  Statistics::sample_stats( trace , p , out );
  EXPECT_NE( out.str().find( "s1\trawdata\tA\tALL\t8\t15.5" ) , std::string::npos );
}


TEST( TraceIO , ReadWrite )
{
  test_init();

  std::stringstream in;
  in << "# instrument export\n"
     << "Time,Mg24, Sr88\n"
     << "0.0,100,2\n"
     << "0.5,NA,3\n"
     << "1.0,1e3,nan\n";

  trace_t trace = trace_io::read_csv( in , "std1" );

  EXPECT_EQ( trace.id , "std1" );
  EXPECT_EQ( trace.size() , 3 );
  ASSERT_EQ( trace.analytes.size() , 2 );
  EXPECT_EQ( trace.analytes[1] , "Sr88" );
  EXPECT_DOUBLE_EQ( trace.dt() , 0.5 );
  EXPECT_DOUBLE_EQ( trace.values( "Mg24" )[2] , 1000 );
  EXPECT_TRUE( std::isnan( trace.values( "Mg24" )[1] ) );
  EXPECT_TRUE( std::isnan( trace.values( "Sr88" )[2] ) );
  EXPECT_EQ( trace.focus_stage() , RAWDATA );

  std::stringstream out;
  trace_io::write_csv( trace , out );
  EXPECT_EQ( out.str() , "Time,Mg24,Sr88\n0,100,2\n0.5,nan,3\n1,1000,nan\n" );
}

TEST( TraceIO , BadInput )
{
  test_init();

  std::stringstream noheader( "0,1,2\n" );
  EXPECT_THROW( trace_io::read_csv( noheader , "x" ) , latrace_error_t );

  std::stringstream ragged( "Time,A,B\n0,1,2\n1,2\n" );
  EXPECT_THROW( trace_io::read_csv( ragged , "x" ) , data_shape_error_t );

  std::stringstream empty( "# nothing\n" );
  EXPECT_THROW( trace_io::read_csv( empty , "x" ) , data_shape_error_t );

  EXPECT_THROW( trace_io::load_csv( "/no/such/file.csv" ) , latrace_error_t );
}
