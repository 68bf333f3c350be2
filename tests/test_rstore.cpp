
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
#include "sstore/rstore.h"
#include "filters/generators.h"
#include "trace/ranges.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "db/sqlwrap.h"

#include <cstdio>
#include <unistd.h>

class RStoreTest : public ::testing::Test {

protected:

  void SetUp()
  {
    test_init();
    dbfile = "/tmp/latrace-rstore-" + Helper::int2str( (int)getpid() ) + ".db";
    std::remove( dbfile.c_str() );
  }

  void TearDown()
  {
    std::remove( dbfile.c_str() );
  }

  // 40 samples, two signal segments, two filters with mixed switches
  trace_t processed()
  {
    std::vector<double> a( 40 ) , b( 40 );
    for (int i=0; i<40; i++)
      {
	a[i] = i;
	b[i] = 40 - i;
      }
    trace_t trace = test_trace( { "A" , "B" } , { a , b } , "s7" );

    std::vector<bool> bk( 40 , false ) , sg( 40 , false );
    for (int i=2; i<8; i++) bk[i] = true;
    for (int i=10; i<18; i++) sg[i] = true;
    for (int i=22; i<27; i++) bk[i] = true;
    for (int i=29; i<37; i++) sg[i] = true;
    trace.set_regions( bk , sg );

    param_t p;
    p.parse( "analyte=A" );
    p.parse( "threshold=20" );
    filters::threshold( trace , "A" , 20 , true , filt_selector_t() , p );
    filters::threshold( trace , "B" , 5 , false );
    trace.filt.off( "B_thresh" , { "A" } );

    param_t ar;
    ar.parse( "analyte=A" );
    ar.parse( "win=10" );
    trace.params[ "autorange" ] = ar;

    return trace;
  }

  std::string dbfile;

};


TEST_F( RStoreTest , RoundTrip )
{
  trace_t src = processed();

  {
    rstore_t store( dbfile );
    ASSERT_TRUE( store.attached() );
    store.save( src );
  }

  // a fresh copy of the same sample, as loaded from its CSV
  trace_t dst = test_trace( src.analytes , { src.values( "A" ) , src.values( "B" ) } , "s7" );

  rstore_t store( dbfile );
  ASSERT_TRUE( store.load( dst ) );

  // regions
  ASSERT_TRUE( dst.autoranged() );
  EXPECT_EQ( dst.n , 2 );
  EXPECT_EQ( dst.sig , src.sig );
  EXPECT_EQ( dst.bkg , src.bkg );
  EXPECT_EQ( dst.trn , src.trn );

  // filters, in order, with their switches
  ASSERT_EQ( dst.filt.size() , 2 );
  EXPECT_EQ( dst.filt.filters()[0].name , "A_thresh_above" );
  EXPECT_EQ( dst.filt.filters()[1].name , "B_thresh_below" );
  EXPECT_EQ( dst.filt.filter( "A_thresh_above" ).mask , src.filt.filter( "A_thresh_above" ).mask );
  EXPECT_EQ( dst.filt.filter( "A_thresh_above" ).info , src.filt.filter( "A_thresh_above" ).info );
  EXPECT_EQ( dst.filt.filter( "A_thresh_above" ).params.value( "threshold" ) , "20" );

  EXPECT_TRUE( dst.filt.is_on( "A_thresh_above" , "A" ) );
  EXPECT_TRUE( dst.filt.is_on( "A_thresh_above" , "B" ) );
  EXPECT_FALSE( dst.filt.is_on( "B_thresh_below" , "A" ) );
  EXPECT_TRUE( dst.filt.is_on( "B_thresh_below" , "B" ) );

  // step parameters
  ASSERT_TRUE( dst.params.count( "autorange" ) );
  EXPECT_EQ( dst.params[ "autorange" ].value( "win" ) , "10" );

  std::set<std::string> ids = store.samples();
  EXPECT_EQ( ids.size() , 1 );
  EXPECT_TRUE( ids.count( "s7" ) );
}

TEST_F( RStoreTest , SaveReplaces )
{
  trace_t src = processed();

  rstore_t store( dbfile );
  store.save( src );

  src.filt.remove( "A_thresh_above" );
  src.params.clear();
  store.save( src );

  trace_t dst = test_trace( src.analytes , { src.values( "A" ) , src.values( "B" ) } , "s7" );
  ASSERT_TRUE( store.load( dst ) );

  EXPECT_EQ( dst.filt.size() , 1 );
  EXPECT_FALSE( dst.filt.has( "A_thresh_above" ) );
  EXPECT_EQ( dst.params.size() , 0 );
}

TEST_F( RStoreTest , UnknownSampleAndLengthMismatch )
{
  trace_t src = processed();

  rstore_t store( dbfile );
  store.save( src );

  trace_t other = test_trace( { "A" } , { std::vector<double>( 40 , 1.0 ) } , "s8" );
  EXPECT_FALSE( store.load( other ) );
  EXPECT_FALSE( other.autoranged() );
  EXPECT_EQ( other.filt.size() , 0 );

  // same ID, different length: nothing is replaced
  trace_t shorter = test_trace( src.analytes , { std::vector<double>( 30 , 1.0 ) , std::vector<double>( 30 , 1.0 ) } , "s7" );
  shorter.filt.add( "keep" , std::vector<bool>( 30 , true ) );
  EXPECT_THROW( store.load_filters( shorter ) , data_shape_error_t );
  EXPECT_TRUE( shorter.filt.has( "keep" ) );
}

TEST_F( RStoreTest , ParamValuesWithSpaces )
{
  trace_t src = processed();

  param_t p;
  p.add( "filt" , "A_thresh_above & ! B_thresh_below" );
  p.add( "note" , "\"two words\" and #three#" );
  p.add( "expr" , "a=b" );
  p.add( "any" , "__null__" );
  src.filt.add( "combined" , std::vector<bool>( 40 , true ) , "logic" , p );
  src.params[ "filter_logic" ] = p;

  rstore_t store( dbfile );
  store.save( src );

  trace_t dst = test_trace( src.analytes , { src.values( "A" ) , src.values( "B" ) } , "s7" );
  ASSERT_TRUE( store.load( dst ) );

  ASSERT_TRUE( dst.filt.has( "combined" ) );
  const param_t & q = dst.filt.filter( "combined" ).params;
  EXPECT_EQ( q.size() , 4 );
  EXPECT_EQ( q.value( "filt" ) , "A_thresh_above & ! B_thresh_below" );
  EXPECT_EQ( q.dump( "" , "\n" ) , p.dump( "" , "\n" ) );
  EXPECT_EQ( q.value( "expr" ) , "a=b" );
  EXPECT_TRUE( q.yesno( "any" ) );

  ASSERT_TRUE( dst.params.count( "filter_logic" ) );
  EXPECT_EQ( dst.params[ "filter_logic" ].value( "filt" ) , "A_thresh_above & ! B_thresh_below" );
  EXPECT_EQ( dst.params[ "autorange" ].value( "win" ) , "10" );
}

TEST_F( RStoreTest , FailedSaveRollsBack )
{
  trace_t src = processed();

  rstore_t store( dbfile );
  store.save( src );

  // a second connection removes the params table, so the next save
  // fails after its ranges and filters have been written
  {
    SQL other;
    ASSERT_TRUE( other.open( dbfile ) );
    other.query( "DROP TABLE params;" );
  }

  trace_t changed = src;
  changed.filt.remove( "A_thresh_above" );
  EXPECT_THROW( store.save( changed ) , latrace_error_t );

  // the earlier save is intact, and the store holds no open transaction
  {
    SQL other;
    ASSERT_TRUE( other.open( dbfile ) );
    other.query( "CREATE TABLE params ( sample VARCHAR(20) NOT NULL , step VARCHAR(20) NOT NULL , params TEXT );" );
  }

  trace_t dst = test_trace( src.analytes , { src.values( "A" ) , src.values( "B" ) } , "s7" );
  ASSERT_TRUE( store.load( dst ) );
  EXPECT_EQ( dst.filt.size() , 2 );
  EXPECT_TRUE( dst.filt.has( "A_thresh_above" ) );
  EXPECT_EQ( dst.sig , src.sig );

  EXPECT_NO_THROW( store.save( changed ) );
  trace_t again = test_trace( src.analytes , { src.values( "A" ) , src.values( "B" ) } , "s7" );
  ASSERT_TRUE( store.load( again ) );
  EXPECT_EQ( again.filt.size() , 1 );
  EXPECT_FALSE( again.filt.has( "A_thresh_above" ) );
}
