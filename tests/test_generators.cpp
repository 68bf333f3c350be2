
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
#include "filters/generators.h"
#include "stats/cluster.h"
#include "trace/ranges.h"
#include "helper/exception.h"

//
// threshold
//

TEST( Generators , ThresholdAboveAndBelow )
{
  test_init();

  std::vector<double> a( 20 );
  for (int i=0; i<20; i++) a[i] = i;
  a[15] = globals::nan;

  trace_t trace = test_trace( { "A" , "B" } , { a , std::vector<double>( 20 , 1.0 ) } );

  const std::string up = filters::threshold( trace , "A" , 10 , true );
  const std::string dn = filters::threshold( trace , "A" , 10 , false );

  EXPECT_EQ( up , "A_thresh_above" );
  EXPECT_EQ( dn , "A_thresh_below" );

  // 10..19 without the missing sample
  EXPECT_EQ( Ranges::count( trace.filt.filter( up ).mask ) , 9 );
  EXPECT_FALSE( trace.filt.filter( up ).mask[15] );

  // 0..10
  EXPECT_EQ( Ranges::count( trace.filt.filter( dn ).mask ) , 11 );
  EXPECT_TRUE( trace.filt.filter( dn ).mask[10] );

  EXPECT_EQ( trace.filt.filter( up ).info , "Keep above 1.000e+01 A" );

  // same name twice
  EXPECT_THROW( filters::threshold( trace , "A" , 3 , true ) , duplicate_name_error_t );
}

TEST( Generators , ThresholdCommand )
{
  test_init();

  std::vector<double> a( 20 );
  for (int i=0; i<20; i++) a[i] = i;
  trace_t trace = test_trace( { "A" } , { a } );

  param_t p;
  p.parse( "analyte=A" );
  p.parse( "threshold=5" );
  p.parse( "mode=below" );
  filters::threshold( trace , p );

  ASSERT_TRUE( trace.filt.has( "A_thresh_below" ) );
  EXPECT_EQ( trace.filt.filter( "A_thresh_below" ).params.value( "threshold" ) , "5" );
  EXPECT_EQ( Ranges::count( trace.filt.make( "A" ) ) , 6 );

  param_t bad;
  bad.parse( "analyte=A" );
  bad.parse( "threshold=5" );
  bad.parse( "mode=sideways" );
  EXPECT_THROW( filters::threshold( trace , bad ) , latrace_error_t );
}

TEST( Generators , SelectorRestrictsThreshold )
{
  test_init();

  std::vector<double> a( 20 );
  for (int i=0; i<20; i++) a[i] = i;
  trace_t trace = test_trace( { "A" } , { a } );

  filters::threshold( trace , "A" , 15 , false );

  // only samples kept by the first filter are candidates for the second
  filters::threshold( trace , "A" , 5 , true , filt_selector_t::key( "A_thresh_below" ) );

  EXPECT_EQ( Ranges::count( trace.filt.filter( "A_thresh_above" ).mask ) , 11 );
  EXPECT_FALSE( trace.filt.filter( "A_thresh_above" ).mask[18] );
}


//
// distribution
//

TEST( Generators , BimodalDistributionSplitsInTwo )
{
  test_init();

  // 30 samples near 10, then 30 near 100
  std::vector<double> a;
  for (int i=0; i<30; i++) a.push_back( 10 + 0.1 * ( i % 5 ) );
  for (int i=0; i<30; i++) a.push_back( 100 + 1.0 * ( i % 5 ) );

  trace_t trace = test_trace( { "A" } , { a } );

  distribution_t res = filters::distribution( trace , "A" );

  ASSERT_EQ( res.limits.size() , 1 );
  EXPECT_GT( res.limits[0] , 11 );
  EXPECT_LT( res.limits[0] , 100 );
  EXPECT_EQ( res.grid.size() , 20 );

  ASSERT_EQ( res.names.size() , 2 );
  EXPECT_EQ( res.names[0] , "A_distribution_1" );
  EXPECT_EQ( res.names[1] , "A_distribution_2" );

  const std::vector<bool> & lo = trace.filt.filter( "A_distribution_1" ).mask;
  const std::vector<bool> & hi = trace.filt.filter( "A_distribution_2" ).mask;

  for (int i=0; i<60; i++)
    {
      EXPECT_EQ( lo[i] , i < 30 ) << i;
      EXPECT_EQ( hi[i] , i >= 30 ) << i;
    }
}

TEST( Generators , LogDistribution )
{
  test_init();

  std::vector<double> a;
  for (int i=0; i<30; i++) a.push_back( 10 * ( 1 + 0.01 * ( i % 5 ) ) );
  for (int i=0; i<30; i++) a.push_back( 1e4 * ( 1 + 0.01 * ( i % 5 ) ) );

  trace_t trace = test_trace( { "A" } , { a } );

  param_t p;
  p.parse( "analyte=A" );
  p.parse( "transform=log" );
  filters::distribution( trace , p );

  ASSERT_TRUE( trace.filt.has( "A_distribution_2" ) );
  EXPECT_EQ( Ranges::count( trace.filt.filter( "A_distribution_2" ).mask ) , 30 );
  EXPECT_FALSE( trace.filt.has( "A_distribution_3" ) );
}

TEST( Generators , SingleDistributionFails )
{
  test_init();

  std::vector<double> a( 60 );
  for (int i=0; i<60; i++) a[i] = 1 + i;

  trace_t trace = test_trace( { "A" } , { a } );

  distribution_t res = filters::distribution( trace , "A" );

  ASSERT_EQ( res.names.size() , 1 );
  EXPECT_EQ( res.names[0] , "A_distribution_failed" );
  EXPECT_EQ( res.limits.size() , 0 );
  EXPECT_EQ( Ranges::count( trace.filt.filter( "A_distribution_failed" ).mask ) , 60 );
  EXPECT_EQ( trace.diagnostics.size() , 1 );
}


//
// correlation
//

TEST( Generators , CorrelationFlagsCorrelatedWindows )
{
  test_init();

  std::vector<double> x( 50 ) , y( 50 );
  for (int i=0; i<50; i++)
    {
      x[i] = i;
      y[i] = i < 25 ? 2 * i + 1 : ( i % 2 ? 10 : 0 );
    }

  trace_t trace = test_trace( { "A" , "B" } , { x , y } );

  const std::string name = filters::correlation( trace , "A" , "B" , 5 , 0.9 , 0.05 );

  EXPECT_EQ( name , "A-B_corr" );

  const std::vector<bool> & m = trace.filt.filter( name ).mask;

  // windows that do not fit are kept
  EXPECT_TRUE( m[0] );
  EXPECT_TRUE( m[1] );
  EXPECT_TRUE( m[49] );

  // perfectly correlated
  for (int i=2; i<=22; i++) EXPECT_FALSE( m[i] ) << i;

  // uncorrelated
  for (int i=27; i<=47; i++) EXPECT_TRUE( m[i] ) << i;

  // applies to the dependent analyte only
  EXPECT_TRUE( trace.filt.is_on( name , "B" ) );
  EXPECT_FALSE( trace.filt.is_on( name , "A" ) );
}

TEST( Generators , CorrelationWindowChecks )
{
  test_init();

  std::vector<double> x( 20 , 1.0 ) , y( 20 , 2.0 );
  trace_t trace = test_trace( { "A" , "B" } , { x , y } );

  EXPECT_THROW( filters::correlation( trace , "A" , "B" , 1 ) , latrace_error_t );
  EXPECT_THROW( filters::correlation( trace , "A" , "Zn" , 5 ) , data_shape_error_t );

  // invariant windows are never flagged
  const std::string name = filters::correlation( trace , "A" , "B" , 4 );
  EXPECT_EQ( Ranges::count( trace.filt.filter( name ).mask ) , 20 );
}


//
// clustering
//

// two groups of samples in (A,B), alternating in time
static trace_t two_groups()
{
  std::vector<double> a( 40 ) , b( 40 );
  for (int i=0; i<40; i++)
    {
      const bool g = i % 2;
      a[i] = ( g ? 100 : 10 ) + 0.1 * ( i % 7 );
      b[i] = ( g ? 50 : 5 ) + 0.1 * ( i % 3 );
    }
  return test_trace( { "A" , "B" } , { a , b } );
}

TEST( Generators , KMeansClusteringCommand )
{
  test_init();

  trace_t trace = two_groups();

  param_t p;
  p.parse( "analytes=A,B" );
  p.parse( "method=kmeans" );
  p.parse( "n_clusters=2" );
  filters::clustering( trace , p );

  ASSERT_TRUE( trace.filt.has( "A-B_cluster-kmeans_0" ) );
  ASSERT_TRUE( trace.filt.has( "A-B_cluster-kmeans_1" ) );
  EXPECT_EQ( trace.filt.size() , 2 );

  const std::vector<bool> & c0 = trace.filt.filter( "A-B_cluster-kmeans_0" ).mask;
  const std::vector<bool> & c1 = trace.filt.filter( "A-B_cluster-kmeans_1" ).mask;

  for (int i=0; i<40; i++)
    {
      EXPECT_NE( c0[i] , c1[i] ) << i;
      EXPECT_EQ( c0[i] , c0[ i % 2 ] ) << i;
    }
}

TEST( Generators , MeanShiftClustering )
{
  test_init();

  trace_t trace = two_groups();

  meanshift_t ms( 1.0 );
  std::vector<std::string> names = filters::clustering( trace , { "A" , "B" } , ms );

  ASSERT_EQ( names.size() , 2 );
  EXPECT_EQ( names[0] , "A-B_cluster-meanshift_0" );

  const std::vector<bool> & c0 = trace.filt.filter( names[0] ).mask;
  for (int i=0; i<40; i++)
    EXPECT_EQ( c0[i] , c0[ i % 2 ] ) << i;
}

TEST( Generators , DBSCANClusteringAddsCoreFilter )
{
  test_init();

  trace_t trace = two_groups();

  param_t p;
  p.parse( "analytes=A,B" );
  p.parse( "method=DBSCAN" );
  p.parse( "eps=0.5" );
  p.parse( "min_samples=3" );
  filters::clustering( trace , p );

  EXPECT_TRUE( trace.filt.has( "A-B_cluster-DBSCAN_0" ) );
  EXPECT_TRUE( trace.filt.has( "A-B_cluster-DBSCAN_1" ) );
  EXPECT_TRUE( trace.filt.has( "A-B_cluster-DBSCAN_core" ) );
  EXPECT_FALSE( trace.filt.has( "A-B_cluster-DBSCAN_noise" ) );
}

TEST( Generators , ClusteringOptionErrors )
{
  test_init();

  trace_t trace = two_groups();

  param_t p1;
  p1.parse( "analytes=A,B" );
  p1.parse( "method=hierarchical" );
  EXPECT_THROW( filters::clustering( trace , p1 ) , latrace_error_t );

  param_t p2;
  p2.parse( "analytes=A,B" );
  p2.parse( "method=kmeans" );
  EXPECT_THROW( filters::clustering( trace , p2 ) , latrace_error_t );

  EXPECT_EQ( trace.filt.size() , 0 );
}
