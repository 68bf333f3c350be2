
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
#include "optim/optimiser.h"
#include "filters/generators.h"
#include "trace/ranges.h"
#include "miscmath/miscmath.h"
#include "helper/exception.h"

// 25 noisy samples, a flat 50-sample plateau, 25 noisy samples
static analyte_map_t plateau_data()
{
  std::vector<double> x = alternating( 100 , 2000 , 1000 );
  for (int i=25; i<75; i++) x[i] = 100;
  analyte_map_t d;
  d[ "A" ] = x;
  return d;
}

static double finite_min( const Eigen::MatrixXd & m )
{
  double r = std::numeric_limits<double>::max();
  for (int i=0; i<m.rows(); i++)
    for (int j=0; j<m.cols(); j++)
      if ( m(i,j) == m(i,j) && m(i,j) < r ) r = m(i,j);
  return r;
}


TEST( Optimiser , Thresholds )
{
  test_init();

  std::vector<double> x = { 1 , 2 , 3 , 4 , 100 };

  EXPECT_DOUBLE_EQ( optim::threshold( x , THRESH_MEDIAN ) , 3 );
  EXPECT_DOUBLE_EQ( optim::threshold( x , THRESH_MEAN ) , 22 );

  // no spread
  std::vector<double> c( 10 , 4.5 );
  EXPECT_DOUBLE_EQ( optim::threshold( c , THRESH_KDE_FIRST_MAX ) , 4.5 );

  // the mode of a skewed sample sits low
  std::vector<double> s;
  for (int i=0; i<50; i++) s.push_back( 1 + 0.01 * i );
  for (int i=0; i<5; i++) s.push_back( 50 + i );
  EXPECT_LT( optim::threshold( s , THRESH_KDE_MAX ) , 5 );
  EXPECT_LT( optim::threshold( s , THRESH_KDE_FIRST_MAX ) , 5 );

  EXPECT_TRUE( std::isnan( optim::threshold( std::vector<double>() , THRESH_MEAN ) ) );
}

TEST( Optimiser , ScaleSurface )
{
  test_init();

  Eigen::MatrixXd m( 2 , 2 );
  m << 1 , 2 , 3 , globals::nan;

  optim::scale_surface( m );

  EXPECT_DOUBLE_EQ( m(0,0) , -1 );
  EXPECT_DOUBLE_EQ( m(0,1) , 0 );
  EXPECT_DOUBLE_EQ( m(1,0) , 1 );
  EXPECT_TRUE( std::isnan( m(1,1) ) );

  Eigen::MatrixXd f = Eigen::MatrixXd::Constant( 2 , 3 , 7.0 );
  optim::scale_surface( f );
  EXPECT_DOUBLE_EQ( f.sum() , 0 );
}

TEST( Optimiser , FindsFlatPlateau )
{
  test_init();

  analyte_map_t d = plateau_data();
  std::vector<std::string> a( 1 , "A" );

  // surfaces only: thresholds that nothing meets
  optimise_result_t r0 = optim::signal_optimiser( d , a , 5 , THRESH_EXPLICIT ,
						  std::vector<double>() , -1e9 , -1e9 );
  EXPECT_FALSE( r0.found );
  EXPECT_EQ( r0.npoints , 100 );
  EXPECT_EQ( r0.means.rows() , 96 );
  EXPECT_EQ( r0.means.cols() , 100 );

  // only windows lying wholly on the plateau reach the lowest mean and SD
  const double mt = finite_min( r0.means ) + 1e-9;
  const double st = finite_min( r0.sds ) + 1e-9;

  optimise_result_t r = optim::signal_optimiser( d , a , 5 , THRESH_EXPLICIT ,
						 std::vector<double>() , mt , st );

  ASSERT_TRUE( r.found );

  // the widest fit is 50 wide at centre 50; one point narrower fits earlier
  EXPECT_EQ( r.width , 49 );
  EXPECT_EQ( r.centre , 49 );
  EXPECT_EQ( r.lwr , 25 );
  EXPECT_EQ( r.upr , 73 );
  EXPECT_EQ( Ranges::count( r.mask ) , 49 );
  EXPECT_FALSE( r.mask[24] );
  EXPECT_FALSE( r.mask[74] );
}

TEST( Optimiser , NoisyPlateauWithDefaultThresholds )
{
  test_init();

  // the plateau scatters by +/-2 around 100
  analyte_map_t d = plateau_data();
  for (int i=25; i<75; i++) d[ "A" ][i] = 100 + ( ( i * 7 ) % 5 - 2 );

  optimise_result_t r = optim::signal_optimiser( d , std::vector<std::string>( 1 , "A" ) , 5 , THRESH_KDE_FIRST_MAX );

  ASSERT_TRUE( r.found );
  EXPECT_GE( r.width , 40 );
  EXPECT_GE( r.lwr , 25 );
  EXPECT_LE( r.upr , 74 );
  EXPECT_EQ( Ranges::count( r.mask ) , r.upr - r.lwr + 1 );
  for (int i=0; i<25; i++) EXPECT_FALSE( r.mask[i] ) << i;
  for (int i=75; i<100; i++) EXPECT_FALSE( r.mask[i] ) << i;
}

TEST( Optimiser , InteriorKDEMaximum )
{
  test_init();

  // the larger mode sits at the bottom of the grid, so is not a local
  // maximum; the first interior one is the upper mode
  std::vector<double> x;
  for (int i=0; i<40; i++) x.push_back( 1 + 0.001 * i );
  for (int i=0; i<20; i++) x.push_back( 10 + 0.01 * i );

  const double t = optim::threshold( x , THRESH_KDE_FIRST_MAX );
  EXPECT_GT( t , 9.5 );
  EXPECT_LE( t , MiscMath::percentile( x , 99 ) );

  // the global maximum is still at the bottom
  EXPECT_LT( optim::threshold( x , THRESH_KDE_MAX ) , 1.1 );

  EXPECT_DOUBLE_EQ( MiscMath::percentile( { 1 , 2 , 3 , 4 , 5 } , 25 ) , 2 );
  EXPECT_DOUBLE_EQ( MiscMath::percentile( { 4 , 1 , 3 , 2 } , 50 ) , 2.5 );
}

TEST( Optimiser , SkipsMissingSamples )
{
  test_init();

  analyte_map_t d = plateau_data();

  // the first ten samples are outside the region; indices are preserved
  for (int i=0; i<10; i++) d[ "A" ][i] = globals::nan;

  std::vector<std::string> a( 1 , "A" );

  optimise_result_t r0 = optim::signal_optimiser( d , a , 5 , THRESH_EXPLICIT ,
						  std::vector<double>() , -1e9 , -1e9 );
  EXPECT_EQ( r0.npoints , 90 );

  optimise_result_t r = optim::signal_optimiser( d , a , 5 , THRESH_EXPLICIT , std::vector<double>() ,
						 finite_min( r0.means ) + 1e-9 ,
						 finite_min( r0.sds ) + 1e-9 );
  ASSERT_TRUE( r.found );
  EXPECT_EQ( r.lwr , 25 );
  EXPECT_EQ( r.upr , 73 );
  EXPECT_EQ( r.mask.size() , 100 );
}

TEST( Optimiser , TooFewPoints )
{
  test_init();

  analyte_map_t d;
  d[ "A" ] = std::vector<double>( 4 , 1.0 );

  optimise_result_t r = optim::signal_optimiser( d , std::vector<std::string>( 1 , "A" ) , 5 );
  EXPECT_FALSE( r.found );
  EXPECT_NE( r.note , "" );
  EXPECT_EQ( Ranges::count( r.mask ) , 0 );
}

TEST( Optimiser , InputChecks )
{
  test_init();

  analyte_map_t d = plateau_data();
  d[ "B" ] = d[ "A" ];
  d[ "B" ][3] = globals::nan;

  std::vector<std::string> ab = { "A" , "B" };

  EXPECT_THROW( optim::signal_optimiser( d , ab ) , data_shape_error_t );
  EXPECT_THROW( optim::signal_optimiser( d , { "A" , "C" } ) , data_shape_error_t );
  EXPECT_THROW( optim::signal_optimiser( d , { "A" } , 5 , THRESH_MEAN , { 1 , 2 } ) , data_shape_error_t );
  EXPECT_THROW( optim::signal_optimiser( d , { "A" } , 0 ) , latrace_error_t );
}


TEST( Optimiser , FilterNeedsRanges )
{
  test_init();

  trace_t trace = test_trace( { "A" } , { plateau_data()[ "A" ] } );

  EXPECT_THROW( filters::optimise( trace , { "A" } ) , latrace_error_t );
  EXPECT_FALSE( trace.filt.has( "optimise" ) );
}

TEST( Optimiser , FilterWarnsPerSegment )
{
  test_init();

  trace_t trace = test_trace( { "A" } , { plateau_data()[ "A" ] } );

  std::vector<bool> b( 100 , false ) , s( 100 , false );
  for (int i=0; i<100; i++)
    {
      if ( i < 20 ) b[i] = true;
      else s[i] = true;
    }
  trace.set_regions( b , s );
  ASSERT_EQ( trace.n , 1 );

  param_t p;
  p.parse( "analytes=A" );
  p.parse( "mean_threshold=-1e9" );
  p.parse( "sd_threshold=-1e9" );
  filters::optimise( trace , p );

  ASSERT_TRUE( trace.filt.has( "optimise" ) );
  EXPECT_EQ( Ranges::count( trace.filt.filter( "optimise" ).mask ) , 0 );
  EXPECT_EQ( trace.diagnostics.size() , 1 );
}
