
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
#include "filters/filt.h"
#include "filters/filt-expr.h"
#include "helper/exception.h"

static std::vector<bool> bits( const std::string & s )
{
  std::vector<bool> m( s.size() );
  for (int i=0; i<s.size(); i++) m[i] = s[i] == '1';
  return m;
}

static filt_t three_filters()
{
  std::vector<std::string> analytes = { "Mg24" , "Sr88" , "Ba138" };
  filt_t f( 6 , analytes );
  f.add( "Mg24_thresh_below" , bits( "111100" ) , "keep below" );
  f.add( "Mg24_thresh_above" , bits( "000011" ) , "keep above" );
  f.add( "Sr88_thresh_below" , bits( "110110" ) , "keep below" );
  return f;
}

//
// expressions
//

TEST( FiltExpr , Tokenize )
{
  std::vector<filt_token_t> t = filt_expr_t::tokenize( "!(a & bb)|c" );
  ASSERT_EQ( t.size() , 9 );
  EXPECT_EQ( t[0].type , filt_token_t::T_NOT );
  EXPECT_EQ( t[1].type , filt_token_t::T_LEFT );
  EXPECT_EQ( t[2].type , filt_token_t::T_NAME );
  EXPECT_EQ( t[4].str , "bb" );
  EXPECT_EQ( t[4].pos , 6 );
  EXPECT_EQ( t[7].str , "c" );
  EXPECT_EQ( t[8].type , filt_token_t::T_END );
}

TEST( FiltExpr , AndBindsTighterThanOr )
{
  EXPECT_EQ( filt_expr_t( "a | b & c" ).str() , "(a | (b & c))" );
  EXPECT_EQ( filt_expr_t( "(a | b) & c" ).str() , "((a | b) & c)" );
  EXPECT_EQ( filt_expr_t( "!a & b" ).str() , "(!a & b)" );
  EXPECT_EQ( filt_expr_t( "a & b & c" ).str() , "((a & b) & c)" );
}

TEST( FiltExpr , Evaluate )
{
  std::map<std::string,std::vector<bool> > m;
  m[ "a" ] = bits( "1100" );
  m[ "b" ] = bits( "1010" );
  m[ "c" ] = bits( "0001" );

  filt_resolver_t r = [&m]( const std::string & n ) -> const std::vector<bool> *
    {
      std::map<std::string,std::vector<bool> >::const_iterator i = m.find( n );
      return i == m.end() ? NULL : &i->second;
    };

  EXPECT_EQ( filt_expr_t( "a & b" ).eval( r , 4 ) , bits( "1000" ) );
  EXPECT_EQ( filt_expr_t( "a | c" ).eval( r , 4 ) , bits( "1101" ) );
  EXPECT_EQ( filt_expr_t( "!a" ).eval( r , 4 ) , bits( "0011" ) );
  EXPECT_EQ( filt_expr_t( "a & b | c" ).eval( r , 4 ) , bits( "1001" ) );
  EXPECT_EQ( filt_expr_t( "a & (b | c)" ).eval( r , 4 ) , bits( "1000" ) );
  EXPECT_EQ( filt_expr_t( "" ).eval( r , 4 ) , bits( "1111" ) );

  try
    {
      filt_expr_t( "a & zz" ).eval( r , 4 );
      FAIL() << "expected an unknown-name error";
    }
  catch ( invalid_expression_error_t & e )
    {
      EXPECT_EQ( e.token , "zz" );
      EXPECT_EQ( e.pos , 4 );
    }
}

TEST( FiltExpr , SyntaxErrorsReportPosition )
{
  try
    {
      filt_expr_t e( "a & (b | c" );
      FAIL() << "expected a parse error";
    }
  catch ( invalid_expression_error_t & e )
    {
      EXPECT_EQ( e.pos , 4 );
    }

  try
    {
      filt_expr_t e( "a | | b" );
      FAIL() << "expected a parse error";
    }
  catch ( invalid_expression_error_t & e )
    {
      EXPECT_EQ( e.token , "|" );
      EXPECT_EQ( e.pos , 4 );
    }

  EXPECT_THROW( filt_expr_t( "a )" ) , invalid_expression_error_t );
  EXPECT_THROW( filt_expr_t( "a &" ) , invalid_expression_error_t );
  EXPECT_THROW( filt_expr_t( "a b" ) , invalid_expression_error_t );
}

TEST( FiltExpr , Names )
{
  std::set<std::string> n = filt_expr_t( "x & !(y | x)" ).names();
  EXPECT_EQ( n.size() , 2 );
  EXPECT_TRUE( n.count( "x" ) );
  EXPECT_TRUE( n.count( "y" ) );
}


//
// registry
//

TEST( Filt , EmptyRegistryGrabsEverything )
{
  filt_t f( 5 , { "A" , "B" } );
  EXPECT_EQ( f.grab( filt_selector_t() , "A" ) , std::vector<bool>( 5 , true ) );
  EXPECT_EQ( f.make_key( "A" ) , "" );
}

TEST( Filt , SelectorNoneIgnoresFilters )
{
  filt_t f = three_filters();
  EXPECT_EQ( f.grab( filt_selector_t::none() , "Mg24" ) , std::vector<bool>( 6 , true ) );
}

TEST( Filt , SwitchedOnFiltersAreCombined )
{
  filt_t f = three_filters();

  // all on: everything ANDed
  EXPECT_EQ( f.make( "Mg24" ) , bits( "000000" ) );

  f.off( "thresh_above" );
  EXPECT_EQ( f.make_key( "Mg24" ) , "Mg24_thresh_below & Sr88_thresh_below" );
  EXPECT_EQ( f.make( "Mg24" ) , bits( "110100" ) );
  EXPECT_EQ( f.cached_key( "Mg24" ) , "Mg24_thresh_below & Sr88_thresh_below" );
}

TEST( Filt , SubstringToggling )
{
  filt_t f = three_filters();

  f.off();
  f.on( "Mg24" , { "Sr88" } );

  EXPECT_TRUE( f.is_on( "Mg24_thresh_below" , "Sr88" ) );
  EXPECT_TRUE( f.is_on( "Mg24_thresh_above" , "Sr88" ) );
  EXPECT_FALSE( f.is_on( "Sr88_thresh_below" , "Sr88" ) );
  EXPECT_FALSE( f.is_on( "Mg24_thresh_below" , "Mg24" ) );

  EXPECT_EQ( f.components( "" , "Sr88" ).size() , 2 );
  EXPECT_EQ( f.components( "below" ).size() , 2 );

  // an unknown analyte changes nothing
  EXPECT_THROW( f.on( "" , { "Sr88" , "Zn66" } ) , not_found_error_t );
  EXPECT_FALSE( f.is_on( "Sr88_thresh_below" , "Sr88" ) );
}

TEST( Filt , AddThenRemoveRestoresKeys )
{
  filt_t f = three_filters();
  f.off( "above" );

  const std::map<std::string,std::string> before = f.make_keydict();
  const std::vector<bool> mask = f.make( "Ba138" );

  f.add( "extra" , bits( "101010" ) );
  EXPECT_NE( f.make( "Ba138" ) , mask );

  f.remove( "extra" );
  EXPECT_EQ( f.make_keydict() , before );
  EXPECT_EQ( f.make( "Ba138" ) , mask );
  EXPECT_EQ( f.size() , 3 );
}

TEST( Filt , RemovingDropsCachedKeys )
{
  filt_t f = three_filters();
  f.make( "Mg24" );
  EXPECT_NE( f.cached_key( "Mg24" ) , "" );
  f.remove( "Mg24_thresh_above" );
  EXPECT_EQ( f.cached_key( "Mg24" ) , "" );
}

TEST( Filt , DuplicateAndUnknownNames )
{
  filt_t f = three_filters();
  EXPECT_THROW( f.add( "Mg24_thresh_below" , bits( "000000" ) ) , duplicate_name_error_t );
  EXPECT_THROW( f.remove( "nope" ) , not_found_error_t );
  EXPECT_THROW( f.is_on( "nope" , "Mg24" ) , not_found_error_t );
  EXPECT_THROW( f.set_switch( "Mg24_thresh_below" , "Zn66" , true ) , not_found_error_t );
  EXPECT_THROW( f.add( "short" , bits( "000" ) ) , data_shape_error_t );
  EXPECT_THROW( f.add( "bad name" , bits( "000000" ) ) , data_shape_error_t );
  EXPECT_EQ( f.size() , 3 );
}

TEST( Filt , KeySelectors )
{
  filt_t f = three_filters();

  EXPECT_EQ( f.grab( filt_selector_t::key( "Mg24_thresh_below | Mg24_thresh_above" ) , "Mg24" ) ,
	     bits( "111111" ) );

  std::map<std::string,std::string> kd;
  kd[ "Mg24" ] = "Mg24_thresh_above";
  kd[ "Sr88" ] = "!Sr88_thresh_below";

  filt_selector_t sel = filt_selector_t::keydict( kd );
  EXPECT_EQ( f.grab( sel , "Mg24" ) , bits( "000011" ) );
  EXPECT_EQ( f.grab( sel , "Sr88" ) , bits( "001001" ) );
  EXPECT_EQ( f.grab( sel , std::vector<std::string>{ "Mg24" , "Sr88" } ) , bits( "000001" ) );
  EXPECT_THROW( f.grab( sel , "Ba138" ) , not_found_error_t );

  param_t p;
  p.parse( "filt=Mg24_thresh_above" );
  filt_selector_t s2 = filt_selector_t::from_param( p );
  EXPECT_EQ( s2.type , filt_selector_t::KEY );

  param_t p2;
  p2.parse( "filt=F" );
  EXPECT_EQ( filt_selector_t::from_param( p2 ).type , filt_selector_t::NONE );
  EXPECT_EQ( filt_selector_t::from_param( param_t() ).type , filt_selector_t::SWITCHES );
}

TEST( Filt , CleanDropsUnusedFilters )
{
  filt_t f = three_filters();
  f.off( "Sr88_thresh_below" );
  f.clean();
  EXPECT_EQ( f.size() , 2 );
  EXPECT_FALSE( f.has( "Sr88_thresh_below" ) );
  EXPECT_TRUE( f.has( "Mg24_thresh_above" ) );
}

TEST( Filt , ClearEmptiesRegistry )
{
  filt_t f = three_filters();
  f.make( "Mg24" );
  f.clear();
  EXPECT_EQ( f.size() , 0 );
  EXPECT_EQ( f.cached_key( "Mg24" ) , "" );
  EXPECT_EQ( f.make( "Mg24" ) , std::vector<bool>( 6 , true ) );
}
