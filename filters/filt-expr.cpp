
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

#include "filters/filt-expr.h"
#include "helper/helper.h"
#include "helper/exception.h"

static bool is_special( const char c )
{
  return c == '(' || c == ')' || c == '&' || c == '|' || c == '!'
    || c == ' ' || c == '\t' || c == '\n' || c == '\r' ;
}

std::vector<filt_token_t> filt_expr_t::tokenize( const std::string & key )
{

  std::vector<filt_token_t> toks;

  const int n = key.size();
  int i = 0;

  while ( i < n )
    {
      const char c = key[i];

      if ( c == ' ' || c == '\t' || c == '\n' || c == '\r' ) { ++i; continue; }

      if      ( c == '(' ) toks.push_back( filt_token_t( filt_token_t::T_LEFT , "(" , i ) );
      else if ( c == ')' ) toks.push_back( filt_token_t( filt_token_t::T_RIGHT , ")" , i ) );
      else if ( c == '&' ) toks.push_back( filt_token_t( filt_token_t::T_AND , "&" , i ) );
      else if ( c == '|' ) toks.push_back( filt_token_t( filt_token_t::T_OR , "|" , i ) );
      else if ( c == '!' ) toks.push_back( filt_token_t( filt_token_t::T_NOT , "!" , i ) );
      else
	{
	  const int start = i;
	  while ( i < n && ! is_special( key[i] ) ) ++i;
	  toks.push_back( filt_token_t( filt_token_t::T_NAME , key.substr( start , i - start ) , start ) );
	  continue;
	}
      ++i;
    }

  toks.push_back( filt_token_t( filt_token_t::T_END , "" , n ) );

  return toks;
}


filt_expr_t::filt_expr_t( const std::string & k )
  : key( k ) , p( 0 )
{

  tokens = tokenize( key );

  // empty key
  if ( peek().type == filt_token_t::T_END ) return;

  root = parse_expr();

  if ( peek().type != filt_token_t::T_END )
    {
      if ( peek().type == filt_token_t::T_RIGHT )
	throw invalid_expression_error_t( "unbalanced parentheses in filter key" , peek().str , peek().pos );
      throw invalid_expression_error_t( "unexpected trailing token in filter key" , peek().str , peek().pos );
    }

}


std::shared_ptr<filt_node_t> filt_expr_t::parse_expr()
{
  std::shared_ptr<filt_node_t> node = parse_term();

  while ( peek().type == filt_token_t::T_OR )
    {
      ++p;
      std::shared_ptr<filt_node_t> parent( new filt_node_t );
      parent->type = filt_node_t::N_OR;
      parent->pos = node->pos;
      parent->left = node;
      parent->right = parse_term();
      node = parent;
    }

  return node;
}


std::shared_ptr<filt_node_t> filt_expr_t::parse_term()
{
  std::shared_ptr<filt_node_t> node = parse_factor();

  while ( peek().type == filt_token_t::T_AND )
    {
      ++p;
      std::shared_ptr<filt_node_t> parent( new filt_node_t );
      parent->type = filt_node_t::N_AND;
      parent->pos = node->pos;
      parent->left = node;
      parent->right = parse_factor();
      node = parent;
    }

  return node;
}


std::shared_ptr<filt_node_t> filt_expr_t::parse_factor()
{

  const filt_token_t & t = peek();

  if ( t.type == filt_token_t::T_NOT )
    {
      ++p;
      std::shared_ptr<filt_node_t> node( new filt_node_t );
      node->type = filt_node_t::N_NOT;
      node->pos = t.pos;
      node->left = parse_factor();
      return node;
    }

  if ( t.type == filt_token_t::T_LEFT )
    {
      const int open_pos = t.pos;
      ++p;
      std::shared_ptr<filt_node_t> node = parse_expr();
      if ( peek().type != filt_token_t::T_RIGHT )
	{
	  if ( peek().type == filt_token_t::T_END )
	    throw invalid_expression_error_t( "unbalanced parentheses in filter key" , "(" , open_pos );
	  throw invalid_expression_error_t( "expecting ')' in filter key" , peek().str , peek().pos );
	}
      ++p;
      return node;
    }

  if ( t.type == filt_token_t::T_NAME )
    {
      ++p;
      std::shared_ptr<filt_node_t> node( new filt_node_t );
      node->type = filt_node_t::N_NAME;
      node->name = t.str;
      node->pos = t.pos;
      return node;
    }

  if ( t.type == filt_token_t::T_END )
    throw invalid_expression_error_t( "unexpected end of filter key" , "" , t.pos );

  throw invalid_expression_error_t( "unexpected token in filter key" , t.str , t.pos );

}


static void collect_names( const std::shared_ptr<filt_node_t> & node , std::set<std::string> * s )
{
  if ( ! node ) return;
  if ( node->type == filt_node_t::N_NAME ) s->insert( node->name );
  collect_names( node->left , s );
  collect_names( node->right , s );
}

std::set<std::string> filt_expr_t::names() const
{
  std::set<std::string> s;
  collect_names( root , &s );
  return s;
}


static std::vector<bool> eval_node( const std::shared_ptr<filt_node_t> & node ,
				    const filt_resolver_t & resolver ,
				    const int n )
{

  if ( node->type == filt_node_t::N_NAME )
    {
      const std::vector<bool> * m = resolver( node->name );
      if ( m == NULL )
	throw invalid_expression_error_t( "unknown filter name in key" , node->name , node->pos );
      if ( m->size() != n )
	throw data_shape_error_t( "filter " + node->name + " does not match the trace length" );
      return *m;
    }

  std::vector<bool> a = eval_node( node->left , resolver , n );

  if ( node->type == filt_node_t::N_NOT )
    {
      for (int i=0; i<n; i++) a[i] = ! a[i];
      return a;
    }

  std::vector<bool> b = eval_node( node->right , resolver , n );

  if ( node->type == filt_node_t::N_AND )
    for (int i=0; i<n; i++) a[i] = a[i] && b[i];
  else
    for (int i=0; i<n; i++) a[i] = a[i] || b[i];

  return a;
}


std::vector<bool> filt_expr_t::eval( const filt_resolver_t & resolver , const int n ) const
{
  if ( ! root ) return std::vector<bool>( n , true );
  return eval_node( root , resolver , n );
}


static std::string node_str( const std::shared_ptr<filt_node_t> & node )
{
  switch ( node->type )
    {
    case filt_node_t::N_NAME : return node->name;
    case filt_node_t::N_NOT : return "!" + node_str( node->left );
    case filt_node_t::N_AND : return "(" + node_str( node->left ) + " & " + node_str( node->right ) + ")";
    case filt_node_t::N_OR : return "(" + node_str( node->left ) + " | " + node_str( node->right ) + ")";
    }
  return "";
}

std::string filt_expr_t::str() const
{
  if ( ! root ) return "";
  return node_str( root );
}
