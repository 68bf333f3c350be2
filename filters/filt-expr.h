
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

#ifndef __LATRACE_FILT_EXPR_H__
#define __LATRACE_FILT_EXPR_H__

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <functional>

//
// boolean expressions over filter names:
//
//   expr   := term   ( '|' term   )*
//   term   := factor ( '&' factor )*
//   factor := '!' factor | '(' expr ')' | NAME
//
// NAME is any run of characters other than whitespace and ()&|!
//

struct filt_token_t
{
  enum token_type_t { T_NAME , T_AND , T_OR , T_NOT , T_LEFT , T_RIGHT , T_END };

  filt_token_t( token_type_t t , const std::string & s , int p ) : type(t) , str(s) , pos(p) { }

  token_type_t type;
  std::string str;
  int pos;
};


struct filt_node_t
{
  enum node_type_t { N_AND , N_OR , N_NOT , N_NAME };

  node_type_t type;

  // N_NAME only
  std::string name;
  int pos;

  // N_NOT uses left only
  std::shared_ptr<filt_node_t> left;
  std::shared_ptr<filt_node_t> right;
};


// returns the mask for a name, or NULL if unknown
typedef std::function<const std::vector<bool>*( const std::string & )> filt_resolver_t;

class filt_expr_t
{

 public:

  // throws invalid_expression_error_t on a syntax error
  explicit filt_expr_t( const std::string & key );

  bool empty() const { return root == NULL; }

  // all names referenced by the expression
  std::set<std::string> names() const;

  // throws invalid_expression_error_t for an unknown name;
  // an empty expression gives an all-True mask of length n
  std::vector<bool> eval( const filt_resolver_t & resolver , const int n ) const;

  // tokenize only (exposed for testing)
  static std::vector<filt_token_t> tokenize( const std::string & key );

  // printable, fully parenthesised form
  std::string str() const;

 private:

  std::string key;

  std::vector<filt_token_t> tokens;

  int p;

  std::shared_ptr<filt_node_t> root;

  std::shared_ptr<filt_node_t> parse_expr();
  std::shared_ptr<filt_node_t> parse_term();
  std::shared_ptr<filt_node_t> parse_factor();

  const filt_token_t & peek() const { return tokens[p]; }

};

#endif
