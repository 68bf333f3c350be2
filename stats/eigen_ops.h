
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

#ifndef __LATRACE_EIGEN_OPS_H__
#define __LATRACE_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <vector>
#include <string>

namespace eigen_ops {

  // centre and/or scale (SD, n-1) each column; invariant columns either fail
  // or are left unscaled (and reported in 'zeros')
  bool scale( Eigen::Ref<Eigen::MatrixXd> m , const bool,  const bool , const bool ignore_invariants = false , std::vector<int> * zeros = NULL );

  double sdev( const Eigen::VectorXd & x );

  // pairwise squared euclidean distances between the rows of X
  Eigen::MatrixXd sq_distances( const Eigen::MatrixXd & X );

  std::vector<double> copy_vector( const Eigen::VectorXd & e );

  Eigen::VectorXd copy_vector( const std::vector<double> & e );

  // columns of the given vectors, for rows where mask is T
  Eigen::MatrixXd make_matrix( const std::vector<std::vector<double> > & cols , const std::vector<bool> & mask );

}

#endif
