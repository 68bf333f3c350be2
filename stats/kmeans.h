
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

#ifndef __LATRACE_KMEANS_H__
#define __LATRACE_KMEANS_H__

#include <Eigen/Dense>

struct kmeans_result_t {
    Eigen::MatrixXd centroids;  // K x D
    Eigen::VectorXi labels;     // N
    double inertia;             // within-cluster sum of squares
    int iterations;
};

// X: N x D (rows = samples)
// K: number of clusters
// n_init: number of restarts (best inertia kept)
// max_iters: max Lloyd iterations
// tol: convergence tolerance on centroid movement (L2)
// seed: RNG seed for reproducible init
kmeans_result_t kmeans( const Eigen::MatrixXd &X ,
			int K ,
			int n_init = 10 ,
			int max_iters = 300 ,
			double tol = 1e-4 ,
			unsigned int seed = 12345 );

#endif
