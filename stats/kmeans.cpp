
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

#include "stats/kmeans.h"
#include "helper/exception.h"

#include <vector>
#include <random>
#include <limits>
#include <algorithm>

// k-means++: each further centre drawn with probability ~ squared distance
// to the nearest centre chosen so far
static Eigen::MatrixXd seed_centroids( const Eigen::MatrixXd &X , int K , std::mt19937 & rng )
{
    const int N = static_cast<int>(X.rows());

    Eigen::MatrixXd C( K , X.cols() );

    std::uniform_int_distribution<int> uni(0, N - 1);
    C.row(0) = X.row( uni(rng) );

    std::vector<double> d2( N , std::numeric_limits<double>::infinity() );

    for (int k = 1; k < K; ++k) {

        double total = 0;
        for (int n = 0; n < N; ++n) {
            double dist = (X.row(n) - C.row(k-1)).squaredNorm();
            if (dist < d2[n]) d2[n] = dist;
            total += d2[n];
        }

        int pick = 0;
        if (total > 0) {
            std::uniform_real_distribution<double> unif(0, total);
            double r = unif(rng);
            double cum = 0;
            for (pick = 0; pick < N - 1; ++pick) {
                cum += d2[pick];
                if (cum >= r) break;
            }
        } else {
            pick = uni(rng);
        }

        C.row(k) = X.row(pick);
    }

    return C;
}


// label each row with its nearest centroid; returns the summed squared distance
static double assign( const Eigen::MatrixXd & X , const Eigen::MatrixXd & C , Eigen::VectorXi & labels )
{
    double ss = 0;
    for (int n = 0; n < X.rows(); ++n) {
        Eigen::MatrixXd::Index nearest;
        ss += ( C.rowwise() - X.row(n) ).rowwise().squaredNorm().minCoeff( &nearest );
        labels(n) = static_cast<int>( nearest );
    }
    return ss;
}


static kmeans_result_t lloyd( const Eigen::MatrixXd &X ,
			      int K ,
			      int max_iters ,
			      double tol ,
			      std::mt19937 & rng )
{
    const int N = static_cast<int>(X.rows());
    std::uniform_int_distribution<int> pick( 0 , N - 1 );

    kmeans_result_t res;
    res.centroids = seed_centroids( X , K , rng );
    res.labels.setZero(N);
    res.iterations = 0;

    while ( res.iterations < max_iters ) {

        ++res.iterations;

        assign( X , res.centroids , res.labels );

        // new centroids as cluster means; an emptied cluster restarts from a random row
        Eigen::MatrixXd sums = Eigen::MatrixXd::Zero( K , X.cols() );
        Eigen::VectorXd sizes = Eigen::VectorXd::Zero( K );
        for (int n = 0; n < N; ++n) {
            sums.row( res.labels(n) ) += X.row(n);
            sizes( res.labels(n) ) += 1;
        }

        for (int k = 0; k < K; ++k)
            sums.row(k) = sizes(k) > 0 ? Eigen::RowVectorXd( sums.row(k) / sizes(k) ) : Eigen::RowVectorXd( X.row( pick(rng) ) );

        const double shift = ( sums - res.centroids ).norm();
        res.centroids = sums;
        if ( shift < tol ) break;
    }

    // labels and inertia against the final centroids
    res.inertia = assign( X , res.centroids , res.labels );

    return res;
}


kmeans_result_t kmeans( const Eigen::MatrixXd &X ,
			int K ,
			int n_init ,
			int max_iters ,
			double tol ,
			unsigned int seed )
{
    const int N = static_cast<int>(X.rows());
    const int D = static_cast<int>(X.cols());
    if (N == 0 || D == 0 || K <= 0)
        throw data_shape_error_t("kmeans: invalid dimensions");
    if (K > N)
        throw data_shape_error_t("kmeans: more clusters than points");
    if (n_init < 1) n_init = 1;

    std::mt19937 rng(seed);

    kmeans_result_t best;
    best.inertia = std::numeric_limits<double>::infinity();

    for (int r = 0; r < n_init; ++r) {
        kmeans_result_t res = lloyd( X , K , max_iters , tol , rng );
        if (res.inertia < best.inertia)
            best = res;
    }

    return best;
}
