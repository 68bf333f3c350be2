
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

#ifndef __LATRACE_CLUSTER_H__
#define __LATRACE_CLUSTER_H__

#include <Eigen/Dense>
#include <vector>
#include <map>
#include <string>

#include "param.h"

// solution
struct cluster_result_t {

  cluster_result_t() : k(0) { }

  // label -> membership of each row of the input ( -1 = noise )
  std::map<int,std::vector<bool> > labels;

  // DBSCAN only: core samples
  std::vector<bool> core;

  // number of clusters, not counting noise
  int k;

  // diagnostic (tuning did not reach its target)
  std::string note;

  // from a label per row
  void set( const std::vector<int> & lab );
};


//
// unsupervised clustering of the rows of X
//

struct clusterer_t {

  virtual ~clusterer_t() { }

  virtual cluster_result_t fit( const Eigen::MatrixXd & X ) = 0;

  virtual std::string name() const = 0;

  // meanshift, kmeans or DBSCAN, configured from key=value options;
  // 'nsamples' is the trace length (DBSCAN min_samples default)
  static clusterer_t * create( const std::string & method , const param_t & param , const int nsamples );

};


// flat-kernel mean shift; bandwidth estimated if <= 0
struct meanshift_t : public clusterer_t {

  meanshift_t( double bandwidth = 0 , bool bin_seeding = false )
    : bandwidth( bandwidth ) , bin_seeding( bin_seeding ) { }

  cluster_result_t fit( const Eigen::MatrixXd & X );

  std::string name() const { return "meanshift"; }

  // mean distance to the quantile*n-th nearest neighbour
  static double estimate_bandwidth( const Eigen::MatrixXd & X , double quantile = 0.3 );

  double bandwidth;
  bool bin_seeding;
};


struct kmeans_t : public clusterer_t {

  kmeans_t( int n_clusters , int n_init = 10 , unsigned int seed = 12345 )
    : n_clusters( n_clusters ) , n_init( n_init ) , seed( seed ) { }

  cluster_result_t fit( const Eigen::MatrixXd & X );

  std::string name() const { return "kmeans"; }

  int n_clusters;
  int n_init;
  unsigned int seed;
};


// density-reachability; with n_clusters > 0, eps is tuned down until
// that many clusters are found
struct dbscan_t : public clusterer_t {

  dbscan_t( double eps = 0.3 , int min_samples = 5 , int n_clusters = 0 , int maxiter = 200 )
    : eps( eps ) , min_samples( min_samples ) , n_clusters( n_clusters ) , maxiter( maxiter ) { }

  cluster_result_t fit( const Eigen::MatrixXd & X );

  std::string name() const { return "DBSCAN"; }

  // a single pass at a given eps, on precomputed squared distances
  cluster_result_t run( const Eigen::MatrixXd & D2 , double e ) const;

  double eps;
  int min_samples;
  int n_clusters;
  int maxiter;

  // eps used by the last fit()
  double eps_used;
};


#endif
