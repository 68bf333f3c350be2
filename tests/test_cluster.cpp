
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
#include "stats/cluster.h"
#include "stats/kmeans.h"
#include "helper/exception.h"

// two 5x4 grids (spacing 0.1) around (0,0) and (10,10); rows 0..19 are
// the first blob
static Eigen::MatrixXd two_blobs( bool outlier = false )
{
  Eigen::MatrixXd X( outlier ? 41 : 40 , 2 );
  int r = 0;
  for (int b=0; b<2; b++)
    for (int i=0; i<5; i++)
      for (int j=0; j<4; j++)
	{
	  X(r,0) = b * 10 + i * 0.1;
	  X(r,1) = b * 10 + j * 0.1;
	  ++r;
	}
  if ( outlier )
    {
      X(r,0) = 50;
      X(r,1) = 50;
    }
  return X;
}


TEST( Cluster , KMeansTwoBlobs )
{
  Eigen::MatrixXd X = two_blobs();

  kmeans_result_t km = kmeans( X , 2 );

  EXPECT_EQ( km.centroids.rows() , 2 );
  EXPECT_EQ( km.labels.size() , 40 );

  for (int i=1; i<20; i++) EXPECT_EQ( km.labels[i] , km.labels[0] );
  for (int i=21; i<40; i++) EXPECT_EQ( km.labels[i] , km.labels[20] );
  EXPECT_NE( km.labels[0] , km.labels[20] );

  // centroid of a blob: (0.2,0.15) offsets
  const int c0 = km.labels[0];
  EXPECT_NEAR( km.centroids(c0,0) , 0.2 , 1e-9 );
  EXPECT_NEAR( km.centroids(c0,1) , 0.15 , 1e-9 );

  // 2 x 20 points, each blob: sum of squared offsets from its centre
  EXPECT_NEAR( km.inertia , 2 * ( 4 * 0.1 + 5 * 0.05 ) , 1e-6 );
}

TEST( Cluster , KMeansTooManyClusters )
{
  Eigen::MatrixXd X = two_blobs();
  EXPECT_THROW( kmeans( X , 41 ) , data_shape_error_t );

  kmeans_t km( 2 );
  cluster_result_t res = km.fit( X );
  EXPECT_EQ( res.k , 2 );
  EXPECT_EQ( res.labels.size() , 2 );
}


TEST( Cluster , MeanShift )
{
  Eigen::MatrixXd X = two_blobs();

  meanshift_t ms( 2.0 );
  cluster_result_t res = ms.fit( X );

  EXPECT_EQ( res.k , 2 );
  ASSERT_EQ( res.labels.size() , 2 );
  EXPECT_EQ( res.core.size() , 0 );

  const std::vector<bool> & l0 = res.labels[0];
  for (int i=1; i<20; i++) EXPECT_EQ( l0[i] , l0[0] );
  for (int i=21; i<40; i++) EXPECT_EQ( l0[i] , l0[20] );
  EXPECT_NE( l0[0] , l0[20] );

  EXPECT_GT( meanshift_t::estimate_bandwidth( X ) , 0 );

  meanshift_t binned( 2.0 , true );
  EXPECT_EQ( binned.fit( X ).k , 2 );
}


TEST( Cluster , DBSCANNoise )
{
  Eigen::MatrixXd X = two_blobs( true );

  dbscan_t db( 1.0 , 3 );
  cluster_result_t res = db.fit( X );

  EXPECT_EQ( res.k , 2 );
  ASSERT_EQ( res.labels.count( -1 ) , 1 );

  const std::vector<bool> & noise = res.labels[-1];
  EXPECT_TRUE( noise[40] );
  for (int i=0; i<40; i++) EXPECT_FALSE( noise[i] );

  ASSERT_EQ( res.core.size() , 41 );
  EXPECT_TRUE( res.core[0] );
  EXPECT_FALSE( res.core[40] );

  EXPECT_DOUBLE_EQ( db.eps_used , 1.0 );
}

TEST( Cluster , DBSCANTunesEps )
{
  Eigen::MatrixXd X = two_blobs();

  dbscan_t db( 0.3 , 3 , 2 );
  cluster_result_t res = db.fit( X );
  EXPECT_EQ( res.k , 2 );
  EXPECT_EQ( res.note , "" );

  // the blobs never split further; eps backs off to the last good value
  dbscan_t greedy( 0.3 , 3 , 5 );
  cluster_result_t res2 = greedy.fit( X );
  EXPECT_EQ( res2.k , 2 );
  EXPECT_NE( res2.note , "" );
  EXPECT_GT( greedy.eps_used , 0.1 );
}

TEST( Cluster , CreateFromOptions )
{
  param_t p;
  p.parse( "n_clusters=3" );

  clusterer_t * c = clusterer_t::create( "kmeans" , p , 100 );
  EXPECT_EQ( c->name() , "kmeans" );
  EXPECT_EQ( static_cast<kmeans_t*>( c )->n_clusters , 3 );
  delete c;

  c = clusterer_t::create( "dbscan" , param_t() , 100 );
  EXPECT_EQ( c->name() , "DBSCAN" );
  EXPECT_EQ( static_cast<dbscan_t*>( c )->min_samples , 5 );
  delete c;

  EXPECT_THROW( clusterer_t::create( "kmeans" , param_t() , 100 ) , latrace_error_t );
  EXPECT_THROW( clusterer_t::create( "ward" , param_t() , 100 ) , latrace_error_t );
}
