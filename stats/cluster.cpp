
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

#include "stats/cluster.h"
#include "stats/kmeans.h"
#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/exception.h"

#include <algorithm>
#include <cmath>
#include <set>

void cluster_result_t::set( const std::vector<int> & lab )
{
  labels.clear();
  const int n = lab.size();
  std::set<int> u;
  for (int i=0; i<n; i++) u.insert( lab[i] );
  std::set<int>::const_iterator uu = u.begin();
  while ( uu != u.end() )
    {
      std::vector<bool> m( n , false );
      for (int i=0; i<n; i++) m[i] = lab[i] == *uu;
      labels[ *uu ] = m;
      ++uu;
    }
  k = 0;
  for (uu = u.begin(); uu != u.end(); ++uu) if ( *uu >= 0 ) ++k;
}


clusterer_t * clusterer_t::create( const std::string & method , const param_t & param , const int nsamples )
{

  if ( Helper::iequals( method , "meanshift" ) )
    return new meanshift_t( param.get_dbl( "bandwidth" , 0 ) ,
			    param.has( "bin_seeding" ) && param.yesno( "bin_seeding" ) );

  if ( Helper::iequals( method , "kmeans" ) )
    {
      const int k = param.requires_int( "n_clusters" );
      if ( k < 1 ) Helper::halt( "n_clusters must be positive" );
      return new kmeans_t( k ,
			   param.get_int( "n_init" , 10 ) ,
			   param.get_int( "seed" , 12345 ) );
    }

  if ( Helper::iequals( method , "dbscan" ) )
    {
      int ms = param.get_int( "min_samples" , nsamples / 20 );
      if ( ms < 1 ) ms = 1;
      return new dbscan_t( param.get_dbl( "eps" , 0.3 ) ,
			   ms ,
			   param.get_int( "n_clusters" , 0 ) ,
			   param.get_int( "maxiter" , 200 ) );
    }

  Helper::halt( "unknown clustering method: " + method + " (expecting meanshift, kmeans or DBSCAN)" );
  return NULL;
}


//
// mean shift
//

double meanshift_t::estimate_bandwidth( const Eigen::MatrixXd & X , double quantile )
{
  const int n = X.rows();
  if ( n == 0 ) return 0;

  int k = (int)( n * quantile );
  if ( k < 1 ) k = 1;

  Eigen::MatrixXd D2 = eigen_ops::sq_distances( X );

  double bw = 0;
  std::vector<double> d( n );
  for (int i=0; i<n; i++)
    {
      for (int j=0; j<n; j++) d[j] = D2(i,j);
      // k nearest, counting the point itself
      std::nth_element( d.begin() , d.begin() + ( k - 1 ) , d.end() );
      bw += sqrt( d[ k - 1 ] );
    }
  return bw / (double)n;
}


cluster_result_t meanshift_t::fit( const Eigen::MatrixXd & X )
{

  const int n = X.rows();

  if ( n == 0 ) throw data_shape_error_t( "no data to cluster" );

  const double bw = bandwidth > 0 ? bandwidth : estimate_bandwidth( X );

  cluster_result_t res;

  if ( ! ( bw > 0 ) )
    {
      res.set( std::vector<int>( n , 0 ) );
      return res;
    }

  const double bw2 = bw * bw;

  // seeds
  std::vector<Eigen::RowVectorXd> seeds;
  if ( bin_seeding )
    {
      std::set<std::vector<long> > bins;
      for (int i=0; i<n; i++)
	{
	  std::vector<long> b( X.cols() );
	  for (int c=0; c<X.cols(); c++) b[c] = lround( X(i,c) / bw );
	  bins.insert( b );
	}
      std::set<std::vector<long> >::const_iterator bb = bins.begin();
      while ( bb != bins.end() )
	{
	  Eigen::RowVectorXd s( X.cols() );
	  for (int c=0; c<X.cols(); c++) s[c] = (*bb)[c] * bw;
	  seeds.push_back( s );
	  ++bb;
	}
    }
  else
    for (int i=0; i<n; i++) seeds.push_back( X.row(i) );

  // climb from each seed
  std::vector<Eigen::RowVectorXd> centres;
  std::vector<int> counts;

  for (int s=0; s<seeds.size(); s++)
    {
      Eigen::RowVectorXd m = seeds[s];
      int cnt = 0;
      for (int iter=0; iter<300; iter++)
	{
	  Eigen::RowVectorXd sum = Eigen::RowVectorXd::Zero( X.cols() );
	  cnt = 0;
	  for (int i=0; i<n; i++)
	    if ( ( X.row(i) - m ).squaredNorm() <= bw2 ) { sum += X.row(i); ++cnt; }
	  if ( cnt == 0 ) break;
	  Eigen::RowVectorXd m2 = sum / (double)cnt;
	  const double shift = ( m2 - m ).norm();
	  m = m2;
	  if ( shift < 1e-3 * bw ) break;
	}
      if ( cnt == 0 ) continue;
      centres.push_back( m );
      counts.push_back( cnt );
    }

  // most populated first; near-duplicates dropped
  std::vector<int> order( centres.size() );
  for (int i=0; i<order.size(); i++) order[i] = i;
  std::stable_sort( order.begin() , order.end() ,
		    [&counts]( int a , int b ) { return counts[a] > counts[b]; } );

  std::vector<Eigen::RowVectorXd> kept;
  for (int i=0; i<order.size(); i++)
    {
      const Eigen::RowVectorXd & c = centres[ order[i] ];
      bool dup = false;
      for (int j=0; j<kept.size(); j++)
	if ( ( kept[j] - c ).squaredNorm() < bw2 ) { dup = true; break; }
      if ( ! dup ) kept.push_back( c );
    }

  if ( kept.size() == 0 ) kept.push_back( X.colwise().mean() );

  std::vector<int> lab( n );
  for (int i=0; i<n; i++)
    {
      double best = ( X.row(i) - kept[0] ).squaredNorm();
      lab[i] = 0;
      for (int j=1; j<kept.size(); j++)
	{
	  const double d = ( X.row(i) - kept[j] ).squaredNorm();
	  if ( d < best ) { best = d; lab[i] = j; }
	}
    }

  res.set( lab );
  return res;
}


//
// k-means
//

cluster_result_t kmeans_t::fit( const Eigen::MatrixXd & X )
{
  kmeans_result_t km = kmeans( X , n_clusters , n_init , 300 , 1e-4 , seed );

  std::vector<int> lab( X.rows() );
  for (int i=0; i<lab.size(); i++) lab[i] = km.labels[i];

  cluster_result_t res;
  res.set( lab );
  return res;
}


//
// DBSCAN
//

cluster_result_t dbscan_t::run( const Eigen::MatrixXd & D2 , double e ) const
{

  const int n = D2.rows();
  const double e2 = e * e;

  std::vector<std::vector<int> > nbr( n );
  std::vector<bool> core( n , false );

  for (int i=0; i<n; i++)
    {
      for (int j=0; j<n; j++)
	if ( D2(i,j) <= e2 ) nbr[i].push_back( j );
      core[i] = nbr[i].size() >= min_samples;
    }

  std::vector<int> lab( n , -1 );
  int c = 0;

  for (int i=0; i<n; i++)
    {
      if ( ! core[i] || lab[i] != -1 ) continue;

      std::vector<int> stack( 1 , i );
      lab[i] = c;

      while ( stack.size() )
	{
	  const int p = stack.back();
	  stack.pop_back();
	  if ( ! core[p] ) continue;
	  for (int j=0; j<nbr[p].size(); j++)
	    {
	      const int q = nbr[p][j];
	      if ( lab[q] != -1 ) continue;
	      lab[q] = c;
	      stack.push_back( q );
	    }
	}

      ++c;
    }

  cluster_result_t res;
  res.set( lab );
  res.core = core;
  return res;
}


cluster_result_t dbscan_t::fit( const Eigen::MatrixXd & X )
{

  if ( X.rows() == 0 ) throw data_shape_error_t( "no data to cluster" );

  Eigen::MatrixXd D2 = eigen_ops::sq_distances( X );

  if ( n_clusters <= 0 )
    {
      if ( ! ( eps > 0 ) ) Helper::halt( "eps must be positive" );
      eps_used = eps;
      return run( D2 , eps );
    }

  // shrink eps until n_clusters are found
  double e = 1.0 / 0.95;
  int niter = 0;
  cluster_result_t res;
  int clusters = 0;

  while ( clusters < n_clusters )
    {
      const int clusters_last = clusters;
      e *= 0.95;
      res = run( D2 , e );
      clusters = res.k;

      if ( clusters < clusters_last )
	{
	  e /= 0.95;
	  res = run( D2 , e );
	  clusters = res.k;
	  res.note = "unable to find " + Helper::int2str( n_clusters ) + " clusters; found "
	    + Helper::int2str( clusters ) + " with eps " + Helper::dbl2str( e );
	  break;
	}

      ++niter;
      if ( niter == maxiter && clusters < n_clusters )
	{
	  res.note = "maximum iterations (" + Helper::int2str( maxiter ) + ") reached; "
	    + Helper::int2str( n_clusters ) + " clusters not found";
	  break;
	}
    }

  eps_used = e;
  return res;
}
