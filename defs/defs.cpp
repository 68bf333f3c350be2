
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

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/exception.h"

std::string globals::version;
std::string globals::date;

void (*globals::bail_function) ( const std::string & );

bool globals::silent;
bool globals::api_mode;

std::string globals::missing_value_symbol;

double globals::nan;

int    globals::despike_win;
double globals::despike_nlim;
int    globals::autorange_gwin;
int    globals::autorange_win;
int    globals::autorange_smwin;
double globals::autorange_conf;
double globals::autorange_safety;
int    globals::optimise_min_points;
int    globals::kde_grid_autorange;
int    globals::kde_grid_optimise;


void globals::api()
{
  silent = true;
  api_mode = true;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.9.2";

  date    = "12-Oct-2026";

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  //
  // Output
  //

  silent = false;
  api_mode = false;

  missing_value_symbol = "NA";

  nan = std::numeric_limits<double>::quiet_NaN();

  //
  // Processing defaults
  //

  despike_win = 3;
  despike_nlim = 12.0;

  autorange_gwin = 11;
  autorange_win = 40;
  autorange_smwin = 5;
  autorange_conf = 0.01;
  autorange_safety = 0.3;

  optimise_min_points = 5;

  kde_grid_autorange = 50;
  kde_grid_optimise = 100;

}


std::string globals::stage( stage_t s )
{
  switch ( s )
    {
    case RAWDATA : return "rawdata";
    case DESPIKED : return "despiked";
    case SIGNAL : return "signal";
    case BACKGROUND : return "background";
    case BKGSUB : return "bkgsub";
    case RATIOS : return "ratios";
    }
  return "?";
}

bool globals::is_stage( const std::string & s )
{
  const std::string t = Helper::toupper( s );
  return t == "RAWDATA" || t == "DESPIKED" || t == "SIGNAL"
    || t == "BACKGROUND" || t == "BKGSUB" || t == "RATIOS" ;
}

stage_t globals::stage( const std::string & s )
{
  const std::string t = Helper::toupper( s );
  if ( t == "RAWDATA" ) return RAWDATA;
  if ( t == "DESPIKED" ) return DESPIKED;
  if ( t == "SIGNAL" ) return SIGNAL;
  if ( t == "BACKGROUND" ) return BACKGROUND;
  if ( t == "BKGSUB" ) return BKGSUB;
  if ( t == "RATIOS" ) return RATIOS;
  throw data_shape_error_t( "unknown stage: " + s );
}

std::string globals::threshold_mode( threshold_mode_t m )
{
  switch ( m )
    {
    case THRESH_KDE_FIRST_MAX : return "kde_first_max";
    case THRESH_KDE_MAX : return "kde_max";
    case THRESH_MEDIAN : return "median";
    case THRESH_MEAN : return "mean";
    case THRESH_EXPLICIT : return "explicit";
    }
  return "?";
}

threshold_mode_t globals::threshold_mode( const std::string & s )
{
  const std::string t = Helper::toupper( s );
  if ( t == "KDE_FIRST_MAX" ) return THRESH_KDE_FIRST_MAX;
  if ( t == "KDE_MAX" ) return THRESH_KDE_MAX;
  if ( t == "MEDIAN" ) return THRESH_MEDIAN;
  if ( t == "MEAN" ) return THRESH_MEAN;
  Helper::halt( "unknown threshold mode: " + s + " (expecting kde_first_max, kde_max, median or mean)" );
  return THRESH_KDE_FIRST_MAX;
}
