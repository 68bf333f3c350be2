
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

#ifndef __LATRACE_DEFS_H__
#define __LATRACE_DEFS_H__

#include <string>
#include <vector>
#include <map>
#include <set>
#include <limits>


//
// processing stages of a trace; every stage holds one value vector per analyte
//

enum stage_t
  {
    RAWDATA = 0 ,   // as loaded
    DESPIKED ,      // after spike/decay filters
    SIGNAL ,        // focus values, NaN outside signal regions
    BACKGROUND ,    // focus values, NaN outside background regions
    BKGSUB ,        // background-subtracted signal
    RATIOS          // bkgsub divided by an internal standard
  };

// region classes produced by autorange
enum region_t
  {
    REGION_BKG = 0 ,
    REGION_SIG ,
    REGION_TRN
  };

// threshold rule used by the signal optimiser
enum threshold_mode_t
  {
    THRESH_KDE_FIRST_MAX = 0 ,
    THRESH_KDE_MAX ,
    THRESH_MEDIAN ,
    THRESH_MEAN ,
    THRESH_EXPLICIT
  };

// KDE bandwidth rules
enum bandwidth_t
  {
    BW_SCOTT = 0 ,
    BW_SILVERMAN ,
    BW_FIXED
  };

struct globals
{

  static std::string version;
  static std::string date;

  // function to bail to if needed (before halt() throws)
  static void (*bail_function) ( const std::string & msg );

  // in API mode, set this to T
  static bool silent;

  // library (non-CLI) use; no banner or close-out
  static bool api_mode;

  // token used for missing values in text output
  static std::string missing_value_symbol;

  // NaN
  static double nan;

  // default despiker / autorange / optimiser settings
  static int    despike_win;
  static double despike_nlim;
  static int    autorange_gwin;
  static int    autorange_win;
  static int    autorange_smwin;
  static double autorange_conf;
  static double autorange_safety;
  static int    optimise_min_points;
  static int    kde_grid_autorange;
  static int    kde_grid_optimise;

  // helper functions to pull out global values
  static std::string stage( stage_t );
  static stage_t stage( const std::string & );
  static bool is_stage( const std::string & );

  static std::string threshold_mode( threshold_mode_t );
  static threshold_mode_t threshold_mode( const std::string & );

  // global functions: primary initiation of all globals
  static void init_defs();

  // modes
  static void api();

};

#endif
