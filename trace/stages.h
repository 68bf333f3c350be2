
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

#ifndef __LATRACE_STAGES_H__
#define __LATRACE_STAGES_H__

#include "trace/trace.h"

#include <string>
#include <vector>

//
// stage-to-stage processing: separating signal from background,
// background correction and ratios
//

namespace Stages
{

  // values where mask is True, NaN elsewhere
  analyte_map_t select( const analyte_map_t & in , const std::vector<bool> & mask );

  // signal minus the NaN-mean of the background (degree < 0), or minus a
  // polynomial of the given degree fitted to the background against time
  analyte_map_t bkg_subtract( const analyte_map_t & signal ,
			      const analyte_map_t & background ,
			      const std::vector<double> & time ,
			      const int degree = -1 );

  analyte_map_t ratio( const analyte_map_t & in , const std::string & denominator );

  //
  // trace-level wrappers: read the input stage, store the output stage and move the focus
  //

  // SIGNAL and BACKGROUND from the focus stage
  void separate( trace_t & trace , const std::vector<std::string> & analytes = std::vector<std::string>() );

  // BKGSUB; mode=constant (default) or an integer polynomial degree
  void bkg_correct( trace_t & trace , const param_t & param );

  // RATIOS from BKGSUB (or the given stage)
  void ratio( trace_t & trace , const param_t & param );

}

#endif
