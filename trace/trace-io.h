
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

#ifndef __LATRACE_TRACE_IO_H__
#define __LATRACE_TRACE_IO_H__

#include <string>
#include <iostream>

#include "trace/trace.h"

namespace trace_io
{

  // comma-delimited text: '#' comment lines, then a header line whose
  // first column is Time, then one row per sample; missing values as
  // nan or NA. The sample ID defaults to the file name without folder
  // and extension
  trace_t load_csv( const std::string & filename , const std::string & id = "" );

  trace_t read_csv( std::istream & in , const std::string & id );

  // focus stage as comma-delimited text, in the same layout
  void write_csv( const trace_t & trace , std::ostream & out );

}

#endif
