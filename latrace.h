
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

#ifndef __LATRACE_H__
#define __LATRACE_H__

#include <cstddef>

#include "eval.h"

#include "defs/defs.h"
#include "param.h"
#include "helper/helper.h"
#include "helper/exception.h"
#include "helper/logger.h"

#include "miscmath/miscmath.h"

#include "stats/statistics.h"
#include "stats/eigen_ops.h"
#include "stats/kde.h"
#include "stats/fit.h"
#include "stats/kmeans.h"
#include "stats/cluster.h"
#include "stats/sample-stats.h"

#include "dsp/rolling.h"
#include "dsp/despike.h"

#include "trace/ranges.h"
#include "trace/trace.h"
#include "trace/stages.h"
#include "trace/trace-io.h"

#include "filters/filt.h"
#include "filters/filt-expr.h"
#include "filters/generators.h"

#include "regions/autorange.h"

#include "optim/optimiser.h"

#include "db/sqlwrap.h"
#include "sstore/rstore.h"

#endif
