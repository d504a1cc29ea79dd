// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_HPP
#define CPOANALYZER_HPP

#include "CPOdensity.hpp"
#include "CPOinfo.hpp"
#include "CPOinputs.hpp"
#include "CPOlambert.hpp"
#include "CPOlog.hpp"
#include "CPOorientation.hpp"
#include "CPOparsefiles.hpp"
#include "CPOpolefigure.hpp"
#include "CPOprint.hpp"
#include "CPOrecords.hpp"
#include "CPOrotation.hpp"
#include "CPOshards.hpp"
#include "CPOtimeresolver.hpp"
#include "CPOtimers.hpp"
#include "CPOtypes.hpp"

#include <string>

int runCPOAnalyzer(int id, int np, std::string input_file);

#endif
