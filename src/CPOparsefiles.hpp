// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_PARSE_HPP
#define CPOANALYZER_PARSE_HPP

#include <cstddef>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

std::string trimWhitespace(const std::string line);
std::string collapseSpaces(std::string line);
std::vector<std::string> splitWhitespace(const std::string line);
double getInputDouble(const std::string val_input, const std::string context);
long getInputLong(const std::string val_input, const std::string context);
bool checkFileExists(const std::string path, const int id, const bool error = true);
bool checkFileEmpty(const std::string path);
std::string inflateData(const std::string &compressed_data, const std::string filename);
std::string readFileContents(const std::string path, const bool compressed);

#endif
