// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_TYPES_HPP
#define CPOANALYZER_TYPES_HPP

#include <stdexcept>
#include <string>

// Mineral phases stored in the grain orientation files, in column order (mineral_0_*, mineral_1_*)
enum Mineral { Olivine = 0, Enstatite = 1 };
constexpr int num_minerals = 2;

// Crystal axes, in the order of the rows of a grain rotation matrix
enum CrystalAxis { AAxis = 0, BAxis = 1, CAxis = 2 };
constexpr int num_crystal_axes = 3;

enum Hemisphere { Upper = 0, Lower = 1 };

// Symmetry classes of the elastic tensor decomposition written to the particle files
enum SymmetryClass { Triclinic = 0, Monoclinic = 1, Orthorhombic = 2, Tetragonal = 3, Hexagonal = 4 };
constexpr int num_symmetry_classes = 5;

inline Mineral getMineral(const std::string mineral_name) {
    if (mineral_name == "Olivine")
        return Olivine;
    else if (mineral_name == "Enstatite")
        return Enstatite;
    else
        throw std::runtime_error("Error: unknown mineral \"" + mineral_name +
                                 "\", available options are Olivine and Enstatite");
}

inline std::string mineralName(const Mineral mineral) {
    if (mineral == Olivine)
        return "Olivine";
    else
        return "Enstatite";
}

// Short tag used in output file names
inline std::string mineralTag(const Mineral mineral) {
    if (mineral == Olivine)
        return "oli_";
    else
        return "ens_";
}

inline CrystalAxis getCrystalAxis(const std::string axis_name) {
    if (axis_name == "AAxis")
        return AAxis;
    else if (axis_name == "BAxis")
        return BAxis;
    else if (axis_name == "CAxis")
        return CAxis;
    else
        throw std::runtime_error("Error: unknown crystal axis \"" + axis_name +
                                 "\", available options are AAxis, BAxis and CAxis");
}

inline std::string crystalAxisName(const CrystalAxis axis) {
    if (axis == AAxis)
        return "AAxis";
    else if (axis == BAxis)
        return "BAxis";
    else
        return "CAxis";
}

inline std::string crystalAxisTag(const CrystalAxis axis) {
    if (axis == AAxis)
        return "A-";
    else if (axis == BAxis)
        return "B-";
    else
        return "C-";
}

inline Hemisphere getHemisphere(const std::string hemisphere_name) {
    if (hemisphere_name == "upper")
        return Upper;
    else if (hemisphere_name == "lower")
        return Lower;
    else
        throw std::runtime_error("Error: hemisphere must be \"upper\" or \"lower\", not \"" + hemisphere_name + "\"");
}

inline std::string hemisphereName(const Hemisphere hemisphere) {
    if (hemisphere == Upper)
        return "upper";
    else
        return "lower";
}

// Column name prefix for each symmetry class. The orthorhombic columns are written as "orthohombic" by ASPECT
inline std::string symmetryClassColumnPrefix(const int symmetry_class) {
    switch (symmetry_class) {
    case Triclinic:
        return "triclinic";
    case Monoclinic:
        return "monoclinic";
    case Orthorhombic:
        return "orthohombic";
    case Tetragonal:
        return "tetragonal";
    default:
        return "hexagonal";
    }
}

// Abbreviation used when the anisotropy summary is printed
inline std::string symmetryClassTag(const int symmetry_class) {
    switch (symmetry_class) {
    case Triclinic:
        return "tri";
    case Monoclinic:
        return "mon";
    case Orthorhombic:
        return "ort";
    case Tetragonal:
        return "tet";
    default:
        return "hex";
    }
}

#endif
