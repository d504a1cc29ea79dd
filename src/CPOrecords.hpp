// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef CPOANALYZER_RECORDS_HPP
#define CPOANALYZER_RECORDS_HPP

#include "CPOtypes.hpp"

#include <string>
#include <vector>

// Column names of a space-delimited shard file, taken from its first line
struct ShardHeader {

    std::vector<std::string> columns;
    std::string filename;

    ShardHeader(const std::string header_line, const std::string filename_input);

    // Index of the named column, or -1 if the file does not contain it
    int column(const std::string name) const;
    // Index of the named column, throwing an error if the file does not contain it
    int requireColumn(const std::string name) const;
    int numColumns() const { return columns.size(); }
};

// One grain belonging to a particle: Euler angles (phi, theta, z) in degrees for each mineral phase
struct GrainRecord {
    long id = 0;
    bool has_mineral[num_minerals] = {false, false};
    double euler_angles_deg[num_minerals][3] = {{0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
};

// Particle metadata record. All optional values are absent in the default record, except for z which defaults to 0
struct ParticleRecord {
    long id = 0;
    double x = 0.0, y = 0.0;
    bool has_z = true;
    double z = 0.0;
    bool has_deformation_type = false;
    double olivine_deformation_type = 0.0;
    bool has_full_norm_square = false;
    double full_norm_square = 0.0;
    // Partial norms for each symmetry class, split into three principal components p1..p3
    bool has_norm_square[num_symmetry_classes] = {false, false, false, false, false};
    double norm_square[num_symmetry_classes][3] = {};
    bool has_isotropic_norm_square = false;
    double isotropic_norm_square = 0.0;

    bool hasElasticity() const;
};

// Percentages of the elastic tensor norm carried by each symmetry class, shown in the header of a pole figure
struct ElasticAnisotropy {
    double total_anisotropy = 0.0;
    double anisotropic_percent = 0.0;
    double percent_of_full[num_symmetry_classes][3];
    double percent_of_anisotropic[num_symmetry_classes][3];

    ElasticAnisotropy(const ParticleRecord &particle);
};

// Parse the grain rows of a shard file, returning those belonging to "particle_id" in file order
std::vector<GrainRecord> readGrainRecords(const std::string &contents, const std::string filename,
                                          const long particle_id);
// Parse a particle metadata shard, returning the last row belonging to "particle_id" (default record if none)
ParticleRecord readParticleRecord(const std::string &contents, const std::string filename, const long particle_id);

#endif
