// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOrecords.hpp"
#include "CPOparsefiles.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

//*****************************************************************************/
ShardHeader::ShardHeader(const std::string header_line, const std::string filename_input)
    : columns(splitWhitespace(header_line))
    , filename(filename_input) {}

int ShardHeader::column(const std::string name) const {
    int num_columns = columns.size();
    for (int n = 0; n < num_columns; n++) {
        if (columns[n] == name)
            return n;
    }
    return -1;
}

int ShardHeader::requireColumn(const std::string name) const {
    int n = column(name);
    if (n == -1)
        throw std::runtime_error("Error: Required column \"" + name + "\" not found in the header of \"" + filename +
                                 "\"");
    return n;
}

//*****************************************************************************/
bool ParticleRecord::hasElasticity() const {
    if ((!has_full_norm_square) || (!has_isotropic_norm_square))
        return false;
    for (int n = 0; n < num_symmetry_classes; n++) {
        if (!has_norm_square[n])
            return false;
    }
    return true;
}

ElasticAnisotropy::ElasticAnisotropy(const ParticleRecord &particle) {
    if (!particle.hasElasticity())
        throw std::runtime_error("Error: Particle " + std::to_string(particle.id) +
                                 " does not have the elastic tensor decomposition values needed for the elasticity "
                                 "header");
    // The first principal component of each symmetry class sums to the anisotropic part of the norm
    for (int n = 0; n < num_symmetry_classes; n++)
        total_anisotropy += particle.norm_square[n][0];
    anisotropic_percent = total_anisotropy / particle.full_norm_square * 100.0;
    for (int n = 0; n < num_symmetry_classes; n++) {
        for (int comp = 0; comp < 3; comp++) {
            percent_of_full[n][comp] = particle.norm_square[n][comp] / particle.full_norm_square * 100.0;
            percent_of_anisotropic[n][comp] = particle.norm_square[n][comp] / total_anisotropy * 100.0;
        }
    }
}

//*****************************************************************************/
namespace {

// Split a data row into fields, checking that the number of fields matches the header
std::vector<std::string> splitRow(const std::string &line, const ShardHeader &header, const int row) {
    std::vector<std::string> fields = splitWhitespace(line);
    if (static_cast<int>(fields.size()) != header.numColumns())
        throw std::runtime_error("Error: Row " + std::to_string(row) + " of \"" + header.filename + "\" has " +
                                 std::to_string(fields.size()) + " fields, but the header has " +
                                 std::to_string(header.numColumns()) + " columns");
    return fields;
}

std::string fieldContext(const ShardHeader &header, const int row, const int column) {
    return "file \"" + header.filename + "\", row " + std::to_string(row) + ", column " + header.columns[column];
}

double getField(const std::vector<std::string> &fields, const ShardHeader &header, const int row,
                const int column) {
    return getInputDouble(fields[column], fieldContext(header, row, column));
}

// Particle ids are written as integers, but some writers store them in floating point notation
long getIdField(const std::vector<std::string> &fields, const ShardHeader &header, const int row, const int column) {
    const std::string context = fieldContext(header, row, column);
    const double id = getInputDouble(fields[column], context);
    // Representable range of long is [-2^63, 2^63), both bounds exact as doubles
    const double id_min = static_cast<double>(std::numeric_limits<long>::min());
    if ((!std::isfinite(id)) || (id < id_min) || (id >= -id_min))
        throw std::runtime_error("Error: Particle id \"" + fields[column] + "\" is not a valid integer (" + context +
                                 ")");
    const long id_long = static_cast<long>(id);
    if (static_cast<double>(id_long) != id)
        throw std::runtime_error("Error: Could not parse \"" + fields[column] + "\" as an integer (" + context + ")");
    return id_long;
}

// Read the header line of a shard, returning false if the shard holds no data at all
bool readHeader(std::istringstream &stream, std::string &header_line) {
    while (std::getline(stream, header_line)) {
        if (!trimWhitespace(header_line).empty())
            return true;
    }
    return false;
}

} // namespace

std::vector<GrainRecord> readGrainRecords(const std::string &contents, const std::string filename,
                                          const long particle_id) {

    std::vector<GrainRecord> grains;
    std::istringstream stream(contents);
    std::string header_line;
    if (!readHeader(stream, header_line))
        return grains;
    ShardHeader header(header_line, filename);

    // Required columns: id, and all three Euler angles of any mineral that appears in the file
    const int id_column = header.requireColumn("id");
    int angle_columns[num_minerals][3];
    bool mineral_present[num_minerals];
    const std::string angle_names[3] = {"phi", "theta", "z"};
    for (int m = 0; m < num_minerals; m++) {
        const std::string mineral_prefix = "mineral_" + std::to_string(m) + "_EA_";
        mineral_present[m] = false;
        for (int a = 0; a < 3; a++) {
            if (header.column(mineral_prefix + angle_names[a]) != -1)
                mineral_present[m] = true;
        }
        for (int a = 0; a < 3; a++) {
            if (mineral_present[m])
                angle_columns[m][a] = header.requireColumn(mineral_prefix + angle_names[a]);
            else
                angle_columns[m][a] = -1;
        }
    }

    std::string line;
    int row = 0;
    while (std::getline(stream, line)) {
        if (trimWhitespace(line).empty())
            continue;
        row++;
        std::vector<std::string> fields = splitRow(line, header, row);
        GrainRecord grain;
        grain.id = getIdField(fields, header, row, id_column);
        // Angles of every row are checked, not only those of the requested particle
        for (int m = 0; m < num_minerals; m++) {
            grain.has_mineral[m] = mineral_present[m];
            if (mineral_present[m]) {
                for (int a = 0; a < 3; a++)
                    grain.euler_angles_deg[m][a] = getField(fields, header, row, angle_columns[m][a]);
            }
        }
        if (grain.id == particle_id)
            grains.push_back(grain);
    }
    return grains;
}

ParticleRecord readParticleRecord(const std::string &contents, const std::string filename, const long particle_id) {

    ParticleRecord particle;
    std::istringstream stream(contents);
    std::string header_line;
    if (!readHeader(stream, header_line))
        return particle;
    ShardHeader header(header_line, filename);

    const int id_column = header.requireColumn("id");
    const int x_column = header.requireColumn("x");
    const int y_column = header.requireColumn("y");
    const int z_column = header.column("z");
    const int deformation_type_column = header.column("olivine_deformation_type");
    const int full_norm_square_column = header.column("full_norm_square");
    const int isotropic_column = header.column("isotropic_norm_square");
    int norm_square_columns[num_symmetry_classes][3];
    for (int n = 0; n < num_symmetry_classes; n++) {
        for (int comp = 0; comp < 3; comp++)
            norm_square_columns[n][comp] =
                header.column(symmetryClassColumnPrefix(n) + "_norm_square_p" + std::to_string(comp + 1));
    }

    std::string line;
    int row = 0;
    while (std::getline(stream, line)) {
        if (trimWhitespace(line).empty())
            continue;
        row++;
        std::vector<std::string> fields = splitRow(line, header, row);
        const long id = getIdField(fields, header, row, id_column);
        if (id != particle_id)
            continue;

        // Last matching row wins
        ParticleRecord match;
        match.id = id;
        match.x = getField(fields, header, row, x_column);
        match.y = getField(fields, header, row, y_column);
        match.has_z = (z_column != -1);
        if (match.has_z)
            match.z = getField(fields, header, row, z_column);
        match.has_deformation_type = (deformation_type_column != -1);
        if (match.has_deformation_type)
            match.olivine_deformation_type = getField(fields, header, row, deformation_type_column);
        match.has_full_norm_square = (full_norm_square_column != -1);
        if (match.has_full_norm_square)
            match.full_norm_square = getField(fields, header, row, full_norm_square_column);
        for (int n = 0; n < num_symmetry_classes; n++) {
            match.has_norm_square[n] = true;
            for (int comp = 0; comp < 3; comp++) {
                if (norm_square_columns[n][comp] == -1)
                    match.has_norm_square[n] = false;
                else
                    match.norm_square[n][comp] = getField(fields, header, row, norm_square_columns[n][comp]);
            }
        }
        match.has_isotropic_norm_square = (isotropic_column != -1);
        if (match.has_isotropic_norm_square)
            match.isotropic_norm_square = getField(fields, header, row, isotropic_column);
        particle = match;
    }
    return particle;
}
