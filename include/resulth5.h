/*
/   HDF5 archive of one mobility run:
/
/     /system/positions        N x 3 fractional site positions
/     /system/interactions     N x N interaction type codes
/     /samples/lx2, /samples/ly2   per realization
/     /result/...              averaged lengths, mobilities, run parameters
*/

#pragma once

#include <string>
#include <hdf5.h>

#include <lattice.h>
#include <interaction.h>
#include <measurement.h>
#include <mobility.h>

class ResultWriter {
private:
    std::string filename_;
    hid_t file_id_;

public:
    // creates (truncates) results_dir/name.h5
    ResultWriter(const std::string& results_dir, const std::string& name);
    ~ResultWriter();

    ResultWriter(const ResultWriter&) = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;

    const std::string& filename() const { return filename_; }

    void write_system(const Lattice& lat, const InteractionMap& interactions);
    void write_samples(const LocalizationAccumulator& acc);
    void write_result(const MobilityResult& result, const LocalizationAccumulator& acc,
                      const ThermalParameters& thermal, unsigned int seed);
};
